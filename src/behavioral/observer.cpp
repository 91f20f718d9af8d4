// File: src/behavioral/observer.cpp
#include "behavioral/observer.hpp"
#include <algorithm>

namespace patcat {

void UserSubscriber::Notify(const std::string& message) {
    out_.WriteLine(name_ + " received message: " + message);
}

bool Publisher::Subscribe(std::shared_ptr<Subscriber> subscriber) {
    if (!subscriber) {
        return false;
    }
    auto it = std::find(subscribers_.begin(), subscribers_.end(), subscriber);
    if (it != subscribers_.end()) {
        return false;
    }
    subscribers_.push_back(std::move(subscriber));
    return true;
}

bool Publisher::Unsubscribe(const std::string& name) {
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
        [&name](const std::shared_ptr<Subscriber>& s) { return s->GetName() == name; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

void Publisher::Publish(const std::string& message) const {
    for (const auto& subscriber : subscribers_) {
        subscriber->Notify(message);
    }
}

void RunObserverDemo(const DemoInput& input, OutputSink& out) {
    Publisher publisher;
    publisher.Subscribe(std::make_shared<UserSubscriber>("User1", out));
    publisher.Subscribe(std::make_shared<UserSubscriber>("User2", out));

    for (const auto& message : input.Values()) {
        publisher.Publish(message);
    }
}

} // namespace patcat
