// File: src/behavioral/observer.hpp
#pragma once

#include "core/output_sink.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace patcat {

/// Observer interface
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual void Notify(const std::string& message) = 0;
    virtual const std::string& GetName() const = 0;
};

/// Named subscriber that reports each message it receives
class UserSubscriber : public Subscriber {
public:
    UserSubscriber(std::string name, OutputSink& out)
        : name_(std::move(name)), out_(out) {}

    void Notify(const std::string& message) override;
    const std::string& GetName() const override { return name_; }

private:
    std::string name_;
    OutputSink& out_;
};

/// Subject: broadcasts messages to subscribers in registration order
class Publisher {
public:
    /// Register a subscriber
    /// @return false if it is already registered
    bool Subscribe(std::shared_ptr<Subscriber> subscriber);

    /// Remove a subscriber by name
    /// @return true if one was removed
    bool Unsubscribe(const std::string& name);

    /// Deliver message to every subscriber
    void Publish(const std::string& message) const;

    size_t SubscriberCount() const { return subscribers_.size(); }

private:
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
};

/// Publish each of input.Values() to User1 and User2
void RunObserverDemo(const DemoInput& input, OutputSink& out);

} // namespace patcat
