// File: tests/behavioral/observer_test.cpp
#include "behavioral/observer.hpp"
#include <gtest/gtest.h>

namespace patcat {
namespace {

TEST(PublisherTest, DeliversToSubscribersInRegistrationOrder) {
    TraceSink sink;
    Publisher publisher;
    publisher.Subscribe(std::make_shared<UserSubscriber>("User1", sink));
    publisher.Subscribe(std::make_shared<UserSubscriber>("User2", sink));

    publisher.Publish("New update available!");

    Trace expected = {
        "User1 received message: New update available!",
        "User2 received message: New update available!",
    };
    EXPECT_EQ(expected, sink.GetTrace());
}

TEST(PublisherTest, DuplicateSubscriptionIsRejected) {
    TraceSink sink;
    Publisher publisher;
    auto user = std::make_shared<UserSubscriber>("User1", sink);

    EXPECT_TRUE(publisher.Subscribe(user));
    EXPECT_FALSE(publisher.Subscribe(user));
    EXPECT_FALSE(publisher.Subscribe(nullptr));
    EXPECT_EQ(1u, publisher.SubscriberCount());
}

TEST(PublisherTest, UnsubscribedUserStopsReceiving) {
    TraceSink sink;
    Publisher publisher;
    publisher.Subscribe(std::make_shared<UserSubscriber>("User1", sink));
    publisher.Subscribe(std::make_shared<UserSubscriber>("User2", sink));

    EXPECT_TRUE(publisher.Unsubscribe("User1"));
    EXPECT_FALSE(publisher.Unsubscribe("User1"));

    publisher.Publish("hi");
    EXPECT_EQ(Trace{"User2 received message: hi"}, sink.GetTrace());
}

TEST(PublisherTest, PublishWithoutSubscribersPrintsNothing) {
    Publisher publisher;
    EXPECT_NO_THROW(publisher.Publish("ignored"));
}

TEST(ObserverDemoTest, EachMessageReachesBothUsers) {
    TraceSink sink;
    RunObserverDemo(DemoInput{"first", "second"}, sink);

    Trace expected = {
        "User1 received message: first",
        "User2 received message: first",
        "User1 received message: second",
        "User2 received message: second",
    };
    EXPECT_EQ(expected, sink.GetTrace());
}

} // namespace
} // namespace patcat
