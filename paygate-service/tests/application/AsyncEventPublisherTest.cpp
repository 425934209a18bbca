/**
 * @file AsyncEventPublisherTest.cpp
 * @brief Unit tests for AsyncEventPublisher
 */

#include <gtest/gtest.h>
#include "application/events/AsyncEventPublisher.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include <condition_variable>
#include <mutex>

using namespace paygate;
using namespace paygate::application::events;
using namespace paygate::tests;

namespace {

/**
 * @brief Publisher, который держит рабочий поток до release()
 */
class GatedPublisher : public ports::output::IEventPublisher {
public:
    void publish(const std::string& routingKey, const std::string&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        enteredCv_.notify_all();
        gateCv_.wait(lock, [this]() { return open_; });
        keys_.push_back(routingKey);
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        enteredCv_.wait(lock, [this]() { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        gateCv_.notify_all();
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return keys_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable enteredCv_;
    std::condition_variable gateCv_;
    bool entered_ = false;
    bool open_ = false;
    std::vector<std::string> keys_;
};

} // namespace

TEST(AsyncEventPublisherTest, DeliversInOrder) {
    auto target = std::make_shared<MockEventPublisher>();
    AsyncEventPublisher publisher(target, 16);

    publisher.publish("payment.call.succeeded", "{\"n\":1}");
    publisher.publish("oracle.report", "{\"n\":2}");
    publisher.shutdown();

    auto messages = target->getPublishedMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].routingKey, "payment.call.succeeded");
    EXPECT_EQ(messages[1].routingKey, "oracle.report");
    EXPECT_EQ(messages[1].message, "{\"n\":2}");
    EXPECT_EQ(publisher.deliveredCount(), 2u);
    EXPECT_EQ(publisher.droppedCount(), 0u);
}

TEST(AsyncEventPublisherTest, FullQueue_DropsWithoutBlocking) {
    auto target = std::make_shared<GatedPublisher>();
    AsyncEventPublisher publisher(target, 1);

    publisher.publish("first", "{}");
    target->waitEntered();          // первый уже у рабочего потока
    publisher.publish("second", "{}"); // занимает единственное место
    publisher.publish("third", "{}");  // очередь полна

    EXPECT_EQ(publisher.droppedCount(), 1u);

    target->release();
    publisher.shutdown();

    EXPECT_EQ(target->keys(), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(publisher.deliveredCount(), 2u);
}

TEST(AsyncEventPublisherTest, AfterShutdown_Drops) {
    auto target = std::make_shared<MockEventPublisher>();
    AsyncEventPublisher publisher(target, 16);
    publisher.shutdown();

    publisher.publish("late", "{}");

    EXPECT_EQ(publisher.droppedCount(), 1u);
    EXPECT_EQ(target->publishCallCount(), 0);
}

TEST(AsyncEventPublisherTest, FailingTarget_KeepsWorking) {
    auto target = std::make_shared<MockEventPublisher>();
    target->setShouldFail(true);
    AsyncEventPublisher publisher(target, 16);

    EXPECT_NO_THROW(publisher.publish("payment.call.succeeded", "{}"));
    publisher.shutdown();

    EXPECT_EQ(publisher.deliveredCount(), 0u);
    EXPECT_EQ(publisher.droppedCount(), 0u);
}

TEST(AsyncEventPublisherTest, PublishEventCommand_WrapsFailure) {
    auto target = std::make_shared<MockEventPublisher>();
    target->setShouldFail(true);
    PublishEventCommand command(target, "oracle.report", "{}");

    EXPECT_EQ(command.routingKey(), "oracle.report");
    EXPECT_THROW(command.execute(), CommandException);
}
