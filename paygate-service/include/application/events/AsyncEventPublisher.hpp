#pragma once

#include "ThreadSafeQueue.hpp"
#include "application/events/PublishEventCommand.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <thread>

namespace paygate::application::events {

/**
 * @brief Асинхронный декоратор IEventPublisher
 *
 * publish() кладёт команду в ограниченную очередь и сразу возвращается;
 * рабочий поток доставляет события во вложенный publisher.
 * Переполнение очереди или сбой доставки только логируются.
 */
class AsyncEventPublisher : public ports::output::IEventPublisher {
public:
    AsyncEventPublisher(std::shared_ptr<ports::output::IEventPublisher> target, size_t capacity)
        : target_(std::move(target))
        , queue_(capacity)
        , delivered_(0)
        , dropped_(0)
    {
        workerThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[AsyncEventPublisher] Started, capacity=" << capacity << std::endl;
    }

    ~AsyncEventPublisher() override {
        shutdown();
    }

    AsyncEventPublisher(const AsyncEventPublisher&) = delete;
    AsyncEventPublisher& operator=(const AsyncEventPublisher&) = delete;

    void publish(const std::string& routingKey, const std::string& message) override {
        auto command = std::make_shared<PublishEventCommand>(target_, routingKey, message);
        if (!queue_.push(command)) {
            ++dropped_;
            std::cerr << "[AsyncEventPublisher] Dropped " << routingKey
                      << " (queue full or closed)" << std::endl;
        }
    }

    /**
     * @brief Закрыть очередь и дождаться доставки уже принятых событий
     */
    void shutdown() {
        queue_.shutdown();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
    }

    uint64_t deliveredCount() const { return delivered_.load(); }
    uint64_t droppedCount() const { return dropped_.load(); }

private:
    void runLoop() {
        // pop() возвращает nullptr только после shutdown() и опустошения очереди
        while (auto command = queue_.pop()) {
            try {
                command->execute();
                ++delivered_;
            } catch (const CommandException& e) {
                std::cerr << "[AsyncEventPublisher] " << e.what() << std::endl;
            }
        }
    }

    std::shared_ptr<ports::output::IEventPublisher> target_;
    ThreadSafeQueue queue_;
    std::atomic<uint64_t> delivered_;
    std::atomic<uint64_t> dropped_;
    std::thread workerThread_;
};

} // namespace paygate::application::events
