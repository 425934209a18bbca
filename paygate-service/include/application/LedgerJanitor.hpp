#pragma once

#include "ports/input/ISettlementService.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace paygate::application {

/**
 * @brief Фоновый поток обслуживания леджера
 *
 * Каждый тик: вытеснение просроченных терминальных записей и сверка
 * pending-записей с сетью.
 *
 * @example
 * ```cpp
 * LedgerJanitor janitor(settlementService);
 * janitor.start(std::chrono::seconds(60));
 * // ...
 * janitor.stop();
 * ```
 */
class LedgerJanitor {
public:
    explicit LedgerJanitor(std::shared_ptr<ports::input::ISettlementService> service)
        : service_(std::move(service))
        , running_(false)
        , tickCount_(0)
    {}

    ~LedgerJanitor() {
        stop();
    }

    LedgerJanitor(const LedgerJanitor&) = delete;
    LedgerJanitor& operator=(const LedgerJanitor&) = delete;

    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) {
            return;
        }
        interval_ = interval;
        workerThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[LedgerJanitor] Started, interval=" << interval.count() << "ms" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wakeup_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[LedgerJanitor] Stopped after " << tickCount_.load() << " ticks" << std::endl;
    }

    bool isRunning() const { return running_.load(); }

    uint64_t tickCount() const { return tickCount_.load(); }

    /**
     * @brief Выполнить один тик вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    void runLoop() {
        while (running_.load()) {
            doTick();

            std::unique_lock<std::mutex> lock(mutex_);
            wakeup_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        }
    }

    void doTick() {
        try {
            auto evicted = service_->evictExpired();
            auto resolved = service_->reconcilePending();
            if (evicted > 0 || resolved > 0) {
                std::cout << "[LedgerJanitor] evicted=" << evicted << " resolved=" << resolved << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[LedgerJanitor] Tick failed: " << e.what() << std::endl;
        }
        ++tickCount_;
    }

    std::shared_ptr<ports::input::ISettlementService> service_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::chrono::milliseconds interval_{60000};

    std::mutex mutex_;
    std::condition_variable wakeup_;
    std::thread workerThread_;
};

} // namespace paygate::application
