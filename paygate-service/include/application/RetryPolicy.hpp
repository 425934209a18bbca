#pragma once

#include "domain/Deadline.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace paygate::application {

/**
 * @brief Ограниченные повторы с экспоненциальной задержкой
 *
 * Задержка перед попыткой n (n >= 2): base * 2^(n-2), не больше MAX_BACKOFF.
 */
class RetryPolicy {
public:
    static constexpr std::chrono::milliseconds MAX_BACKOFF{10000};

    RetryPolicy(int maxAttempts, std::chrono::milliseconds baseBackoff)
        : maxAttempts_(std::max(1, maxAttempts))
        , baseBackoff_(baseBackoff)
    {}

    int maxAttempts() const { return maxAttempts_; }

    std::chrono::milliseconds backoffBefore(int attempt) const {
        if (attempt <= 1 || baseBackoff_.count() <= 0) {
            return std::chrono::milliseconds::zero();
        }
        auto delay = baseBackoff_;
        for (int i = 2; i < attempt && delay < MAX_BACKOFF; ++i) {
            delay *= 2;
        }
        return std::min(delay, MAX_BACKOFF);
    }

    /**
     * @brief Подождать перед попыткой attempt
     * @return false, если ожидание не укладывается в срок
     */
    bool waitBefore(int attempt, const domain::Deadline& deadline) const {
        auto delay = backoffBefore(attempt);
        if (delay >= deadline.remaining()) {
            return false;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return true;
    }

private:
    int maxAttempts_;
    std::chrono::milliseconds baseBackoff_;
};

} // namespace paygate::application
