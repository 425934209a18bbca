#pragma once

#include <chrono>

namespace paygate::domain {

/**
 * @brief Крайний срок логического вызова
 *
 * Передаётся вызывающей стороной и проходит через все сетевые шаги.
 * Монотонные часы: перевод системного времени не влияет на таймауты.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(Clock::time_point at) : at_(at) {}

    static Deadline after(std::chrono::milliseconds timeout) {
        return Deadline(Clock::now() + timeout);
    }

    static Deadline never() {
        return Deadline(Clock::time_point::max());
    }

    bool expired() const { return Clock::now() >= at_; }

    /**
     * @brief Сколько осталось до срока (ноль, если срок прошёл)
     */
    std::chrono::milliseconds remaining() const {
        auto now = Clock::now();
        if (now >= at_) {
            return std::chrono::milliseconds::zero();
        }
        if (at_ == Clock::time_point::max()) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(at_ - now);
    }

    Clock::time_point at() const { return at_; }

private:
    Clock::time_point at_;
};

} // namespace paygate::domain
