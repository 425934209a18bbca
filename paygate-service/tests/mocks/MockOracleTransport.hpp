#pragma once

#include "application/PaymentCodec.hpp"
#include "ports/output/IOracleTransport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace paygate::tests {

/**
 * @brief Сценарный транспорт к оракулу
 *
 * Ответ задаётся функцией handler; запросы записываются.
 * Отдельно считаются отправки с заголовком X-PAYMENT.
 */
class MockOracleTransport : public ports::output::IOracleTransport {
public:
    using Handler = std::function<domain::OracleResponse(const domain::OracleRequest&)>;

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // Задержка каждой отправки (для проверки single-flight)
    void setLatency(std::chrono::milliseconds latency) { latency_ = latency; }

    domain::OracleResponse send(const domain::OracleRequest& request,
                                const domain::Deadline& deadline) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
        }
        if (request.headers.count(application::PaymentCodec::HEADER_NAME)) {
            ++paidSends_;
        } else {
            ++unpaidSends_;
        }

        if (latency_.count() > 0) {
            std::this_thread::sleep_for(latency_);
        }
        if (deadline.expired()) {
            throw domain::TransientNetworkException("mock transport: deadline expired");
        }
        if (!handler) {
            return domain::OracleResponse{200, "{}"};
        }
        return handler(request);
    }

    int paidSends() const { return paidSends_.load(); }
    int unpaidSends() const { return unpaidSends_.load(); }
    int totalSends() const { return paidSends_.load() + unpaidSends_.load(); }

    std::vector<domain::OracleRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<domain::OracleRequest> requests_;
    std::atomic<int> paidSends_{0};
    std::atomic<int> unpaidSends_{0};
    std::chrono::milliseconds latency_{0};
};

} // namespace paygate::tests
