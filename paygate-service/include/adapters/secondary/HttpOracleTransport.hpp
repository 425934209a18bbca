#pragma once

#include "domain/PaymentException.hpp"
#include "ports/output/IOracleTransport.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <chrono>
#include <iostream>
#include <memory>

namespace paygate::adapters::secondary {

/**
 * @brief HTTP-транспорт к оракулам через IHttpClient
 *
 * Возвращает ответ с любым статусом (402 и 5xx тоже): решает оркестратор.
 * Обрыв соединения и истёкший срок: TransientNetworkException.
 */
class HttpOracleTransport : public ports::output::IOracleTransport {
public:
    explicit HttpOracleTransport(std::shared_ptr<IHttpClient> httpClient)
        : httpClient_(std::move(httpClient))
    {
        std::cout << "[HttpOracleTransport] Created" << std::endl;
    }

    domain::OracleResponse send(const domain::OracleRequest& request,
                                const domain::Deadline& deadline) override {
        const auto target = request.host + ":" + std::to_string(request.port);
        if (deadline.expired()) {
            throw domain::TransientNetworkException("deadline expired before sending to " + target);
        }

        SimpleRequest httpRequest(
            request.method,
            request.path,
            request.body,
            request.host,
            request.port,
            request.headers
        );

        SimpleResponse httpResponse;
        auto started = std::chrono::steady_clock::now();
        bool sent = false;
        try {
            sent = httpClient_->send(httpRequest, httpResponse);
        } catch (const std::exception& e) {
            throw domain::TransientNetworkException(
                request.method + " " + target + request.path + " failed: " + e.what());
        }

        if (!sent) {
            throw domain::TransientNetworkException(
                request.method + " " + target + request.path + " failed: no response");
        }

        if (deadline.expired()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            throw domain::TransientNetworkException(
                request.method + " " + target + request.path + " timed out after " +
                std::to_string(elapsed.count()) + "ms");
        }

        return domain::OracleResponse{httpResponse.getStatus(), httpResponse.getBody()};
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
};

} // namespace paygate::adapters::secondary
