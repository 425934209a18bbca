#pragma once

#include "domain/Timestamp.hpp"
#include "ports/input/IOracleToolService.hpp"
#include "settings/IPaymentSettings.hpp"
#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace paygate::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервиса
 *
 * Endpoint: GET /health
 */
class HealthHandler : public IHttpHandler
{
public:
    HealthHandler(std::shared_ptr<ports::input::IOracleToolService> toolService,
                  std::shared_ptr<settings::IPaymentSettings> paymentSettings)
        : toolService_(std::move(toolService))
        , paymentSettings_(std::move(paymentSettings))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "ok";
        response["timestamp"] = domain::Timestamp::now().toString();
        response["network"] = paymentSettings_->getNetwork();
        response["tools"] = toolService_->listTools();

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }

private:
    std::shared_ptr<ports::input::IOracleToolService> toolService_;
    std::shared_ptr<settings::IPaymentSettings> paymentSettings_;
};

} // namespace paygate::adapters::primary
