#pragma once

#include "application/tools/BalanceForagingTool.hpp"
#include "application/tools/IOracleTool.hpp"
#include "application/tools/RepoAppraisalTool.hpp"
#include "application/tools/VisionQualityTool.hpp"
#include "domain/Deadline.hpp"
#include "domain/PaymentException.hpp"
#include "domain/events/OracleReportEvent.hpp"
#include "ports/input/IOracleToolService.hpp"
#include "ports/input/IPaymentOrchestrator.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/IOracleSettings.hpp"
#include "settings/IPaymentSettings.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace paygate::application {

/**
 * @brief Адаптер инструментов-оракулов
 *
 * Проверяет параметры, строит запрос, проводит его через оркестратор
 * и переводит ответ в ToolCallResult. Ровно одна типизированная ошибка
 * на неуспешный вызов, без частичного успеха.
 */
class OracleToolService : public ports::input::IOracleToolService {
public:
    OracleToolService(std::shared_ptr<ports::input::IPaymentOrchestrator> orchestrator,
                      std::shared_ptr<settings::IOracleSettings> oracleSettings,
                      std::shared_ptr<settings::IPaymentSettings> paymentSettings,
                      std::shared_ptr<ports::output::IEventPublisher> publisher)
        : orchestrator_(std::move(orchestrator))
        , paymentSettings_(std::move(paymentSettings))
        , publisher_(std::move(publisher))
    {
        registerTool(std::make_shared<tools::VisionQualityTool>(
            oracleSettings->getVisionHost(), oracleSettings->getVisionPort()));
        registerTool(std::make_shared<tools::RepoAppraisalTool>(
            oracleSettings->getRepoHost(), oracleSettings->getRepoPort()));
        registerTool(std::make_shared<tools::BalanceForagingTool>(
            oracleSettings->getChainHost(), oracleSettings->getChainPort()));

        std::cout << "[OracleToolService] Created with " << tools_.size() << " tools" << std::endl;
    }

    void registerTool(std::shared_ptr<tools::IOracleTool> tool) {
        auto name = tool->name();
        tools_[name] = std::move(tool);
    }

    domain::ToolCallResult call(const std::string& toolName, const nlohmann::json& params) override {
        return call(toolName, params, domain::Deadline::after(paymentSettings_->getCallTimeout()));
    }

    domain::ToolCallResult call(const std::string& toolName,
                                const nlohmann::json& params,
                                const domain::Deadline& deadline) {
        auto it = tools_.find(toolName);
        if (it == tools_.end()) {
            std::cerr << "[OracleToolService] Unknown tool: " << toolName << std::endl;
            return domain::ToolCallResult::failed(toolName, domain::ErrorCategory::VALIDATION,
                                                  "unknown tool: " + toolName);
        }
        const auto& tool = it->second;

        try {
            auto canonical = validate(*tool, params);
            auto request = tool->buildRequest(canonical);
            request.canonicalParams = canonical.dump();

            auto outcome = orchestrator_->execute(request, deadline);
            if (!outcome.response.isSuccess()) {
                throw domain::ProtocolViolationException(
                    "oracle answered " + std::to_string(outcome.response.status));
            }

            nlohmann::json payload;
            try {
                payload = tool->mapResponse(outcome.response.body, canonical);
            } catch (const nlohmann::json::exception& e) {
                throw domain::ProtocolViolationException(
                    std::string("malformed oracle response: ") + e.what());
            }

            std::cout << "[OracleToolService] " << toolName << " succeeded, paid="
                      << (outcome.paid ? "yes" : "no") << std::endl;
            publishReport(*tool, canonical, payload, outcome.fingerprint);
            return domain::ToolCallResult::ok(toolName, payload, outcome.fingerprint, outcome.paid);

        } catch (const domain::PaymentException& e) {
            std::cerr << "[OracleToolService] " << toolName << " failed: "
                      << domain::toString(e.category()) << " " << e.what() << std::endl;
            return domain::ToolCallResult::failed(toolName, e.category(), e.what());
        }
    }

    std::vector<std::string> listTools() const override {
        std::vector<std::string> names;
        for (const auto& [name, tool] : tools_) {
            names.push_back(name);
        }
        return names;
    }

private:
    /**
     * @brief Проверить параметры по объявлению инструмента
     * @return Только объявленные параметры (ключи отсортированы)
     */
    static nlohmann::json validate(const tools::IOracleTool& tool, const nlohmann::json& params) {
        if (!params.is_object()) {
            throw domain::ValidationException("parameters must be a JSON object");
        }

        nlohmann::json canonical = nlohmann::json::object();
        for (const auto& param : tool.parameters()) {
            if (!params.contains(param.name) || params[param.name].is_null()) {
                throw domain::ValidationException("missing parameter: " + param.name);
            }
            const auto& value = params[param.name];
            if (!hasType(value, param.type)) {
                throw domain::ValidationException("parameter " + param.name + " must be " +
                                                  tools::toString(param.type));
            }
            canonical[param.name] = value;
        }
        return canonical;
    }

    static bool hasType(const nlohmann::json& value, tools::ParamType type) {
        switch (type) {
            case tools::ParamType::STRING: return value.is_string();
            case tools::ParamType::INTEGER: return value.is_number_integer();
            case tools::ParamType::NUMBER: return value.is_number();
            case tools::ParamType::BOOLEAN: return value.is_boolean();
            default: return false;
        }
    }

    void publishReport(const tools::IOracleTool& tool, const nlohmann::json& params,
                       const nlohmann::json& payload, const std::string& fingerprint) {
        domain::OracleReportEvent event;
        event.tool = tool.name();
        event.fingerprint = fingerprint;

        try {
            event.report = tool.report(params, payload);
            publisher_->publish(event.eventType, event.toJson());
        } catch (const std::exception& e) {
            std::cerr << "[OracleToolService] oracle.report not published: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<ports::input::IPaymentOrchestrator> orchestrator_;
    std::shared_ptr<settings::IPaymentSettings> paymentSettings_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::map<std::string, std::shared_ptr<tools::IOracleTool>> tools_;
};

} // namespace paygate::application
