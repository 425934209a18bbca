#pragma once

#include "ports/input/IOracleToolService.hpp"
#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace paygate::adapters::primary {

/**
 * @brief HTTP Handler для вызова инструментов-оракулов
 *
 * Endpoints:
 * - GET /api/v1/tools
 * - POST /api/v1/tools/{name}  (тело = JSON параметров)
 *
 * Категория ошибки переводится в HTTP-статус:
 * VALIDATION_ERROR 400, AUTHORIZATION_ERROR 402, PROTOCOL_VIOLATION 502,
 * TRANSIENT_NETWORK_ERROR 503, SETTLEMENT_AMBIGUOUS 504.
 */
class ToolHandler : public IHttpHandler
{
public:
    explicit ToolHandler(std::shared_ptr<ports::input::IOracleToolService> toolService)
        : toolService_(std::move(toolService))
    {
        std::cout << "[ToolHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string path = stripQuery(req.getPath());

        if (method == "GET" && path == TOOLS_PREFIX) {
            handleListTools(res);
        } else if (method == "POST" && path.rfind(TOOLS_PREFIX + "/", 0) == 0) {
            handleCall(req, res, path.substr(TOOLS_PREFIX.size() + 1));
        } else {
            sendJson(res, 404, nlohmann::json{{"error", "Not found"}});
        }
    }

    static int statusFor(domain::ErrorCategory category)
    {
        switch (category) {
            case domain::ErrorCategory::NONE:                return 200;
            case domain::ErrorCategory::VALIDATION:          return 400;
            case domain::ErrorCategory::AUTHORIZATION:       return 402;
            case domain::ErrorCategory::PROTOCOL_VIOLATION:  return 502;
            case domain::ErrorCategory::TRANSIENT_NETWORK:   return 503;
            case domain::ErrorCategory::SETTLEMENT_AMBIGUOUS: return 504;
        }
        return 500;
    }

private:
    inline static const std::string TOOLS_PREFIX = "/api/v1/tools";

    std::shared_ptr<ports::input::IOracleToolService> toolService_;

    void handleListTools(IResponse& res)
    {
        sendJson(res, 200, nlohmann::json{{"tools", toolService_->listTools()}});
    }

    void handleCall(IRequest& req, IResponse& res, const std::string& toolName)
    {
        if (toolName.empty() || toolName.find('/') != std::string::npos) {
            sendJson(res, 404, nlohmann::json{{"error", "Not found"}});
            return;
        }

        nlohmann::json params = nlohmann::json::object();
        const auto& body = req.getBody();
        if (!body.empty()) {
            try {
                params = nlohmann::json::parse(body);
            } catch (const nlohmann::json::exception&) {
                sendJson(res, 400, nlohmann::json{{"error", "Invalid JSON"}});
                return;
            }
        }

        auto result = toolService_->call(toolName, params);
        sendJson(res, result.success ? 200 : statusFor(result.errorCategory), result.toJson());
    }

    static std::string stripQuery(const std::string& path)
    {
        auto pos = path.find('?');
        return pos == std::string::npos ? path : path.substr(0, pos);
    }

    static void sendJson(IResponse& res, int status, const nlohmann::json& body)
    {
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(body.dump());
    }
};

} // namespace paygate::adapters::primary
