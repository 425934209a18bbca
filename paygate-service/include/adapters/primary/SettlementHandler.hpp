#pragma once

#include "domain/PaymentException.hpp"
#include "ports/input/ISettlementService.hpp"
#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <memory>

namespace paygate::adapters::primary {

/**
 * @brief HTTP Handler для просмотра и сверки леджера
 *
 * Endpoints:
 * - GET /api/v1/settlements[?status=pending]
 * - GET /api/v1/settlements/{fingerprint}
 * - POST /api/v1/settlements/{fingerprint}/reconcile
 *
 * Подпись (она же id транзакции) наружу не отдаётся.
 */
class SettlementHandler : public IHttpHandler
{
public:
    explicit SettlementHandler(std::shared_ptr<ports::input::ISettlementService> settlementService)
        : settlementService_(std::move(settlementService))
    {
        std::cout << "[SettlementHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string method = req.getMethod();
        std::string fullPath = req.getPath();
        std::string path = fullPath.substr(0, fullPath.find('?'));

        if (method == "GET" && path == PREFIX) {
            handleList(req, res, fullPath);
            return;
        }

        if (path.rfind(PREFIX + "/", 0) != 0) {
            sendJson(res, 404, nlohmann::json{{"error", "Not found"}});
            return;
        }

        std::string rest = path.substr(PREFIX.size() + 1);
        auto slash = rest.find('/');
        std::string fingerprint = rest.substr(0, slash);
        std::string action = slash == std::string::npos ? "" : rest.substr(slash + 1);

        if (fingerprint.empty()) {
            sendJson(res, 404, nlohmann::json{{"error", "Not found"}});
        } else if (method == "GET" && action.empty()) {
            handleGet(res, fingerprint);
        } else if (method == "POST" && action == "reconcile") {
            handleReconcile(res, fingerprint);
        } else {
            sendJson(res, 404, nlohmann::json{{"error", "Not found"}});
        }
    }

    static nlohmann::json recordToJson(const domain::SettlementRecord& record)
    {
        const auto& auth = record.authorization;
        return nlohmann::json{
            {"fingerprint", record.fingerprint},
            {"nonce", record.nonce},
            {"status", domain::toString(record.status)},
            {"network", auth.network},
            {"asset", auth.asset},
            {"pay_to", auth.payTo},
            {"payer", auth.payer},
            {"amount", std::to_string(auth.amount)},
            {"resource", auth.resource},
            {"valid_before", auth.validBefore.toUnixSeconds()},
            {"created_at", record.createdAt.toString()},
            {"updated_at", record.updatedAt.toString()}
        };
    }

private:
    inline static const std::string PREFIX = "/api/v1/settlements";

    std::shared_ptr<ports::input::ISettlementService> settlementService_;

    void handleList(IRequest& req, IResponse& res, const std::string& fullPath)
    {
        auto params = parseQueryParams(fullPath);
        if (params.empty()) {
            params = req.getParams();
        }

        std::optional<domain::SettlementStatus> status;
        auto it = params.find("status");
        if (it != params.end() && !it->second.empty()) {
            status = domain::parseSettlementStatus(it->second);
            if (domain::toString(*status) != it->second) {
                sendJson(res, 400, nlohmann::json{{"error", "Unknown status: " + it->second}});
                return;
            }
        }

        nlohmann::json response = nlohmann::json::array();
        for (const auto& record : settlementService_->listRecords(status)) {
            response.push_back(recordToJson(record));
        }
        sendJson(res, 200, response);
    }

    void handleGet(IResponse& res, const std::string& fingerprint)
    {
        auto record = settlementService_->getRecord(fingerprint);
        if (!record) {
            sendJson(res, 404, nlohmann::json{{"error", "Settlement record not found"}});
            return;
        }
        sendJson(res, 200, recordToJson(*record));
    }

    void handleReconcile(IResponse& res, const std::string& fingerprint)
    {
        try {
            auto record = settlementService_->reconcile(fingerprint);
            if (!record) {
                sendJson(res, 404, nlohmann::json{{"error", "Settlement record not found"}});
                return;
            }
            sendJson(res, 200, recordToJson(*record));
        } catch (const domain::PaymentException& e) {
            std::cerr << "[SettlementHandler] Reconcile " << fingerprint.substr(0, 12)
                      << " failed: " << e.what() << std::endl;
            sendJson(res, 503, nlohmann::json{
                {"error", domain::toString(e.category())},
                {"message", e.what()}
            });
        }
    }

    static std::map<std::string, std::string> parseQueryParams(const std::string& fullPath)
    {
        std::map<std::string, std::string> params;
        auto pos = fullPath.find('?');
        if (pos == std::string::npos) {
            return params;
        }

        std::string query = fullPath.substr(pos + 1);
        size_t start = 0;
        while (start < query.size()) {
            auto amp = query.find('&', start);
            std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            auto eq = pair.find('=');
            if (eq != std::string::npos && eq > 0) {
                params[pair.substr(0, eq)] = pair.substr(eq + 1);
            }
            if (amp == std::string::npos) {
                break;
            }
            start = amp + 1;
        }
        return params;
    }

    static void sendJson(IResponse& res, int status, const nlohmann::json& body)
    {
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(body.dump());
    }
};

} // namespace paygate::adapters::primary
