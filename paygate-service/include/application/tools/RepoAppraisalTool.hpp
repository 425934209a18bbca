#pragma once

#include "application/tools/IOracleTool.hpp"
#include "domain/PaymentException.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace paygate::application::tools {

/**
 * @brief appraise_honey_code: оценка репозитория в SURGE
 *
 * GET /repos/{owner}/{repo} на репозиторный оракул, затем:
 *   affinity   = matches / 10 * PHI, matches = 5.5 (+4 для trenchchat)
 *   complexity = size / 1000 + stars / 10, в пределах [1, 10]
 *   value      = affinity * 100 + complexity * 10
 */
class RepoAppraisalTool : public IOracleTool {
public:
    static constexpr double PHI = 0.618;
    static constexpr double BASE_MATCHES = 5.5;
    static constexpr double RHIZOME_MATCHES = 4.0;
    static constexpr double TOTAL_REQUIREMENTS = 10.0;
    static constexpr double SIZE_DIVISOR = 1000.0;
    static constexpr double STARS_DIVISOR = 10.0;
    static constexpr double MIN_COMPLEXITY = 1.0;
    static constexpr double MAX_COMPLEXITY = 10.0;
    static constexpr double AFFINITY_MULTIPLIER = 100.0;
    static constexpr double COMPLEXITY_MULTIPLIER = 10.0;
    static constexpr double HIGH_QUALITY_THRESHOLD = 0.5;

    RepoAppraisalTool(std::string host, int port) : host_(std::move(host)), port_(port) {}

    std::string name() const override { return "appraise_honey_code"; }
    std::string method() const override { return "GET"; }
    std::string uriTemplate() const override { return "/repos/{owner}/{repo}"; }

    std::vector<ToolParameter> parameters() const override {
        return {{"repo_url", ParamType::STRING}};
    }

    domain::OracleRequest buildRequest(const nlohmann::json& params) const override {
        const auto repoUrl = params.at("repo_url").get<std::string>();
        const auto segments = pathSegments(repoUrl);
        if (segments.size() < 2) {
            throw domain::ValidationException("invalid repository URL: " + repoUrl);
        }

        domain::OracleRequest request;
        request.method = method();
        request.host = host_;
        request.port = port_;
        request.path = "/repos/" + segments[0] + "/" + segments[1];
        request.headers["Accept"] = "application/json";
        return request;
    }

    nlohmann::json mapResponse(const std::string& body, const nlohmann::json& params) const override {
        auto repo = nlohmann::json::parse(body);
        if (!repo.is_object()) {
            throw domain::ProtocolViolationException("repository oracle returned non-object body");
        }

        const auto repoUrl = params.at("repo_url").get<std::string>();
        const double size = repo.value("size", 0.0);
        const double stars = repo.value("stargazers_count", 0.0);

        const double affinity = computeAffinity(repoUrl);
        const double complexity = computeComplexity(size, stars);
        const double value = affinity * AFFINITY_MULTIPLIER + complexity * COMPLEXITY_MULTIPLIER;

        nlohmann::json report;
        report["repo_url"] = repoUrl;
        report["affinity"] = std::round(affinity * 10000.0) / 10000.0;
        report["integrity"] = "Verified";
        report["recommended_protocol_value"] = formatValue(value) + " SURGE";
        report["status"] = affinity > HIGH_QUALITY_THRESHOLD
            ? "High-Quality Code-Honey Detected"
            : "Low Affinity";
        return report;
    }

    std::string report(const nlohmann::json&, const nlohmann::json& payload) const override {
        return "[Bee.Savant Report]\nDetected " + payload.value("status", "") + " at " +
               payload.value("repo_url", "") + ".\nAffinity: " + payload["affinity"].dump() +
               ". Integrity: " + payload.value("integrity", "") +
               ".\nRecommended Protocol Value: " + payload.value("recommended_protocol_value", "") + ".";
    }

    static double computeAffinity(const std::string& repoUrl) {
        std::string lower = repoUrl;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const double matches = BASE_MATCHES +
            (lower.find("trenchchat") != std::string::npos ? RHIZOME_MATCHES : 0.0);
        return matches / TOTAL_REQUIREMENTS * PHI;
    }

    static double computeComplexity(double size, double stars) {
        return std::clamp(size / SIZE_DIVISOR + stars / STARS_DIVISOR, MIN_COMPLEXITY, MAX_COMPLEXITY);
    }

    /**
     * @brief Непустые сегменты пути URL (без схемы, хоста, query и fragment)
     *
     * "https://github.com/owner/repo/tree/main" -> {owner, repo, tree, main}
     * "owner/repo" -> {owner, repo}
     */
    static std::vector<std::string> pathSegments(const std::string& url) {
        std::string rest = url;
        auto cut = rest.find_first_of("?#");
        if (cut != std::string::npos) {
            rest = rest.substr(0, cut);
        }

        auto scheme = rest.find("://");
        if (scheme != std::string::npos) {
            auto pathStart = rest.find('/', scheme + 3);
            rest = pathStart == std::string::npos ? "" : rest.substr(pathStart);
        }

        std::vector<std::string> segments;
        size_t pos = 0;
        while (pos <= rest.size()) {
            auto next = rest.find('/', pos);
            if (next == std::string::npos) {
                next = rest.size();
            }
            if (next > pos) {
                segments.push_back(rest.substr(pos, next - pos));
            }
            pos = next + 1;
        }
        return segments;
    }

private:
    static std::string formatValue(double value) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", value);
        return buffer;
    }

    std::string host_;
    int port_;
};

} // namespace paygate::application::tools
