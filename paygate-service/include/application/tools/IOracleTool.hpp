#pragma once

#include "domain/OracleRequest.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace paygate::application::tools {

enum class ParamType {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN
};

inline std::string toString(ParamType type) {
    switch (type) {
        case ParamType::STRING: return "string";
        case ParamType::INTEGER: return "integer";
        case ParamType::NUMBER: return "number";
        case ParamType::BOOLEAN: return "boolean";
        default: return "unknown";
    }
}

struct ToolParameter {
    std::string name;
    ParamType type = ParamType::STRING;
};

/**
 * @brief Описание инструмента-оракула
 *
 * Инструмент объявляет имя, HTTP-метод, шаблон URI ресурса и обязательные
 * параметры. Строит OracleRequest из уже проверенных параметров и переводит
 * тело успешного ответа в доменный результат.
 */
class IOracleTool {
public:
    virtual ~IOracleTool() = default;

    virtual std::string name() const = 0;
    virtual std::string method() const = 0;
    virtual std::string uriTemplate() const = 0;
    virtual std::vector<ToolParameter> parameters() const = 0;

    /**
     * @throws domain::ValidationException если значение параметра недопустимо
     */
    virtual domain::OracleRequest buildRequest(const nlohmann::json& params) const = 0;

    /**
     * @throws domain::ProtocolViolationException если тело не соответствует формату оракула
     */
    virtual nlohmann::json mapResponse(const std::string& body, const nlohmann::json& params) const = 0;

    /// Текст отчёта для события oracle.report
    virtual std::string report(const nlohmann::json& params, const nlohmann::json& payload) const = 0;
};

} // namespace paygate::application::tools
