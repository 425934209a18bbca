#pragma once

#include "domain/ToolCallResult.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace paygate::ports::input {

/**
 * @brief Входной порт: вызов инструмента-оракула агентом
 */
class IOracleToolService {
public:
    virtual ~IOracleToolService() = default;

    /**
     * @brief Вызвать инструмент
     *
     * Не бросает: любая ошибка превращается в ToolCallResult с категорией.
     * Неизвестный инструмент или неверные параметры дают VALIDATION_ERROR
     * до какой-либо сетевой активности.
     *
     * @param toolName Имя инструмента (verify_asset_quality, ...)
     * @param params JSON-объект параметров
     */
    virtual domain::ToolCallResult call(const std::string& toolName, const nlohmann::json& params) = 0;

    virtual std::vector<std::string> listTools() const = 0;
};

} // namespace paygate::ports::input
