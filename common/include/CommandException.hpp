#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Ошибка выполнения команды из фоновой очереди
 */

/**
 * @brief Бросается из ICommand::execute()
 *
 * Рабочий поток очереди ловит это исключение, логирует и переходит
 * к следующей команде: сбой одной команды не останавливает очередь.
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message)
        : std::runtime_error(message) {}
};
