#pragma once

/**
 * @file ICommand.hpp
 * @brief Единица работы для фоновой очереди (ThreadSafeQueue)
 */

/**
 * @brief Команда, выполняемая рабочим потоком очереди
 *
 * Команда захватывает все данные, нужные для выполнения:
 * рабочий поток ничего не знает о её содержимом.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws CommandException если команду невозможно выполнить
     */
    virtual void execute() = 0;
};
