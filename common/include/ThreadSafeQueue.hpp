#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <memory>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Ограниченная потокобезопасная очередь команд
 * @details
 * Производители не блокируются: при заполненной очереди push() отказывает
 * и возвращает false. Потребитель ждёт через pop() или popFor().
 * После shutdown() новые команды не принимаются, но уже лежащие
 * в очереди можно дочитать.
 */
class ThreadSafeQueue {
public:
    /**
     * @param capacity Максимальное число команд (0: без ограничения)
     */
    explicit ThreadSafeQueue(size_t capacity = 0);
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить команду в очередь
     * @return false, если очередь закрыта, переполнена или команда пустая
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду (блокирующий вызов)
     * @return Команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Извлечь команду, ожидая не дольше timeout
     * @return Команда, либо nullptr по таймауту или после закрытия пустой очереди
     */
    std::shared_ptr<ICommand> popFor(std::chrono::milliseconds timeout);

    void shutdown();

    bool isShutdown() const;
    bool isEmpty() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    std::shared_ptr<ICommand> takeFront();

    std::queue<std::shared_ptr<ICommand>> queue_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
};
