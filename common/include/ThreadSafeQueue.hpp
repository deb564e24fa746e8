#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд
 * @details
 * Блокирующий pop() для воркеров и popFor() с таймаутом.
 * После shutdown() новые команды не принимаются, но уже поставленные
 * дочитываются до конца.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;

public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить команду в очередь
     * @return false, если очередь уже закрыта или команда пустая
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Извлечь команду, ожидая не дольше timeout
     * @return команда, либо nullptr по таймауту или после закрытия
     */
    std::shared_ptr<ICommand> popFor(std::chrono::milliseconds timeout);

    void shutdown();

    bool isShutdown() const;

    bool isEmpty() const;

    size_t size() const;
};
