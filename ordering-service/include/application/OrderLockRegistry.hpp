#pragma once

#include "ThreadSafeMap.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace ordering::application {

/**
 * @brief Мьютекс на каждый заказ внутри процесса
 *
 * Команды над одним заказом выполняются последовательно, над разными
 * параллельно. Между процессами порядок держит блокировка строки
 * и проверка версии в хранилище.
 *
 * Запись живёт, пока её держит хотя бы один Guard: последний
 * освободивший удаляет её, поэтому размер реестра ограничен числом
 * заказов, над которыми сейчас идут команды.
 */
class OrderLockRegistry {
public:
    /**
     * @brief Захваченный мьютекс ключа (RAII)
     */
    class Guard {
    public:
        Guard(OrderLockRegistry& registry, std::string key)
            : registry_(registry)
            , key_(std::move(key))
            , mutex_(registry_.locks_.getOrCreate(key_, [] { return std::make_shared<std::mutex>(); }))
            , lock_(*mutex_)
        {}

        ~Guard() {
            lock_.unlock();
            mutex_.reset();
            registry_.release(key_);
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        OrderLockRegistry& registry_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    /**
     * @brief Захватить мьютекс ключа, блокируясь, пока его держит другой поток
     */
    Guard acquire(const std::string& key) {
        return Guard(*this, key);
    }

    size_t size() const { return locks_.size(); }

private:
    ThreadSafeMap<std::string, std::mutex> locks_;

    void release(const std::string& key) {
        // use_count() == 1: ссылка осталась только у реестра
        locks_.removeIf(key, [](const std::shared_ptr<std::mutex>& mutex) { return mutex.use_count() == 1; });
    }
};

} // namespace ordering::application
