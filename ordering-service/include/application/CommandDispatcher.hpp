#pragma once

#include "ThreadSafeQueue.hpp"
#include "ICommand.hpp"
#include "settings/ICommandSettings.hpp"

#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ordering::application {

/**
 * @brief ICommand поверх произвольного вызова сервиса
 */
class FunctionCommand : public ICommand {
public:
    FunctionCommand(std::string name, std::function<void()> body)
        : name_(std::move(name))
        , body_(std::move(body))
    {}

    void execute() override { body_(); }

    std::string name() const override { return name_; }

private:
    std::string name_;
    std::function<void()> body_;
};

/**
 * @brief Пул воркеров, шардированный по ключу
 *
 * У каждого воркера своя ThreadSafeQueue. Команда с ключом K всегда
 * попадает в очередь hash(K) % workerCount, поэтому команды одного
 * заказа выполняются строго в порядке dispatch(), а разных заказов
 * параллельно.
 *
 * Входящие события превращаются в команды и выполняются здесь, а не
 * в потоке RabbitMQ. stop() дорабатывает уже поставленные команды.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<settings::ICommandSettings> settings)
        : workerCount_(settings->getWorkerCount() > 0 ? static_cast<size_t>(settings->getWorkerCount()) : 1)
        , running_(false)
        , executed_(0)
        , failed_(0)
    {
        for (size_t i = 0; i < workerCount_; ++i) {
            shards_.push_back(std::make_unique<ThreadSafeQueue>());
        }
    }

    ~CommandDispatcher() {
        stop();
    }

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        for (size_t i = 0; i < workerCount_; ++i) {
            workers_.emplace_back([this, i]() { work(*shards_[i]); });
        }
        std::cout << "[CommandDispatcher] Started " << workerCount_ << " workers" << std::endl;
    }

    void stop() {
        for (auto& shard : shards_) {
            shard->shutdown();
        }
        if (!running_.exchange(false)) return;

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        std::cout << "[CommandDispatcher] Stopped (executed=" << executed_
                  << ", failed=" << failed_ << ")" << std::endl;
    }

    /**
     * @param key ключ упорядочивания (id заказа)
     * @return false, если диспетчер уже остановлен
     */
    bool dispatch(const std::string& key, std::shared_ptr<ICommand> command) {
        return shards_[shardOf(key)]->push(std::move(command));
    }

    size_t shardOf(const std::string& key) const {
        return std::hash<std::string>{}(key) % workerCount_;
    }

    size_t getWorkerCount() const { return workerCount_; }

    size_t pending() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->size();
        }
        return total;
    }

    uint64_t executed() const { return executed_; }
    uint64_t failed() const { return failed_; }

private:
    size_t workerCount_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> executed_;
    std::atomic<uint64_t> failed_;
    std::vector<std::unique_ptr<ThreadSafeQueue>> shards_;
    std::vector<std::thread> workers_;

    void work(ThreadSafeQueue& queue) {
        while (auto command = queue.pop()) {
            try {
                command->execute();
                ++executed_;
            } catch (const std::exception& e) {
                ++failed_;
                std::cerr << "[CommandDispatcher] " << command->name() << " failed: " << e.what() << std::endl;
            }
        }
    }
};

} // namespace ordering::application
