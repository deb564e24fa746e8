#pragma once

#include <string>
#include <cstdlib>

namespace ordering::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER / RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_EXCHANGE (default: "ordering.events") - куда публикуем
 * - RABBITMQ_INBOUND_EXCHANGE (default: "integration.events") - откуда слушаем
 * - RABBITMQ_PUBLISH_TIMEOUT_MS (default: 5000) - ожидание publisher confirm
 * - RABBITMQ_INBOUND_QUEUE (default: "ordering-service.inbound") - durable очередь входящих
 * - RABBITMQ_PREFETCH (default: 64) - сколько неподтверждённых доставок держит consumer
 * - RABBITMQ_RECONNECT_BASE_MS / RABBITMQ_RECONNECT_MAX_MS (default: 500 / 30000)
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* exchange = std::getenv("RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
        if (const char* inbound = std::getenv("RABBITMQ_INBOUND_EXCHANGE")) {
            inboundExchange_ = inbound;
        }
        if (const char* timeout = std::getenv("RABBITMQ_PUBLISH_TIMEOUT_MS")) {
            publishTimeoutMs_ = std::stoi(timeout);
        }
        if (const char* queue = std::getenv("RABBITMQ_INBOUND_QUEUE")) {
            inboundQueue_ = queue;
        }
        if (const char* prefetch = std::getenv("RABBITMQ_PREFETCH")) {
            prefetch_ = std::stoi(prefetch);
        }
        if (const char* base = std::getenv("RABBITMQ_RECONNECT_BASE_MS")) {
            reconnectBaseMs_ = std::stoi(base);
        }
        if (const char* max = std::getenv("RABBITMQ_RECONNECT_MAX_MS")) {
            reconnectMaxMs_ = std::stoi(max);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }
    std::string getInboundExchange() const { return inboundExchange_; }
    int getPublishTimeoutMs() const { return publishTimeoutMs_; }
    std::string getInboundQueue() const { return inboundQueue_; }
    int getPrefetch() const { return prefetch_; }
    int getReconnectBaseMs() const { return reconnectBaseMs_; }
    int getReconnectMaxMs() const { return reconnectMaxMs_; }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string exchange_ = "ordering.events";
    std::string inboundExchange_ = "integration.events";
    int publishTimeoutMs_ = 5000;
    std::string inboundQueue_ = "ordering-service.inbound";
    int prefetch_ = 64;
    int reconnectBaseMs_ = 500;
    int reconnectMaxMs_ = 30000;
};

} // namespace ordering::settings
