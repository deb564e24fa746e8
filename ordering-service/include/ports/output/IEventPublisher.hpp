#pragma once

#include <string>

namespace ordering::ports::output {

/**
 * @brief Результат публикации
 *
 * ACKED - брокер подтвердил приём (publisher confirm).
 * NACKED - брокер или соединение вернули ошибку.
 * TIMEOUT - подтверждение не пришло вовремя, исход неизвестен.
 * UNAVAILABLE - нет соединения с брокером; попыткой доставки не считается.
 */
struct PublishAck {
    enum class Status { ACKED, NACKED, TIMEOUT, UNAVAILABLE };

    Status status = Status::NACKED;
    std::string error;

    static PublishAck acked() { return PublishAck{Status::ACKED, ""}; }
    static PublishAck nacked(const std::string& error) { return PublishAck{Status::NACKED, error}; }
    static PublishAck timeout() { return PublishAck{Status::TIMEOUT, "publish confirm timeout"}; }
    static PublishAck unavailable(const std::string& error) { return PublishAck{Status::UNAVAILABLE, error}; }

    bool isAcked() const { return status == Status::ACKED; }
};

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQAdapter.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие и дождаться подтверждения
     * @param routingKey Ключ маршрутизации (например, "order.paid")
     * @param message JSON-сообщение
     */
    virtual PublishAck publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace ordering::ports::output
