#pragma once

#include <string>

namespace wallet::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQAdapter. Для ядра это fire-and-forget уведомление:
 * ошибка публикации никогда не откатывает финансовую операцию.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "ledger.transfer.applied")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace wallet::ports::output
