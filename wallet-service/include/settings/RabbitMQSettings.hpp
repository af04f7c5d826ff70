#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_EXCHANGE (default: "wallet.events")
 * - RABBITMQ_QUEUE (default: "wallet.commands") - durable очередь команд
 * - RABBITMQ_RECONNECT_MS (default: 5000) - пауза перед переподключением
 * - RABBITMQ_OUTBOX_LIMIT (default: 10000) - сколько исходящих держать без соединения
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
        if (const char* queue = std::getenv("RABBITMQ_QUEUE")) {
            queue_ = queue;
        }
        if (const char* reconnect = std::getenv("RABBITMQ_RECONNECT_MS")) {
            reconnectDelay_ = std::chrono::milliseconds{std::stoll(reconnect)};
        }
        if (const char* limit = std::getenv("RABBITMQ_OUTBOX_LIMIT")) {
            outboxLimit_ = static_cast<std::size_t>(std::stoul(limit));
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }
    std::string getQueue() const { return queue_; }
    std::chrono::milliseconds getReconnectDelay() const { return reconnectDelay_; }
    std::size_t getOutboxLimit() const { return outboxLimit_; }

    std::string getAmqpUrl() const {
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" + std::to_string(port_) + "/";
    }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string exchange_ = "wallet.events";
    std::string queue_ = "wallet.commands";
    std::chrono::milliseconds reconnectDelay_{5000};
    std::size_t outboxLimit_ = 10000;
};

} // namespace wallet::settings
