#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wallet::adapters::secondary {

/**
 * @brief Транспорт кошелька поверх RabbitMQ
 *
 * Команды читаются из durable очереди (wallet.commands) по одной: следующая
 * доставка приходит только после ack предыдущей. Ответы и события уходят
 * в topic exchange (wallet.events) persistent сообщениями.
 *
 * При обрыве соединения адаптер переподключается через RABBITMQ_RECONNECT_MS,
 * а ответы, опубликованные без канала, ждут в outbox и уходят после
 * восстановления. Outbox ограничен RABBITMQ_OUTBOX_LIMIT, при переполнении
 * теряются самые старые.
 *
 * Всё состояние AMQP принадлежит потоку io_context (worker_): publish()
 * и subscribe() из других потоков только ставят задачи через post().
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchange_(settings_->getExchange())
        , queue_(settings_->getQueue())
        , work_(boost::asio::make_work_guard(ioContext_))
        , link_(ioContext_, *this)
        , reconnectTimer_(ioContext_)
        , shutdownTimer_(ioContext_)
    {
        std::cout << "[RabbitMQAdapter] Broker " << settings_->getHost() << ":" << settings_->getPort()
                  << ", commands from " << queue_ << ", events to " << exchange_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    RabbitMQAdapter(const RabbitMQAdapter&) = delete;
    RabbitMQAdapter& operator=(const RabbitMQAdapter&) = delete;

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& routingKey, const std::string& message) override {
        if (stopping_) {
            std::cerr << "[RabbitMQAdapter] Adapter stopped, " << routingKey << " not sent" << std::endl;
            return;
        }
        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (channelReady_ && send(routingKey, message)) {
                return;
            }
            hold(routingKey, message);
        });
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    /**
     * @brief Зарегистрировать обработчик команд
     *
     * Ключи, добавленные после start(), привязываются к очереди сразу,
     * если канал уже открыт, иначе при следующем подключении.
     */
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        {
            std::lock_guard<std::mutex> lock(routesMutex_);
            for (const auto& key : routingKeys) {
                routes_[key].push_back(handler);
            }
        }
        if (!started_) {
            return;
        }
        boost::asio::post(ioContext_, [this, routingKeys]() {
            if (!channelReady_) {
                return;
            }
            for (const auto& key : routingKeys) {
                channel_->bindQueue(exchange_, queue_, key);
            }
        });
    }

    void start() override {
        if (started_.exchange(true)) {
            return;
        }
        boost::asio::post(ioContext_, [this]() { connect(); });
        worker_ = std::thread([this]() { runLoop(); });
    }

    /**
     * @brief Закрыть соединение и дождаться остановки потока
     *
     * На вежливое закрытие AMQP даётся секунда, потом цикл останавливается.
     */
    void stop() override {
        if (!started_ || stopping_.exchange(true)) {
            return;
        }

        boost::asio::post(ioContext_, [this]() {
            reconnectTimer_.cancel();
            channelReady_ = false;
            if (!outbox_.empty()) {
                std::cerr << "[RabbitMQAdapter] " << outbox_.size()
                          << " outgoing messages were never delivered" << std::endl;
            }
            if (connection_) {
                connection_->close();
            }
            shutdownTimer_.expires_after(std::chrono::seconds(1));
            shutdownTimer_.async_wait([this](const boost::system::error_code&) {
                ioContext_.stop();
            });
        });
        work_.reset();

        if (worker_.joinable()) {
            worker_.join();
        }
        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    /**
     * @brief Обработчик TCP для AMQP-CPP, сообщающий адаптеру о состоянии соединения
     */
    class Link : public AMQP::LibBoostAsioHandler {
    public:
        Link(boost::asio::io_context& io, RabbitMQAdapter& owner)
            : AMQP::LibBoostAsioHandler(io)
            , owner_(owner)
        {}

        void onReady(AMQP::TcpConnection*) override {
            owner_.onConnected();
        }

        void onError(AMQP::TcpConnection*, const char* message) override {
            owner_.onDisconnected(message);
        }

        void onClosed(AMQP::TcpConnection*) override {
            owner_.onDisconnected("closed by broker");
        }

    private:
        RabbitMQAdapter& owner_;
    };

    // =========================================================================
    // Поток io_context
    // =========================================================================

    void runLoop() {
        while (!stopping_) {
            try {
                ioContext_.run();
                return;
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Event loop failed: " << e.what() << std::endl;
                ioContext_.restart();
                boost::asio::post(ioContext_, [this]() { onDisconnected("event loop failure"); });
            }
        }
    }

    void connect() {
        channelReady_ = false;
        channel_.reset();
        connection_ = std::make_unique<AMQP::TcpConnection>(&link_, AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());
        channel_->onError([this](const char* message) { onDisconnected(message); });
        declareTopology();
    }

    /**
     * @brief Объявить exchange и очередь, привязать ключи и начать чтение команд
     *
     * Кадры уходят в канал подряд, ошибка любого шага закрывает канал
     * и ведёт к переподключению. Канал считается готовым после подтверждения consume.
     */
    void declareTopology() {
        channel_->declareExchange(exchange_, AMQP::topic, AMQP::durable);

        channel_->declareQueue(queue_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t waiting, uint32_t consumers) {
                std::cout << "[RabbitMQAdapter] Queue " << name << ": " << waiting
                          << " commands waiting, " << consumers << " other consumers" << std::endl;
            });

        for (const auto& key : boundKeys()) {
            channel_->bindQueue(exchange_, queue_, key);
        }

        channel_->setQos(1);
        channel_->consume(queue_)
            .onSuccess([this](const std::string& consumerTag) {
                channelReady_ = true;
                std::cout << "[RabbitMQAdapter] Consuming " << queue_ << " as " << consumerTag << std::endl;
                flushOutbox();
            })
            .onReceived([this](const AMQP::Message& message, uint64_t deliveryTag, bool redelivered) {
                deliver(message, deliveryTag, redelivered);
            });
    }

    void onConnected() {
        std::cout << "[RabbitMQAdapter] Connected to " << settings_->getHost() << std::endl;
    }

    void onDisconnected(const std::string& reason) {
        channelReady_ = false;
        if (stopping_ || reconnectPending_) {
            return;
        }
        reconnectPending_ = true;
        std::cerr << "[RabbitMQAdapter] Connection lost (" << reason << "), reconnecting in "
                  << settings_->getReconnectDelay().count() << " ms" << std::endl;

        reconnectTimer_.expires_after(settings_->getReconnectDelay());
        reconnectTimer_.async_wait([this](const boost::system::error_code& ec) {
            reconnectPending_ = false;
            if (ec || stopping_) {
                return;
            }
            connect();
        });
    }

    /**
     * @brief Передать команду обработчикам и подтвердить её
     *
     * Команда без обработчика отклоняется без возврата в очередь.
     * Исключение обработчика не мешает ack: ответ об ошибке
     * публикует сам обработчик.
     */
    void deliver(const AMQP::Message& message, uint64_t deliveryTag, bool redelivered) {
        const std::string routingKey = message.routingkey();
        auto handlers = handlersFor(routingKey);
        if (handlers.empty()) {
            std::cerr << "[RabbitMQAdapter] No handler for " << routingKey << ", rejected" << std::endl;
            channel_->reject(deliveryTag);
            return;
        }

        const std::string body(message.body(), message.bodySize());
        if (redelivered) {
            std::cout << "[RabbitMQAdapter] Redelivered " << routingKey << std::endl;
        }
        for (const auto& handler : handlers) {
            try {
                handler(routingKey, body);
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] " << routingKey << " handler threw: " << e.what() << std::endl;
            }
        }
        channel_->ack(deliveryTag);
    }

    bool send(const std::string& routingKey, const std::string& message) {
        AMQP::Envelope envelope(message.data(), message.size());
        envelope.setContentType("application/json");
        envelope.setDeliveryMode(2);
        envelope.setTimestamp(static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count()));
        return channel_->publish(exchange_, routingKey, envelope);
    }

    void hold(const std::string& routingKey, const std::string& message) {
        if (outbox_.size() >= settings_->getOutboxLimit()) {
            std::cerr << "[RabbitMQAdapter] Outbox full, dropped " << outbox_.front().first << std::endl;
            outbox_.pop_front();
        }
        outbox_.emplace_back(routingKey, message);
    }

    void flushOutbox() {
        if (outbox_.empty()) {
            return;
        }
        std::cout << "[RabbitMQAdapter] Sending " << outbox_.size() << " held messages" << std::endl;
        while (channelReady_ && !outbox_.empty()) {
            if (!send(outbox_.front().first, outbox_.front().second)) {
                break;
            }
            outbox_.pop_front();
        }
    }

    // =========================================================================
    // Маршруты (общие для всех потоков)
    // =========================================================================

    std::vector<std::string> boundKeys() {
        std::lock_guard<std::mutex> lock(routesMutex_);
        std::vector<std::string> keys;
        keys.reserve(routes_.size());
        for (const auto& [key, handlers] : routes_) {
            keys.push_back(key);
        }
        return keys;
    }

    std::vector<ports::output::EventHandler> handlersFor(const std::string& routingKey) {
        std::lock_guard<std::mutex> lock(routesMutex_);
        auto it = routes_.find(routingKey);
        if (it == routes_.end()) {
            return {};
        }
        return it->second;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    const std::string exchange_;
    const std::string queue_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    Link link_;
    boost::asio::steady_timer reconnectTimer_;
    boost::asio::steady_timer shutdownTimer_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::thread worker_;

    // Только поток io_context
    bool channelReady_ = false;
    bool reconnectPending_ = false;
    std::deque<std::pair<std::string, std::string>> outbox_;

    std::mutex routesMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> routes_;
};

} // namespace wallet::adapters::secondary
