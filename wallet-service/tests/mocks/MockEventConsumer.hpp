#pragma once

#include "ports/output/IEventConsumer.hpp"
#include <map>
#include <string>
#include <vector>

namespace wallet::tests {

/**
 * @brief Mock реализация IEventConsumer: доставляет сообщения синхронно
 */
class MockEventConsumer : public ports::output::IEventConsumer {
public:
    void subscribe(const std::vector<std::string>& routingKeys, ports::output::EventHandler handler) override {
        for (const auto& key : routingKeys) {
            handlers_[key] = handler;
        }
    }

    void start() override { started_ = true; }
    void stop() override { started_ = false; }

    /**
     * @brief Доставить сообщение подписчику
     * @return false если на routingKey никто не подписан
     */
    bool simulateMessage(const std::string& routingKey, const std::string& message) {
        auto it = handlers_.find(routingKey);
        if (it == handlers_.end()) {
            return false;
        }
        it->second(routingKey, message);
        return true;
    }

    bool isSubscribed(const std::string& routingKey) const {
        return handlers_.count(routingKey) > 0;
    }

    bool isStarted() const { return started_; }

private:
    std::map<std::string, ports::output::EventHandler> handlers_;
    bool started_ = false;
};

} // namespace wallet::tests
