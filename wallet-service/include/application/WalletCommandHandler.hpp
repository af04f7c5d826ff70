// wallet-service/include/application/WalletCommandHandler.hpp
#pragma once

#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/input/IBudgetCardService.hpp"
#include "ports/input/IEscrowService.hpp"
#include "ports/input/ILoanService.hpp"
#include "ports/input/ISubscriptionScheduler.hpp"
#include "domain/Money.hpp"
#include "domain/Date.hpp"
#include "domain/Caller.hpp"
#include "domain/StoreUnavailableError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace wallet::application {

/**
 * @brief Обработчик команд кошелька из RabbitMQ
 *
 * Слушает команды из wallet.events exchange:
 * - wallet.open, wallet.topup, wallet.transfer, wallet.freeze, wallet.unfreeze
 * - budget.create, budget.allocate, budget.spend, budget.limit
 * - escrow.create, escrow.release, escrow.refund
 * - loan.disburse, loan.repay
 * - subscription.create, subscription.cancel, subscription.pause,
 *   subscription.resume, subscription.sync, subscription.execute, subscription.retry
 *
 * На каждую команду публикует ответ:
 * - <команда>.succeeded
 * - <команда>.rejected (code, message, available, required, shortfall)
 *
 * Суммы в командах - десятичные строки ("12.34"), ID счетов - числа.
 * owner_id приходит от слоя аутентификации уже проверенным.
 */
class WalletCommandHandler {
public:
    WalletCommandHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IWalletService> walletService,
        std::shared_ptr<ports::input::IBudgetCardService> budgetService,
        std::shared_ptr<ports::input::IEscrowService> escrowService,
        std::shared_ptr<ports::input::ILoanService> loanService,
        std::shared_ptr<ports::input::ISubscriptionScheduler> scheduler
    ) : eventConsumer_(std::move(eventConsumer))
      , eventPublisher_(std::move(eventPublisher))
      , walletService_(std::move(walletService))
      , budgetService_(std::move(budgetService))
      , escrowService_(std::move(escrowService))
      , loanService_(std::move(loanService))
      , scheduler_(std::move(scheduler))
    {
        std::cout << "[WalletCommandHandler] Created" << std::endl;
        subscribe();
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IWalletService> walletService_;
    std::shared_ptr<ports::input::IBudgetCardService> budgetService_;
    std::shared_ptr<ports::input::IEscrowService> escrowService_;
    std::shared_ptr<ports::input::ILoanService> loanService_;
    std::shared_ptr<ports::input::ISubscriptionScheduler> scheduler_;

    void subscribe() {
        std::cout << "[WalletCommandHandler] Subscribing to wallet.*, budget.*, escrow.*, loan.*, subscription.*"
                  << std::endl;

        eventConsumer_->subscribe(
            {"wallet.open", "wallet.topup", "wallet.transfer", "wallet.freeze", "wallet.unfreeze",
             "budget.create", "budget.allocate", "budget.spend", "budget.limit",
             "escrow.create", "escrow.release", "escrow.refund",
             "loan.disburse", "loan.repay",
             "subscription.create", "subscription.cancel", "subscription.pause",
             "subscription.resume", "subscription.sync",
             "subscription.execute", "subscription.retry"},
            [this](const std::string& routingKey, const std::string& message) {
                handleCommand(routingKey, message);
            }
        );
    }

    void handleCommand(const std::string& routingKey, const std::string& message) {
        std::cout << "[WalletCommandHandler] Received " << routingKey << std::endl;

        std::string requestId;
        try {
            auto json = nlohmann::json::parse(message);
            requestId = json.value("request_id", "");
            dispatch(routingKey, requestId, json);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[WalletCommandHandler] " << e.what() << std::endl;
            reject(routingKey, requestId, domain::OperationOutcome::failure(
                domain::ErrorCode::STORE_UNAVAILABLE, e.what()));
        } catch (const nlohmann::json::exception& e) {
            reject(routingKey, requestId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, std::string("Malformed command: ") + e.what()));
        } catch (const std::invalid_argument& e) {
            reject(routingKey, requestId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, e.what()));
        }
    }

    void dispatch(const std::string& routingKey, const std::string& requestId, const nlohmann::json& json) {
        if (routingKey == "wallet.open") {
            auto result = walletService_->openWallet(requireString(json, "owner_id"), json.value("currency", "USD"));
            reply(routingKey, requestId, result, accountPayload(result.account));
        } else if (routingKey == "wallet.topup") {
            auto result = walletService_->topUp(requireString(json, "owner_id"), requireId(json, "wallet_id"),
                                                amountOf(json), json.value("operation_id", ""));
            reply(routingKey, requestId, result, transferPayload(result));
        } else if (routingKey == "wallet.transfer") {
            auto result = walletService_->transfer(requireString(json, "owner_id"), requireId(json, "from_id"),
                                                   requireId(json, "to_id"), amountOf(json),
                                                   json.value("operation_id", ""));
            reply(routingKey, requestId, result, transferPayload(result));
        } else if (routingKey == "wallet.freeze") {
            auto result = walletService_->freeze(requireString(json, "owner_id"), requireId(json, "account_id"));
            reply(routingKey, requestId, result, accountPayload(result.account));
        } else if (routingKey == "wallet.unfreeze") {
            auto result = walletService_->unfreeze(requireString(json, "owner_id"), requireId(json, "account_id"));
            reply(routingKey, requestId, result, accountPayload(result.account));
        } else if (routingKey == "budget.create") {
            auto result = budgetService_->createCard(requireString(json, "owner_id"),
                                                     json.value("category", ""), optionalAmount(json, "monthly_limit"));
            reply(routingKey, requestId, result, accountPayload(result.account));
        } else if (routingKey == "budget.allocate") {
            auto result = budgetService_->allocate(requireString(json, "owner_id"), requireId(json, "wallet_id"),
                                                   requireId(json, "card_id"), amountOf(json),
                                                   json.value("operation_id", ""));
            reply(routingKey, requestId, result, transferPayload(result));
        } else if (routingKey == "budget.spend") {
            auto result = budgetService_->spend(requireString(json, "owner_id"), requireId(json, "card_id"),
                                                amountOf(json), json.value("description", ""),
                                                json.value("operation_id", ""));
            reply(routingKey, requestId, result, transferPayload(result));
        } else if (routingKey == "budget.limit") {
            auto result = budgetService_->setMonthlyLimit(requireString(json, "owner_id"), requireId(json, "card_id"),
                                                          optionalAmount(json, "monthly_limit"));
            reply(routingKey, requestId, result, accountPayload(result.account));
        } else if (routingKey == "escrow.create") {
            int64_t amount = json.contains("amount") ? amountOf(json) : 0;
            auto result = escrowService_->createOrder(domain::Caller::user(requireString(json, "owner_id")),
                                                      requireId(json, "wallet_id"),
                                                      requireString(json, "listing_id"), amount);
            reply(routingKey, requestId, result, orderPayload(result.order));
        } else if (routingKey == "escrow.release") {
            auto result = escrowService_->release(callerOf(json), requireString(json, "order_id"));
            reply(routingKey, requestId, result, orderPayload(result.order));
        } else if (routingKey == "escrow.refund") {
            auto result = escrowService_->refund(callerOf(json), requireString(json, "order_id"));
            reply(routingKey, requestId, result, orderPayload(result.order));
        } else if (routingKey == "loan.disburse") {
            auto result = loanService_->disburse(requireString(json, "owner_id"), requireId(json, "lender_wallet_id"),
                                                 requireId(json, "borrower_wallet_id"), amountOf(json));
            reply(routingKey, requestId, result, loanPayload(result));
        } else if (routingKey == "loan.repay") {
            auto result = loanService_->repay(requireString(json, "owner_id"), requireString(json, "loan_id"),
                                              amountOf(json), json.value("operation_id", ""));
            reply(routingKey, requestId, result, loanPayload(result));
        } else if (routingKey == "subscription.create") {
            ports::input::SubscriptionRequest request;
            request.ownerId = requireString(json, "owner_id");
            request.accountId = requireId(json, "account_id");
            request.serviceName = requireString(json, "service_name");
            request.category = json.value("category", "");
            request.amount = amountOf(json);
            request.billingCycle = domain::parseBillingCycle(json.value("billing_cycle", "monthly"));
            request.firstBillingDate = domain::Date::parse(requireString(json, "first_billing_date"));
            request.autoRenew = json.value("auto_renew", true);
            auto result = scheduler_->subscribe(request);
            reply(routingKey, requestId, result, subscriptionPayload(result.subscription));
        } else if (routingKey == "subscription.cancel") {
            auto result = scheduler_->cancel(requireString(json, "owner_id"), requireString(json, "subscription_id"));
            reply(routingKey, requestId, result, subscriptionPayload(result.subscription));
        } else if (routingKey == "subscription.pause") {
            auto result = scheduler_->pause(requireString(json, "owner_id"), requireString(json, "subscription_id"));
            reply(routingKey, requestId, result, subscriptionPayload(result.subscription));
        } else if (routingKey == "subscription.resume") {
            auto result = scheduler_->resume(requireString(json, "owner_id"), requireString(json, "subscription_id"),
                                             todayOf(json));
            reply(routingKey, requestId, result, subscriptionPayload(result.subscription));
        } else if (routingKey == "subscription.sync") {
            auto report = scheduler_->syncAll(todayOf(json));
            nlohmann::json payload;
            payload["synced"] = report.synced;
            payload["skipped"] = report.skipped;
            payload["created"] = report.created;
            payload["total_active"] = report.totalActive;
            reply(routingKey, requestId, domain::OperationOutcome::ok("Synced"), payload);
        } else if (routingKey == "subscription.execute") {
            auto report = scheduler_->executeDue(todayOf(json));
            nlohmann::json payload;
            payload["settled"] = report.settled;
            payload["failed"] = report.failed;
            payload["deferred"] = report.deferred;
            payload["paused"] = report.paused;
            reply(routingKey, requestId, domain::OperationOutcome::ok("Executed"), payload);
        } else if (routingKey == "subscription.retry") {
            auto outcome = scheduler_->retryObligation(requireString(json, "subscription_id"),
                                                       domain::Date::parse(requireString(json, "due_date")));
            reply(routingKey, requestId, outcome, nlohmann::json::object());
        } else {
            std::cout << "[WalletCommandHandler] Unknown command: " << routingKey << std::endl;
        }
    }

    // =========================================================================
    // Разбор полей
    // =========================================================================

    static std::string requireString(const nlohmann::json& json, const char* field) {
        if (!json.contains(field) || !json[field].is_string() || json[field].get<std::string>().empty()) {
            throw std::invalid_argument(std::string("Missing required field: ") + field);
        }
        return json[field].get<std::string>();
    }

    static domain::AccountId requireId(const nlohmann::json& json, const char* field) {
        if (!json.contains(field) || !json[field].is_number_integer()) {
            throw std::invalid_argument(std::string("Missing required field: ") + field);
        }
        return json[field].get<domain::AccountId>();
    }

    static int64_t amountOf(const nlohmann::json& json) {
        return domain::Money::parse(requireString(json, "amount")).cents;
    }

    static std::optional<int64_t> optionalAmount(const nlohmann::json& json, const char* field) {
        if (!json.contains(field) || json[field].is_null()) {
            return std::nullopt;
        }
        return domain::Money::parse(requireString(json, field)).cents;
    }

    static domain::Caller callerOf(const nlohmann::json& json) {
        if (json.value("role", "user") == "fulfillment") {
            return domain::Caller::fulfillment(json.value("owner_id", "fulfillment"));
        }
        return domain::Caller::user(requireString(json, "owner_id"));
    }

    static domain::Date todayOf(const nlohmann::json& json) {
        return json.contains("today") ? domain::Date::parse(requireString(json, "today")) : domain::Date::today();
    }

    // =========================================================================
    // Ответы
    // =========================================================================

    static nlohmann::json accountPayload(const std::optional<domain::Account>& account) {
        nlohmann::json payload = nlohmann::json::object();
        if (account) {
            payload["account_id"] = account->id;
            payload["kind"] = domain::toString(account->kind);
            payload["status"] = domain::toString(account->status);
            payload["balance"] = domain::Money(account->balance, account->currency).toString();
            payload["currency"] = account->currency;
        }
        return payload;
    }

    static nlohmann::json transferPayload(const domain::TransferResult& result) {
        nlohmann::json payload;
        payload["operation_id"] = result.operationId;
        payload["entries"] = nlohmann::json::array();
        for (const auto& entry : result.entries) {
            payload["entries"].push_back({
                {"account_id", entry.accountId},
                {"delta", domain::Money(entry.delta).toString()}
            });
        }
        return payload;
    }

    static nlohmann::json orderPayload(const std::optional<domain::EscrowOrder>& order) {
        nlohmann::json payload = nlohmann::json::object();
        if (order) {
            payload["order_id"] = order->orderId;
            payload["listing_id"] = order->listingId;
            payload["status"] = domain::toString(order->status);
            payload["amount"] = domain::Money(order->amount).toString();
            payload["escrow_account_id"] = order->escrowAccountId;
        }
        return payload;
    }

    static nlohmann::json loanPayload(const domain::LoanResult& result) {
        nlohmann::json payload = nlohmann::json::object();
        if (result.loan) {
            payload["loan_id"] = result.loan->loanId;
            payload["status"] = domain::toString(result.loan->status);
            payload["outstanding"] = domain::Money(result.outstanding).toString();
        }
        return payload;
    }

    static nlohmann::json subscriptionPayload(const std::optional<domain::Subscription>& subscription) {
        nlohmann::json payload = nlohmann::json::object();
        if (subscription) {
            payload["subscription_id"] = subscription->subscriptionId;
            payload["service_name"] = subscription->serviceName;
            payload["active"] = subscription->active;
            payload["auto_renew"] = subscription->autoRenew;
            payload["next_billing_date"] = subscription->nextBillingDate
                ? nlohmann::json(subscription->nextBillingDate->toString()) : nlohmann::json();
        }
        return payload;
    }

    void reply(const std::string& command, const std::string& requestId,
               const domain::OperationOutcome& outcome, nlohmann::json payload) {
        if (!outcome.isSuccess()) {
            reject(command, requestId, outcome);
            return;
        }
        payload["request_id"] = requestId;
        payload["code"] = domain::toString(outcome.code);
        payload["message"] = outcome.message;
        publishReply(command + ".succeeded", payload);
    }

    void reject(const std::string& command, const std::string& requestId, const domain::OperationOutcome& outcome) {
        std::cout << "[WalletCommandHandler] REJECTED " << command
                  << " code=" << domain::toString(outcome.code)
                  << " reason=" << outcome.message << std::endl;

        nlohmann::json payload;
        payload["request_id"] = requestId;
        payload["code"] = domain::toString(outcome.code);
        payload["message"] = outcome.message;
        payload["available"] = domain::Money(outcome.available).toString();
        payload["required"] = domain::Money(outcome.required).toString();
        payload["shortfall"] = domain::Money(outcome.shortfall()).toString();
        publishReply(command + ".rejected", payload);
    }

    void publishReply(const std::string& routingKey, const nlohmann::json& payload) {
        try {
            eventPublisher_->publish(routingKey, payload.dump());
        } catch (const std::exception& e) {
            std::cerr << "[WalletCommandHandler] Failed to publish " << routingKey << ": " << e.what() << std::endl;
        }
    }
};

} // namespace wallet::application
