#pragma once

#include "ports/input/IEscrowService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IListingCatalog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/AccountAccess.hpp"
#include "domain/Money.hpp"
#include "domain/StoreUnavailableError.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace wallet::application {

/**
 * @brief Escrow-заказы маркетплейса
 *
 * PENDING → HELD → RELEASED | REFUNDED
 *
 * Каждый переход выполняется guard'ом внутри перевода TransferEngine,
 * под блокировкой escrow-счёта. Параллельные release и refund одного
 * заказа сериализуются на этой блокировке: второй видит терминальный
 * статус и получает INVALID_STATE_TRANSITION, деньги не двигаются.
 *
 * operationId переходов детерминированы:
 * - escrow-hold:<orderId>
 * - escrow-release:<orderId>
 * - escrow-refund:<orderId>
 * Повтор того же перехода = DUPLICATE_OPERATION (успех).
 *
 * Объявление снимается с продажи (IListingCatalog::markSold) до удержания,
 * поэтому до HELD доходит не больше одного покупателя. Неудачное удержание
 * и успешный возврат возвращают объявление в продажу.
 */
class EscrowService : public ports::input::IEscrowService {
public:
    EscrowService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::ITransferService> transfers,
        std::shared_ptr<ports::output::IListingCatalog> catalog,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : store_(std::move(store))
      , transfers_(std::move(transfers))
      , catalog_(std::move(catalog))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[EscrowService] Created" << std::endl;
    }

    domain::EscrowResult createOrder(const domain::Caller& buyer, domain::AccountId buyerWalletId,
                                     const std::string& listingId, int64_t amountCents) override {
        auto listing = catalog_->findListing(listingId);
        if (!listing || !listing->available) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::LISTING_UNAVAILABLE, "Listing " + listingId + " is not available"));
        }

        int64_t amount = amountCents == 0 ? listing->price : amountCents;
        if (amount != listing->price) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST,
                "Amount " + domain::Money::format(amount) + " does not match listing price " +
                domain::Money::format(listing->price)));
        }
        if (amount <= 0) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Listing has no price"));
        }

        auto wallet = loadOwned(*store_, buyerWalletId, buyer.ownerId, domain::AccountKind::WALLET);
        if (!wallet.outcome.isSuccess()) {
            return reject("createOrder", wallet.outcome);
        }
        if (listing->sellerAccountId == buyerWalletId) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Cannot buy your own listing"));
        }
        if (!store_->findAccount(listing->sellerAccountId)) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::ACCOUNT_NOT_FOUND,
                "Seller account not found: " + std::to_string(listing->sellerAccountId)));
        }

        // Быстрый отказ до создания заказа; окончательно баланс проверит TransferEngine
        if (wallet.account->balance < amount) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::INSUFFICIENT_FUNDS,
                "Insufficient funds: short by " + domain::Money::format(amount - wallet.account->balance),
                wallet.account->balance, amount));
        }

        if (!catalog_->markSold(listingId)) {
            return reject("createOrder", domain::OperationOutcome::failure(
                domain::ErrorCode::LISTING_UNAVAILABLE, "Listing " + listingId + " is already sold"));
        }

        domain::EscrowOrder order;
        order.orderId = utils::IdGenerator::next("ord");
        order.listingId = listingId;
        order.buyerAccountId = buyerWalletId;
        order.sellerAccountId = listing->sellerAccountId;
        order.amount = amount;
        order.status = domain::EscrowStatus::PENDING;
        order.createdAt = domain::Timestamp::now();

        try {
            auto session = store_->begin();
            domain::Account escrow(0, "escrow:" + order.orderId, domain::AccountKind::ESCROW);
            escrow.currency = wallet.account->currency;
            order.escrowAccountId = session->createAccount(escrow);
            session->saveOrder(order);
            session->commit();
        } catch (const domain::StoreUnavailableError&) {
            reopenListing(listingId);
            throw;
        }

        std::cout << "[EscrowService] Order " << order.orderId << " PENDING, escrow account "
                  << order.escrowAccountId << std::endl;

        return holdClaimed(order);
    }

    /**
     * @brief Повторить удержание PENDING заказа
     *
     * Объявление заказа снова снимается с продажи; если его успели
     * купить, заказ остаётся PENDING с LISTING_UNAVAILABLE.
     */
    domain::EscrowResult hold(const std::string& orderId) override {
        auto order = store_->findOrder(orderId);
        if (!order) {
            return reject("hold", notFound(orderId));
        }
        if (order->status == domain::EscrowStatus::PENDING && !catalog_->markSold(order->listingId)) {
            auto result = reject("hold", domain::OperationOutcome::failure(
                domain::ErrorCode::LISTING_UNAVAILABLE, "Listing " + order->listingId + " is already sold"));
            result.order = order;
            return result;
        }
        return holdClaimed(*order);
    }

    domain::EscrowResult release(const domain::Caller& caller, const std::string& orderId) override {
        auto order = store_->findOrder(orderId);
        if (!order) {
            return reject("release", notFound(orderId));
        }
        auto auth = authorize(caller, *order);
        if (!auth.isSuccess()) {
            return reject("release", auth);
        }
        return transition(*order, domain::EscrowStatus::RELEASED, domain::EntryReason::ESCROW_RELEASE,
                          "escrow-release:",
                          {{order->escrowAccountId, -order->amount}, {order->sellerAccountId, order->amount}});
    }

    domain::EscrowResult refund(const domain::Caller& caller, const std::string& orderId) override {
        auto order = store_->findOrder(orderId);
        if (!order) {
            return reject("refund", notFound(orderId));
        }
        auto auth = authorize(caller, *order);
        if (!auth.isSuccess()) {
            return reject("refund", auth);
        }
        auto result = transition(*order, domain::EscrowStatus::REFUNDED, domain::EntryReason::ESCROW_REFUND,
                                 "escrow-refund:",
                                 {{order->escrowAccountId, -order->amount}, {order->buyerAccountId, order->amount}});
        if (result.code == domain::ErrorCode::NONE) {
            reopenListing(order->listingId);
        }
        return result;
    }

    std::optional<domain::EscrowOrder> getOrder(const std::string& orderId) override {
        return store_->findOrder(orderId);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::ITransferService> transfers_;
    std::shared_ptr<ports::output::IListingCatalog> catalog_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    /**
     * @brief Удержание при уже снятом с продажи объявлении
     */
    domain::EscrowResult holdClaimed(const domain::EscrowOrder& order) {
        domain::EscrowResult result;
        try {
            result = transition(order, domain::EscrowStatus::HELD, domain::EntryReason::ESCROW_HOLD,
                                "escrow-hold:",
                                {{order.buyerAccountId, -order.amount}, {order.escrowAccountId, order.amount}});
        } catch (const domain::StoreUnavailableError&) {
            reopenListing(order.listingId);
            throw;
        }
        if (!result.isSuccess()) {
            reopenListing(order.listingId);
        }
        return result;
    }

    void reopenListing(const std::string& listingId) {
        try {
            catalog_->reopen(listingId);
            std::cout << "[EscrowService] Listing " << listingId << " is back on sale" << std::endl;
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[EscrowService] Listing " << listingId << " stays sold, catalog unavailable: "
                      << e.what() << std::endl;
        }
    }

    /**
     * @brief release/refund: продавец заказа или событие fulfillment
     */
    domain::OperationOutcome authorize(const domain::Caller& caller, const domain::EscrowOrder& order) {
        if (caller.isFulfillment()) {
            return domain::OperationOutcome::ok();
        }
        auto seller = store_->findAccount(order.sellerAccountId);
        if (seller && seller->ownerId == caller.ownerId) {
            return domain::OperationOutcome::ok();
        }
        return domain::OperationOutcome::failure(domain::ErrorCode::UNAUTHORIZED,
            caller.ownerId + " is not the seller of order " + order.orderId);
    }

    domain::EscrowResult transition(const domain::EscrowOrder& order, domain::EscrowStatus target,
                                    domain::EntryReason reason, const std::string& opPrefix,
                                    std::vector<domain::TransferMove> moves) {
        domain::TransferRequest request;
        request.operationId = opPrefix + order.orderId;
        request.reason = reason;
        request.moves = std::move(moves);
        request.description = "Order " + order.orderId + " " + domain::toString(target);

        const std::string orderId = order.orderId;
        auto result = transfers_->applyWithRetry(request,
            [orderId, target](ports::output::ILedgerSession& session) {
                auto current = session.findOrder(orderId);
                if (!current) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::NOT_FOUND,
                                                             "Order not found: " + orderId);
                }
                auto expected = target == domain::EscrowStatus::HELD
                    ? domain::EscrowStatus::PENDING : domain::EscrowStatus::HELD;
                if (current->status != expected) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Order " + orderId + " is " + domain::toString(current->status) +
                        ", expected " + domain::toString(expected));
                }
                current->status = target;
                if (domain::isTerminal(target)) {
                    current->resolvedAt = domain::Timestamp::now();
                }
                session.saveOrder(*current);
                return domain::OperationOutcome::ok();
            });

        auto escrowResult = domain::EscrowResult::from(result);
        escrowResult.order = store_->findOrder(orderId);

        if (!result.isSuccess()) {
            std::cout << "[EscrowService] " << domain::toString(target) << " failed for " << orderId
                      << ": " << result.message << std::endl;
            return escrowResult;
        }

        if (result.code == domain::ErrorCode::NONE) {
            std::cout << "[EscrowService] Order " << orderId << " -> " << domain::toString(target) << std::endl;
            publishTransition(*escrowResult.order, target);
        }
        return escrowResult;
    }

    void publishTransition(const domain::EscrowOrder& order, domain::EscrowStatus status) {
        try {
            nlohmann::json event;
            event["order_id"] = order.orderId;
            event["listing_id"] = order.listingId;
            event["buyer_account_id"] = order.buyerAccountId;
            event["seller_account_id"] = order.sellerAccountId;
            event["amount"] = domain::Money(order.amount).toString();
            event["status"] = domain::toString(status);
            event["timestamp"] = domain::Timestamp::now().toString();

            std::string routingKey = status == domain::EscrowStatus::HELD ? "escrow.held"
                : status == domain::EscrowStatus::RELEASED ? "escrow.released" : "escrow.refunded";
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[EscrowService] Failed to publish event: " << e.what() << std::endl;
        }
    }

    static domain::OperationOutcome notFound(const std::string& orderId) {
        return domain::OperationOutcome::failure(domain::ErrorCode::NOT_FOUND, "Order not found: " + orderId);
    }

    static domain::EscrowResult reject(const char* operation, const domain::OperationOutcome& outcome) {
        std::cout << "[EscrowService] " << operation << " rejected: " << outcome.message << std::endl;
        return domain::EscrowResult::from(outcome);
    }
};

} // namespace wallet::application
