#pragma once

#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/LockCoordinator.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/TransferRequest.hpp"
#include "domain/OperationResult.hpp"
#include "domain/Money.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <set>
#include <map>
#include <thread>

namespace wallet::application {

/**
 * @brief Единственный путь изменения балансов
 *
 * Алгоритм applyTransfer:
 * 1. Проверка формы запроса (operationId, ненулевые дельты, без повторов счетов)
 * 2. Порядок блокировок от LockCoordinator
 * 3. Захват строк в этом порядке с ограниченным ожиданием
 * 4. Регистрация operationId (уникальный ключ) - повтор = DUPLICATE_OPERATION
 * 5. guard (переход состояния заказа/займа/обязательства под теми же блокировками)
 * 6. Проверка статусов и балансов по свежему чтению под блокировкой
 * 7. Запись балансов (version + 1), записи журнала, commit
 *
 * Любой выход до commit откатывает сессию: блокировки освобождаются
 * деструктором ILedgerSession.
 *
 * Сохранение денег: для INTERNAL-причин сумма дельт по счетам с деньгами
 * равна нулю; TOPUP только зачисляет, BUDGET_SPEND/SUBSCRIPTION_CHARGE
 * только списывают. LOAN-счета (memo) в сумму не входят.
 */
class TransferEngine : public ports::input::ITransferService {
public:
    TransferEngine(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[TransferEngine] Created" << std::endl;
    }

    domain::TransferResult applyTransfer(
        const domain::TransferRequest& request,
        const ports::input::TransferGuard& guard = nullptr) override
    {
        auto invalid = validateShape(request);
        if (!invalid.isSuccess()) {
            return reject(request, invalid);
        }

        std::vector<domain::AccountId> ids;
        for (const auto& move : request.moves) {
            ids.push_back(move.accountId);
        }
        auto lockOrder = LockCoordinator::order(ids);

        domain::TransferResult result;
        {
            auto session = store_->begin();

            std::map<domain::AccountId, domain::Account> accounts;
            for (auto id : lockOrder) {
                auto status = session->lockAccount(id, settings_->getLockTimeout());
                if (status == ports::output::LockStatus::NOT_FOUND) {
                    return reject(request, domain::OperationOutcome::failure(
                        domain::ErrorCode::ACCOUNT_NOT_FOUND,
                        "Account not found: " + std::to_string(id)));
                }
                if (status == ports::output::LockStatus::TIMEOUT) {
                    return reject(request, domain::OperationOutcome::failure(
                        domain::ErrorCode::LOCK_TIMEOUT,
                        "Timed out waiting for lock on account " + std::to_string(id)));
                }
                auto account = session->readAccount(id);
                if (!account) {
                    return reject(request, domain::OperationOutcome::failure(
                        domain::ErrorCode::ACCOUNT_NOT_FOUND,
                        "Account not found: " + std::to_string(id)));
                }
                accounts.emplace(id, *account);
            }

            if (!session->recordOperation(request.operationId, request.reason)) {
                session.reset();
                return duplicate(request);
            }

            auto flow = validateFlow(request, accounts);
            if (!flow.isSuccess()) {
                return reject(request, flow);
            }

            if (guard) {
                auto verdict = guard(*session);
                if (!verdict.isSuccess()) {
                    return reject(request, verdict);
                }
                // guard мог изменить счета (например, закрыть их) - перечитываем
                for (auto& [id, account] : accounts) {
                    auto fresh = session->readAccount(id);
                    if (fresh) {
                        account = *fresh;
                    }
                }
            }

            for (const auto& move : request.moves) {
                const auto& account = accounts.at(move.accountId);
                if (!account.isActive()) {
                    return reject(request, domain::OperationOutcome::failure(
                        domain::ErrorCode::ACCOUNT_FROZEN,
                        "Account " + std::to_string(account.id) + " is " +
                        domain::toString(account.status)));
                }
                int64_t newBalance = account.balance + move.delta;
                if (newBalance < 0) {
                    int64_t required = -move.delta;
                    return reject(request, domain::OperationOutcome::failure(
                        domain::ErrorCode::INSUFFICIENT_FUNDS,
                        "Insufficient funds on account " + std::to_string(account.id) +
                        ": short by " + domain::Money::format(required - account.balance, account.currency),
                        account.balance, required));
                }
            }

            auto now = domain::Timestamp::now();
            for (const auto& move : request.moves) {
                auto account = accounts.at(move.accountId);
                account.balance += move.delta;
                account.version += 1;
                session->writeAccount(account);

                domain::LedgerEntry entry;
                entry.accountId = move.accountId;
                entry.delta = move.delta;
                entry.operationId = request.operationId;
                entry.reason = request.reason;
                entry.description = request.description;
                entry.createdAt = now;
                result.entries.push_back(session->appendEntry(entry));
            }

            session->commit();
        }

        result.operationId = request.operationId;
        result.message = "Applied";

        std::cout << "[TransferEngine] Applied " << request.operationId
                  << " reason=" << domain::toString(request.reason)
                  << " moves=" << request.moves.size() << std::endl;

        publishApplied(result, request.reason);
        return result;
    }

    domain::TransferResult applyWithRetry(
        const domain::TransferRequest& request,
        const ports::input::TransferGuard& guard = nullptr) override
    {
        int retries = settings_->getLockRetries();
        for (int attempt = 0;; ++attempt) {
            auto result = applyTransfer(request, guard);
            if (!domain::isRetryable(result.code) || attempt >= retries) {
                return result;
            }
            std::cout << "[TransferEngine] Retrying " << request.operationId
                      << " after LOCK_TIMEOUT (attempt " << (attempt + 1) << ")" << std::endl;
            std::this_thread::sleep_for(settings_->getRetryBackoff() * (attempt + 1));
        }
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static domain::OperationOutcome validateShape(const domain::TransferRequest& request) {
        using domain::ErrorCode;
        using domain::OperationOutcome;

        if (request.operationId.empty()) {
            return OperationOutcome::failure(ErrorCode::INVALID_REQUEST, "Missing operation id");
        }
        if (request.moves.empty()) {
            return OperationOutcome::failure(ErrorCode::INVALID_REQUEST, "Transfer has no moves");
        }
        std::set<domain::AccountId> seen;
        for (const auto& move : request.moves) {
            if (move.delta == 0) {
                return OperationOutcome::failure(ErrorCode::INVALID_REQUEST,
                    "Zero delta for account " + std::to_string(move.accountId));
            }
            if (!seen.insert(move.accountId).second) {
                return OperationOutcome::failure(ErrorCode::INVALID_REQUEST,
                    "Account " + std::to_string(move.accountId) + " appears twice");
            }
        }
        return OperationOutcome::ok();
    }

    // Вид счёта известен только после чтения под блокировкой
    static domain::OperationOutcome validateFlow(
        const domain::TransferRequest& request,
        const std::map<domain::AccountId, domain::Account>& accounts)
    {
        using domain::ErrorCode;
        using domain::FlowDirection;
        using domain::OperationOutcome;

        auto flow = domain::flowOf(request.reason);
        int64_t sum = 0;
        for (const auto& move : request.moves) {
            const auto& account = accounts.at(move.accountId);
            if (!account.holdsFunds()) {
                continue;
            }
            if (flow == FlowDirection::INFLOW && move.delta < 0) {
                return OperationOutcome::failure(ErrorCode::INVALID_REQUEST,
                    domain::toString(request.reason) + " can only credit accounts");
            }
            if (flow == FlowDirection::OUTFLOW && move.delta > 0) {
                return OperationOutcome::failure(ErrorCode::INVALID_REQUEST,
                    domain::toString(request.reason) + " can only debit accounts");
            }
            sum += move.delta;
        }
        if (flow == FlowDirection::INTERNAL && sum != 0) {
            return OperationOutcome::failure(ErrorCode::INVALID_REQUEST,
                "Moves do not balance: net " + domain::Money::format(sum));
        }
        return OperationOutcome::ok();
    }

    domain::TransferResult reject(const domain::TransferRequest& request,
                                  const domain::OperationOutcome& outcome) {
        std::cout << "[TransferEngine] Rejected " << request.operationId
                  << " code=" << domain::toString(outcome.code)
                  << " reason=" << outcome.message << std::endl;
        return domain::TransferResult::from(outcome, request.operationId);
    }

    domain::TransferResult duplicate(const domain::TransferRequest& request) {
        std::cout << "[TransferEngine] Already applied: " << request.operationId << std::endl;
        auto result = domain::TransferResult::from(domain::OperationOutcome::failure(
            domain::ErrorCode::DUPLICATE_OPERATION,
            "Operation already applied: " + request.operationId), request.operationId);
        result.entries = store_->entriesForOperation(request.operationId);
        return result;
    }

    void publishApplied(const domain::TransferResult& result, domain::EntryReason reason) {
        try {
            nlohmann::json event;
            event["operation_id"] = result.operationId;
            event["reason"] = domain::toString(reason);
            event["moves"] = nlohmann::json::array();
            for (const auto& entry : result.entries) {
                event["moves"].push_back({
                    {"account_id", entry.accountId},
                    {"delta", domain::Money(entry.delta).toString()}
                });
            }
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish("ledger.transfer.applied", event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[TransferEngine] Failed to publish event: " << e.what() << std::endl;
        }
    }
};

} // namespace wallet::application
