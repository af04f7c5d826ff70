#pragma once

#include "domain/Account.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/EscrowOrder.hpp"
#include "domain/Loan.hpp"
#include "domain/Subscription.hpp"
#include "domain/ScheduledObligation.hpp"
#include "domain/Date.hpp"
#include "domain/Timestamp.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Результат попытки взять блокировку строки счёта
 */
enum class LockStatus {
    ACQUIRED,
    NOT_FOUND,
    TIMEOUT
};

/**
 * @brief Единица работы над хранилищем (одна транзакция БД)
 *
 * Блокировки строк (SELECT ... FOR UPDATE) держатся до commit или
 * до уничтожения сессии. Уничтожение без commit = rollback.
 *
 * Записи видны другим сессиям только после commit.
 * Чтения внутри сессии видят собственные незакоммиченные записи.
 *
 * Любой сбой хранилища (нет соединения, commit не прошёл) -
 * исключение domain::StoreUnavailableError.
 *
 * @example
 * ```cpp
 * auto session = store->begin();
 * if (session->lockAccount(42, 2s) != LockStatus::ACQUIRED) return;
 * auto account = session->readAccount(42);
 * account->balance -= 100;
 * session->writeAccount(*account);
 * session->commit();
 * ```
 */
class ILedgerSession {
public:
    virtual ~ILedgerSession() = default;

    // =========================================================================
    // Счета
    // =========================================================================

    /**
     * @brief Заблокировать строку счёта с ограниченным ожиданием
     *
     * Повторный вызов для уже заблокированного этой сессией счёта - ACQUIRED.
     * После TIMEOUT сессию нужно бросить: операция прерывается целиком.
     */
    virtual LockStatus lockAccount(domain::AccountId id, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<domain::Account> readAccount(domain::AccountId id) = 0;

    /**
     * @brief Записать счёт (строка должна быть заблокирована этой сессией)
     */
    virtual void writeAccount(const domain::Account& account) = 0;

    /**
     * @brief Создать счёт, вернуть назначенный ID
     *
     * Новая строка считается заблокированной этой сессией до commit.
     */
    virtual domain::AccountId createAccount(const domain::Account& account) = 0;

    // =========================================================================
    // Журнал
    // =========================================================================

    /**
     * @brief Зарегистрировать operationId (уникальный ключ)
     * @return false если операция с таким ID уже записана
     */
    virtual bool recordOperation(const std::string& operationId, domain::EntryReason reason) = 0;

    /**
     * @brief Дописать запись журнала, вернуть её с назначенным entryId
     */
    virtual domain::LedgerEntry appendEntry(const domain::LedgerEntry& entry) = 0;

    /**
     * @brief Сумма дельт счёта по причине начиная с момента since
     */
    virtual int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                               const domain::Timestamp& since) = 0;

    // =========================================================================
    // Escrow, займы, подписки
    // =========================================================================

    virtual std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) = 0;
    virtual void saveOrder(const domain::EscrowOrder& order) = 0;

    virtual std::optional<domain::Loan> findLoan(const std::string& loanId) = 0;
    virtual void saveLoan(const domain::Loan& loan) = 0;

    virtual std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) = 0;
    virtual void saveSubscription(const domain::Subscription& subscription) = 0;

    virtual std::optional<domain::ScheduledObligation> findObligation(
        const std::string& subscriptionId, const domain::Date& dueDate) = 0;

    /**
     * @brief Вставить обязательство, если пары (subscriptionId, dueDate) ещё нет
     * @return false если такое обязательство уже существует
     */
    virtual bool insertObligation(const domain::ScheduledObligation& obligation) = 0;

    virtual void updateObligation(const domain::ScheduledObligation& obligation) = 0;

    // =========================================================================

    virtual void commit() = 0;
};

/**
 * @brief Хранилище журнала: счета, записи, заказы, займы, подписки
 *
 * Реализации: PostgresLedgerStore (прод), InMemoryLedgerStore (тесты, demo).
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Открыть транзакцию
     */
    virtual std::unique_ptr<ILedgerSession> begin() = 0;

    // Чтения вне транзакции (последнее закоммиченное состояние)

    virtual std::optional<domain::Account> findAccount(domain::AccountId id) = 0;
    virtual std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) = 0;
    virtual std::vector<domain::Account> allAccounts() = 0;

    virtual std::vector<domain::LedgerEntry> entriesForAccount(domain::AccountId id) = 0;
    virtual std::vector<domain::LedgerEntry> entriesForOperation(const std::string& operationId) = 0;
    virtual std::vector<domain::LedgerEntry> allEntries() = 0;
    virtual int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                               const domain::Timestamp& since) = 0;

    virtual std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) = 0;
    virtual std::optional<domain::Loan> findLoan(const std::string& loanId) = 0;

    virtual std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) = 0;
    virtual std::vector<domain::Subscription> activeSubscriptions() = 0;

    virtual std::vector<domain::ScheduledObligation> obligationsDueBy(const domain::Date& date) = 0;
    virtual std::vector<domain::ScheduledObligation> obligationsForSubscription(
        const std::string& subscriptionId) = 0;
};

} // namespace wallet::ports::output
