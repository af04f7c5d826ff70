// include/adapters/secondary/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/StoreUnavailableError.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <utility>

namespace wallet::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища журнала
 *
 * Таблицы:
 * - ledger_accounts: account_id BIGSERIAL PK, owner_id, kind, status, balance BIGINT,
 *   version BIGINT, currency, category, monthly_limit BIGINT NULL, created_at BIGINT (ms)
 * - ledger_operations: operation_id PK - ключ идемпотентности переводов
 * - ledger_entries: entry_id BIGSERIAL PK, account_id, delta, operation_id, reason, ...
 * - escrow_orders, loans, subscriptions
 * - scheduled_obligations: UNIQUE (subscription_id, due_date)
 *
 * Одна сессия = одно соединение + одна транзакция.
 * lockAccount: SET LOCAL lock_timeout + SELECT ... FOR UPDATE.
 * SQLSTATE 55P03 (lock_not_available) → LockStatus::TIMEOUT.
 * Потеря соединения и прочие сбои БД → domain::StoreUnavailableError.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
    static constexpr const char* ACCOUNT_COLUMNS =
        "account_id, owner_id, kind, status, balance, version, currency, category, "
        "monthly_limit, created_at";

    static constexpr const char* ENTRY_COLUMNS =
        "entry_id, account_id, delta, operation_id, reason, description, created_at";

    static constexpr const char* ORDER_COLUMNS =
        "order_id, listing_id, buyer_account_id, seller_account_id, escrow_account_id, "
        "amount, status, created_at, resolved_at";

    static constexpr const char* LOAN_COLUMNS =
        "loan_id, loan_account_id, lender_account_id, borrower_account_id, principal, "
        "status, created_at, repaid_at";

    static constexpr const char* SUBSCRIPTION_COLUMNS =
        "subscription_id, owner_id, account_id, service_name, category, amount, billing_cycle, "
        "to_char(next_billing_date, 'YYYY-MM-DD') AS next_billing_date, "
        "to_char(last_payment_date, 'YYYY-MM-DD') AS last_payment_date, "
        "is_active, auto_renew, created_at, cancelled_at";

    static constexpr const char* OBLIGATION_COLUMNS =
        "obligation_id, subscription_id, account_id, amount, "
        "to_char(due_date, 'YYYY-MM-DD') AS due_date, materialized, status, failure_reason, "
        "created_at, settled_at";

    class Session : public ports::output::ILedgerSession {
    public:
        explicit Session(const std::string& connectionString) {
            run("begin", [&] {
                conn_ = std::make_unique<pqxx::connection>(connectionString);
                txn_ = std::make_unique<pqxx::work>(*conn_);
            });
        }

        // Транзакция без commit откатывается деструктором pqxx::work
        ~Session() override = default;

        ports::output::LockStatus lockAccount(domain::AccountId id,
                                              std::chrono::milliseconds timeout) override {
            if (locked_.count(id)) {
                return ports::output::LockStatus::ACQUIRED;
            }
            try {
                txn_->exec("SET LOCAL lock_timeout = '" + std::to_string(timeout.count()) + "ms'");
                auto result = txn_->exec_params(
                    "SELECT account_id FROM ledger_accounts WHERE account_id = $1 FOR UPDATE", id);
                if (result.empty()) {
                    return ports::output::LockStatus::NOT_FOUND;
                }
                locked_.insert(id);
                return ports::output::LockStatus::ACQUIRED;
            } catch (const pqxx::sql_error& e) {
                if (e.sqlstate() == "55P03") {
                    std::cout << "[PostgresLedgerStore] Lock timeout on account " << id << std::endl;
                    return ports::output::LockStatus::TIMEOUT;
                }
                std::cerr << "[PostgresLedgerStore] lockAccount error: " << e.what() << std::endl;
                throw domain::StoreUnavailableError(e.what());
            } catch (const pqxx::failure& e) {
                std::cerr << "[PostgresLedgerStore] lockAccount error: " << e.what() << std::endl;
                throw domain::StoreUnavailableError(e.what());
            }
        }

        std::optional<domain::Account> readAccount(domain::AccountId id) override {
            return run("readAccount", [&]() -> std::optional<domain::Account> {
                auto result = txn_->exec_params(
                    std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM ledger_accounts WHERE account_id = $1", id);
                if (result.empty()) {
                    return std::nullopt;
                }
                return toAccount(result[0]);
            });
        }

        void writeAccount(const domain::Account& account) override {
            if (!locked_.count(account.id)) {
                throw std::logic_error("Account " + std::to_string(account.id) +
                                       " written without row lock");
            }
            run("writeAccount", [&] {
                txn_->exec_params(
                    "UPDATE ledger_accounts SET status = $2, balance = $3, version = $4, "
                    "category = $5, monthly_limit = $6 WHERE account_id = $1",
                    account.id,
                    domain::toString(account.status),
                    account.balance,
                    account.version,
                    account.category,
                    account.monthlyLimit);
            });
        }

        domain::AccountId createAccount(const domain::Account& account) override {
            return run("createAccount", [&] {
                auto result = txn_->exec_params(
                    "INSERT INTO ledger_accounts (owner_id, kind, status, balance, version, currency, "
                    "category, monthly_limit, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) RETURNING account_id",
                    account.ownerId,
                    domain::toString(account.kind),
                    domain::toString(account.status),
                    account.balance,
                    account.version,
                    account.currency,
                    account.category,
                    account.monthlyLimit,
                    account.createdAt.toUnixMillis());
                auto id = result[0][0].as<domain::AccountId>();
                locked_.insert(id);
                return id;
            });
        }

        bool recordOperation(const std::string& operationId, domain::EntryReason reason) override {
            return run("recordOperation", [&] {
                auto result = txn_->exec_params(
                    "INSERT INTO ledger_operations (operation_id, reason, created_at) "
                    "VALUES ($1, $2, $3) ON CONFLICT (operation_id) DO NOTHING RETURNING operation_id",
                    operationId,
                    domain::toString(reason),
                    domain::Timestamp::now().toUnixMillis());
                return !result.empty();
            });
        }

        domain::LedgerEntry appendEntry(const domain::LedgerEntry& entry) override {
            return run("appendEntry", [&] {
                auto result = txn_->exec_params(
                    "INSERT INTO ledger_entries (account_id, delta, operation_id, reason, description, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6) RETURNING entry_id",
                    entry.accountId,
                    entry.delta,
                    entry.operationId,
                    domain::toString(entry.reason),
                    entry.description,
                    entry.createdAt.toUnixMillis());
                domain::LedgerEntry copy = entry;
                copy.entryId = result[0][0].as<int64_t>();
                return copy;
            });
        }

        int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                           const domain::Timestamp& since) override {
            return run("sumEntries", [&] {
                return sumQuery(*txn_, accountId, reason, since);
            });
        }

        std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) override {
            return run("findOrder", [&] { return orderQuery(*txn_, orderId); });
        }

        void saveOrder(const domain::EscrowOrder& order) override {
            run("saveOrder", [&] {
                std::optional<int64_t> resolvedAt;
                if (order.resolvedAt) {
                    resolvedAt = order.resolvedAt->toUnixMillis();
                }
                txn_->exec_params(
                    "INSERT INTO escrow_orders (order_id, listing_id, buyer_account_id, seller_account_id, "
                    "escrow_account_id, amount, status, created_at, resolved_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) "
                    "ON CONFLICT (order_id) DO UPDATE SET status = EXCLUDED.status, "
                    "resolved_at = EXCLUDED.resolved_at",
                    order.orderId,
                    order.listingId,
                    order.buyerAccountId,
                    order.sellerAccountId,
                    order.escrowAccountId,
                    order.amount,
                    domain::toString(order.status),
                    order.createdAt.toUnixMillis(),
                    resolvedAt);
            });
        }

        std::optional<domain::Loan> findLoan(const std::string& loanId) override {
            return run("findLoan", [&] { return loanQuery(*txn_, loanId); });
        }

        void saveLoan(const domain::Loan& loan) override {
            run("saveLoan", [&] {
                std::optional<int64_t> repaidAt;
                if (loan.repaidAt) {
                    repaidAt = loan.repaidAt->toUnixMillis();
                }
                txn_->exec_params(
                    "INSERT INTO loans (loan_id, loan_account_id, lender_account_id, borrower_account_id, "
                    "principal, status, created_at, repaid_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) "
                    "ON CONFLICT (loan_id) DO UPDATE SET status = EXCLUDED.status, "
                    "repaid_at = EXCLUDED.repaid_at",
                    loan.loanId,
                    loan.loanAccountId,
                    loan.lenderAccountId,
                    loan.borrowerAccountId,
                    loan.principal,
                    domain::toString(loan.status),
                    loan.createdAt.toUnixMillis(),
                    repaidAt);
            });
        }

        std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) override {
            return run("findSubscription", [&] { return subscriptionQuery(*txn_, subscriptionId); });
        }

        void saveSubscription(const domain::Subscription& s) override {
            run("saveSubscription", [&] {
                std::optional<std::string> next;
                std::optional<std::string> last;
                std::optional<int64_t> cancelledAt;
                if (s.nextBillingDate) next = s.nextBillingDate->toString();
                if (s.lastPaymentDate) last = s.lastPaymentDate->toString();
                if (s.cancelledAt) cancelledAt = s.cancelledAt->toUnixMillis();

                txn_->exec_params(
                    "INSERT INTO subscriptions (subscription_id, owner_id, account_id, service_name, category, "
                    "amount, billing_cycle, next_billing_date, last_payment_date, is_active, auto_renew, "
                    "created_at, cancelled_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::date, $9::date, $10, $11, $12, $13) "
                    "ON CONFLICT (subscription_id) DO UPDATE SET "
                    "amount = EXCLUDED.amount, billing_cycle = EXCLUDED.billing_cycle, "
                    "next_billing_date = EXCLUDED.next_billing_date, "
                    "last_payment_date = EXCLUDED.last_payment_date, "
                    "is_active = EXCLUDED.is_active, auto_renew = EXCLUDED.auto_renew, "
                    "cancelled_at = EXCLUDED.cancelled_at",
                    s.subscriptionId,
                    s.ownerId,
                    s.accountId,
                    s.serviceName,
                    s.category,
                    s.amount,
                    domain::toString(s.billingCycle),
                    next,
                    last,
                    s.active,
                    s.autoRenew,
                    s.createdAt.toUnixMillis(),
                    cancelledAt);
            });
        }

        std::optional<domain::ScheduledObligation> findObligation(
            const std::string& subscriptionId, const domain::Date& dueDate) override {
            return run("findObligation", [&]() -> std::optional<domain::ScheduledObligation> {
                auto result = txn_->exec_params(
                    std::string("SELECT ") + OBLIGATION_COLUMNS +
                    " FROM scheduled_obligations WHERE subscription_id = $1 AND due_date = $2::date",
                    subscriptionId, dueDate.toString());
                if (result.empty()) {
                    return std::nullopt;
                }
                return toObligation(result[0]);
            });
        }

        bool insertObligation(const domain::ScheduledObligation& o) override {
            return run("insertObligation", [&] {
                auto result = txn_->exec_params(
                    "INSERT INTO scheduled_obligations (obligation_id, subscription_id, account_id, amount, "
                    "due_date, materialized, status, failure_reason, created_at) "
                    "VALUES ($1, $2, $3, $4, $5::date, $6, $7, $8, $9) "
                    "ON CONFLICT (subscription_id, due_date) DO NOTHING RETURNING obligation_id",
                    o.obligationId,
                    o.subscriptionId,
                    o.accountId,
                    o.amount,
                    o.dueDate.toString(),
                    o.materialized,
                    domain::toString(o.status),
                    o.failureReason,
                    o.createdAt.toUnixMillis());
                return !result.empty();
            });
        }

        void updateObligation(const domain::ScheduledObligation& o) override {
            run("updateObligation", [&] {
                std::optional<int64_t> settledAt;
                if (o.settledAt) {
                    settledAt = o.settledAt->toUnixMillis();
                }
                txn_->exec_params(
                    "UPDATE scheduled_obligations SET materialized = $3, status = $4, "
                    "failure_reason = $5, settled_at = $6 "
                    "WHERE subscription_id = $1 AND due_date = $2::date",
                    o.subscriptionId,
                    o.dueDate.toString(),
                    o.materialized,
                    domain::toString(o.status),
                    o.failureReason,
                    settledAt);
            });
        }

        void commit() override {
            run("commit", [&] { txn_->commit(); });
        }

    private:
        std::unique_ptr<pqxx::connection> conn_;
        std::unique_ptr<pqxx::work> txn_;
        std::set<domain::AccountId> locked_;
    };

public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedgerStore] Ledger at " << settings_->describe() << std::endl;
        initSchema();
    }

    std::unique_ptr<ports::output::ILedgerSession> begin() override {
        return std::make_unique<Session>(settings_->getConnectionString());
    }

    std::optional<domain::Account> findAccount(domain::AccountId id) override {
        return read("findAccount", [&](pqxx::work& txn) -> std::optional<domain::Account> {
            auto result = txn.exec_params(
                std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM ledger_accounts WHERE account_id = $1", id);
            if (result.empty()) {
                return std::nullopt;
            }
            return toAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        return read("findAccountsByOwner", [&](pqxx::work& txn) {
            return toAccounts(txn.exec_params(
                std::string("SELECT ") + ACCOUNT_COLUMNS +
                " FROM ledger_accounts WHERE owner_id = $1 ORDER BY account_id", ownerId));
        });
    }

    std::vector<domain::Account> allAccounts() override {
        return read("allAccounts", [&](pqxx::work& txn) {
            return toAccounts(txn.exec(
                std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM ledger_accounts ORDER BY account_id"));
        });
    }

    std::vector<domain::LedgerEntry> entriesForAccount(domain::AccountId id) override {
        return read("entriesForAccount", [&](pqxx::work& txn) {
            return toEntries(txn.exec_params(
                std::string("SELECT ") + ENTRY_COLUMNS +
                " FROM ledger_entries WHERE account_id = $1 ORDER BY entry_id", id));
        });
    }

    std::vector<domain::LedgerEntry> entriesForOperation(const std::string& operationId) override {
        return read("entriesForOperation", [&](pqxx::work& txn) {
            return toEntries(txn.exec_params(
                std::string("SELECT ") + ENTRY_COLUMNS +
                " FROM ledger_entries WHERE operation_id = $1 ORDER BY entry_id", operationId));
        });
    }

    std::vector<domain::LedgerEntry> allEntries() override {
        return read("allEntries", [&](pqxx::work& txn) {
            return toEntries(txn.exec(
                std::string("SELECT ") + ENTRY_COLUMNS + " FROM ledger_entries ORDER BY entry_id"));
        });
    }

    int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                       const domain::Timestamp& since) override {
        return read("sumEntries", [&](pqxx::work& txn) {
            return sumQuery(txn, accountId, reason, since);
        });
    }

    std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) override {
        return read("findOrder", [&](pqxx::work& txn) { return orderQuery(txn, orderId); });
    }

    std::optional<domain::Loan> findLoan(const std::string& loanId) override {
        return read("findLoan", [&](pqxx::work& txn) { return loanQuery(txn, loanId); });
    }

    std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) override {
        return read("findSubscription", [&](pqxx::work& txn) {
            return subscriptionQuery(txn, subscriptionId);
        });
    }

    std::vector<domain::Subscription> activeSubscriptions() override {
        return read("activeSubscriptions", [&](pqxx::work& txn) {
            std::vector<domain::Subscription> subscriptions;
            auto result = txn.exec(std::string("SELECT ") + SUBSCRIPTION_COLUMNS +
                                   " FROM subscriptions WHERE is_active = TRUE ORDER BY subscription_id");
            for (const auto& row : result) {
                subscriptions.push_back(toSubscription(row));
            }
            return subscriptions;
        });
    }

    std::vector<domain::ScheduledObligation> obligationsDueBy(const domain::Date& date) override {
        return read("obligationsDueBy", [&](pqxx::work& txn) {
            return toObligations(txn.exec_params(
                std::string("SELECT ") + OBLIGATION_COLUMNS +
                " FROM scheduled_obligations WHERE status = 'SCHEDULED' AND due_date <= $1::date "
                "ORDER BY due_date", date.toString()));
        });
    }

    std::vector<domain::ScheduledObligation> obligationsForSubscription(
        const std::string& subscriptionId) override {
        return read("obligationsForSubscription", [&](pqxx::work& txn) {
            return toObligations(txn.exec_params(
                std::string("SELECT ") + OBLIGATION_COLUMNS +
                " FROM scheduled_obligations WHERE subscription_id = $1 ORDER BY due_date", subscriptionId));
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    /**
     * @brief Выполнить действие, переведя сбои БД в StoreUnavailableError
     */
    template <typename Fn>
    static auto run(const char* operation, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerStore] " << operation << " connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresLedgerStore] " << operation << " error: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    template <typename Fn>
    auto read(const char* operation, Fn&& fn) -> decltype(fn(std::declval<pqxx::work&>())) {
        return run(operation, [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            return fn(txn);
        });
    }

    static int64_t sumQuery(pqxx::work& txn, domain::AccountId accountId, domain::EntryReason reason,
                            const domain::Timestamp& since) {
        auto result = txn.exec_params(
            "SELECT COALESCE(SUM(delta), 0) FROM ledger_entries "
            "WHERE account_id = $1 AND reason = $2 AND created_at >= $3",
            accountId, domain::toString(reason), since.toUnixMillis());
        return result[0][0].as<int64_t>();
    }

    static std::optional<domain::EscrowOrder> orderQuery(pqxx::work& txn, const std::string& orderId) {
        auto result = txn.exec_params(
            std::string("SELECT ") + ORDER_COLUMNS + " FROM escrow_orders WHERE order_id = $1", orderId);
        if (result.empty()) {
            return std::nullopt;
        }
        const auto& row = result[0];
        domain::EscrowOrder order;
        order.orderId = row["order_id"].as<std::string>();
        order.listingId = row["listing_id"].as<std::string>();
        order.buyerAccountId = row["buyer_account_id"].as<domain::AccountId>();
        order.sellerAccountId = row["seller_account_id"].as<domain::AccountId>();
        order.escrowAccountId = row["escrow_account_id"].as<domain::AccountId>();
        order.amount = row["amount"].as<int64_t>();
        order.status = domain::parseEscrowStatus(row["status"].as<std::string>());
        order.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        if (!row["resolved_at"].is_null()) {
            order.resolvedAt = domain::Timestamp::fromUnixMillis(row["resolved_at"].as<int64_t>());
        }
        return order;
    }

    static std::optional<domain::Loan> loanQuery(pqxx::work& txn, const std::string& loanId) {
        auto result = txn.exec_params(
            std::string("SELECT ") + LOAN_COLUMNS + " FROM loans WHERE loan_id = $1", loanId);
        if (result.empty()) {
            return std::nullopt;
        }
        const auto& row = result[0];
        domain::Loan loan;
        loan.loanId = row["loan_id"].as<std::string>();
        loan.loanAccountId = row["loan_account_id"].as<domain::AccountId>();
        loan.lenderAccountId = row["lender_account_id"].as<domain::AccountId>();
        loan.borrowerAccountId = row["borrower_account_id"].as<domain::AccountId>();
        loan.principal = row["principal"].as<int64_t>();
        loan.status = domain::parseLoanStatus(row["status"].as<std::string>());
        loan.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        if (!row["repaid_at"].is_null()) {
            loan.repaidAt = domain::Timestamp::fromUnixMillis(row["repaid_at"].as<int64_t>());
        }
        return loan;
    }

    static std::optional<domain::Subscription> subscriptionQuery(pqxx::work& txn,
                                                                 const std::string& subscriptionId) {
        auto result = txn.exec_params(
            std::string("SELECT ") + SUBSCRIPTION_COLUMNS + " FROM subscriptions WHERE subscription_id = $1",
            subscriptionId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toSubscription(result[0]);
    }

    static domain::Account toAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["account_id"].as<domain::AccountId>();
        account.ownerId = row["owner_id"].as<std::string>();
        account.kind = domain::parseAccountKind(row["kind"].as<std::string>());
        account.status = domain::parseAccountStatus(row["status"].as<std::string>());
        account.balance = row["balance"].as<int64_t>();
        account.version = row["version"].as<int64_t>();
        account.currency = row["currency"].as<std::string>();
        account.category = row["category"].as<std::string>();
        if (!row["monthly_limit"].is_null()) {
            account.monthlyLimit = row["monthly_limit"].as<int64_t>();
        }
        account.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        return account;
    }

    static std::vector<domain::Account> toAccounts(const pqxx::result& result) {
        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(toAccount(row));
        }
        return accounts;
    }

    static std::vector<domain::LedgerEntry> toEntries(const pqxx::result& result) {
        std::vector<domain::LedgerEntry> entries;
        for (const auto& row : result) {
            domain::LedgerEntry entry;
            entry.entryId = row["entry_id"].as<int64_t>();
            entry.accountId = row["account_id"].as<domain::AccountId>();
            entry.delta = row["delta"].as<int64_t>();
            entry.operationId = row["operation_id"].as<std::string>();
            entry.reason = domain::parseEntryReason(row["reason"].as<std::string>());
            entry.description = row["description"].as<std::string>();
            entry.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
            entries.push_back(entry);
        }
        return entries;
    }

    static domain::Subscription toSubscription(const pqxx::row& row) {
        domain::Subscription s;
        s.subscriptionId = row["subscription_id"].as<std::string>();
        s.ownerId = row["owner_id"].as<std::string>();
        s.accountId = row["account_id"].as<domain::AccountId>();
        s.serviceName = row["service_name"].as<std::string>();
        s.category = row["category"].as<std::string>();
        s.amount = row["amount"].as<int64_t>();
        s.billingCycle = domain::parseBillingCycle(row["billing_cycle"].as<std::string>());
        if (!row["next_billing_date"].is_null()) {
            s.nextBillingDate = domain::Date::parse(row["next_billing_date"].as<std::string>());
        }
        if (!row["last_payment_date"].is_null()) {
            s.lastPaymentDate = domain::Date::parse(row["last_payment_date"].as<std::string>());
        }
        s.active = row["is_active"].as<bool>();
        s.autoRenew = row["auto_renew"].as<bool>();
        s.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        if (!row["cancelled_at"].is_null()) {
            s.cancelledAt = domain::Timestamp::fromUnixMillis(row["cancelled_at"].as<int64_t>());
        }
        return s;
    }

    static domain::ScheduledObligation toObligation(const pqxx::row& row) {
        domain::ScheduledObligation o;
        o.obligationId = row["obligation_id"].as<std::string>();
        o.subscriptionId = row["subscription_id"].as<std::string>();
        o.accountId = row["account_id"].as<domain::AccountId>();
        o.amount = row["amount"].as<int64_t>();
        o.dueDate = domain::Date::parse(row["due_date"].as<std::string>());
        o.materialized = row["materialized"].as<bool>();
        o.status = domain::parseObligationStatus(row["status"].as<std::string>());
        o.failureReason = row["failure_reason"].as<std::string>();
        o.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        if (!row["settled_at"].is_null()) {
            o.settledAt = domain::Timestamp::fromUnixMillis(row["settled_at"].as<int64_t>());
        }
        return o;
    }

    static std::vector<domain::ScheduledObligation> toObligations(const pqxx::result& result) {
        std::vector<domain::ScheduledObligation> obligations;
        for (const auto& row : result) {
            obligations.push_back(toObligation(row));
        }
        return obligations;
    }

    void initSchema() {
        run("initSchema", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_accounts (
                    account_id BIGSERIAL PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    kind VARCHAR(16) NOT NULL,
                    status VARCHAR(16) NOT NULL DEFAULT 'ACTIVE',
                    balance BIGINT NOT NULL DEFAULT 0 CHECK (balance >= 0),
                    version BIGINT NOT NULL DEFAULT 0,
                    currency VARCHAR(3) NOT NULL DEFAULT 'USD',
                    category VARCHAR(64) NOT NULL DEFAULT '',
                    monthly_limit BIGINT,
                    created_at BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_accounts_owner ON ledger_accounts(owner_id)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_operations (
                    operation_id VARCHAR(128) PRIMARY KEY,
                    reason VARCHAR(32) NOT NULL,
                    created_at BIGINT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_entries (
                    entry_id BIGSERIAL PRIMARY KEY,
                    account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    delta BIGINT NOT NULL,
                    operation_id VARCHAR(128) NOT NULL REFERENCES ledger_operations(operation_id),
                    reason VARCHAR(32) NOT NULL,
                    description TEXT NOT NULL DEFAULT '',
                    created_at BIGINT NOT NULL,
                    UNIQUE (operation_id, account_id)
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_entries_account ON ledger_entries(account_id, reason, created_at)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS escrow_orders (
                    order_id VARCHAR(64) PRIMARY KEY,
                    listing_id VARCHAR(64) NOT NULL,
                    buyer_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    seller_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    escrow_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    amount BIGINT NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    created_at BIGINT NOT NULL,
                    resolved_at BIGINT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS loans (
                    loan_id VARCHAR(64) PRIMARY KEY,
                    loan_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    lender_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    borrower_account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    principal BIGINT NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    created_at BIGINT NOT NULL,
                    repaid_at BIGINT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS subscriptions (
                    subscription_id VARCHAR(64) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    service_name VARCHAR(128) NOT NULL,
                    category VARCHAR(64) NOT NULL DEFAULT '',
                    amount BIGINT NOT NULL,
                    billing_cycle VARCHAR(16) NOT NULL,
                    next_billing_date DATE,
                    last_payment_date DATE,
                    is_active BOOLEAN NOT NULL DEFAULT TRUE,
                    auto_renew BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at BIGINT NOT NULL,
                    cancelled_at BIGINT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS scheduled_obligations (
                    obligation_id VARCHAR(64) PRIMARY KEY,
                    subscription_id VARCHAR(64) NOT NULL REFERENCES subscriptions(subscription_id),
                    account_id BIGINT NOT NULL REFERENCES ledger_accounts(account_id),
                    amount BIGINT NOT NULL,
                    due_date DATE NOT NULL,
                    materialized BOOLEAN NOT NULL DEFAULT FALSE,
                    status VARCHAR(16) NOT NULL DEFAULT 'SCHEDULED',
                    failure_reason TEXT NOT NULL DEFAULT '',
                    created_at BIGINT NOT NULL,
                    settled_at BIGINT,
                    UNIQUE (subscription_id, due_date)
                )
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;
        });
    }
};

} // namespace wallet::adapters::secondary
