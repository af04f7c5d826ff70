// include/adapters/secondary/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/StoreUnavailableError.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace wallet::adapters::secondary {

/**
 * @brief In-memory хранилище журнала с семантикой строковых блокировок
 *
 * Повторяет контракт PostgresLedgerStore:
 * - lockAccount = SELECT ... FOR UPDATE с lock_timeout (std::timed_mutex на строку)
 * - записи сессии буферизуются и применяются атомарно в commit
 * - operationId и (subscriptionId, dueDate) - уникальные ключи; ключ занимается
 *   при вставке и освобождается при откате, как незакоммиченная строка в индексе
 *
 * Для тестов:
 * - failNextCommit() - следующий commit бросит StoreUnavailableError
 *   (сбой до фиксации, ничего не применено)
 * - setAvailable(false) - begin() и чтения бросают StoreUnavailableError
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
    struct RowLock {
        std::timed_mutex mutex;
    };

    using ObligationKey = std::pair<std::string, int64_t>;

    static ObligationKey keyOf(const std::string& subscriptionId, const domain::Date& dueDate) {
        return {subscriptionId, dueDate.toDays()};
    }

    /**
     * @brief Закоммиченное состояние, общее для хранилища и его сессий
     */
    struct State {
        ThreadSafeMap<domain::AccountId, RowLock> rows;

        std::mutex dataMutex;
        std::map<domain::AccountId, domain::Account> accounts;
        std::vector<domain::LedgerEntry> entries;
        std::set<std::string> operations;           ///< закоммиченные + занятые сессиями
        std::unordered_map<std::string, domain::EscrowOrder> orders;
        std::unordered_map<std::string, domain::Loan> loans;
        std::map<std::string, domain::Subscription> subscriptions;
        std::map<ObligationKey, domain::ScheduledObligation> obligations;
        std::set<ObligationKey> obligationKeys;     ///< закоммиченные + занятые сессиями

        std::atomic<domain::AccountId> nextAccountId{1};
        std::atomic<int64_t> nextEntryId{1};
        std::atomic<bool> failNextCommit{false};
        std::atomic<bool> available{true};
    };

    class Session : public ports::output::ILedgerSession {
    public:
        explicit Session(std::shared_ptr<State> state) : state_(std::move(state)) {}

        ~Session() override {
            if (!committed_) {
                rollback();
            }
        }

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        ports::output::LockStatus lockAccount(domain::AccountId id,
                                              std::chrono::milliseconds timeout) override {
            if (held_.count(id)) {
                return ports::output::LockStatus::ACQUIRED;
            }
            {
                std::lock_guard<std::mutex> lock(state_->dataMutex);
                if (!state_->accounts.count(id)) {
                    return ports::output::LockStatus::NOT_FOUND;
                }
            }
            auto row = state_->rows.find(id);
            if (!row) {
                return ports::output::LockStatus::NOT_FOUND;
            }
            std::unique_lock<std::timed_mutex> guard(row->mutex, std::defer_lock);
            if (!guard.try_lock_for(timeout)) {
                return ports::output::LockStatus::TIMEOUT;
            }
            held_.emplace(id, Held{row, std::move(guard)});
            return ports::output::LockStatus::ACQUIRED;
        }

        std::optional<domain::Account> readAccount(domain::AccountId id) override {
            auto pending = accounts_.find(id);
            if (pending != accounts_.end()) {
                return pending->second;
            }
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            auto it = state_->accounts.find(id);
            if (it == state_->accounts.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void writeAccount(const domain::Account& account) override {
            if (!held_.count(account.id)) {
                throw std::logic_error("Account " + std::to_string(account.id) +
                                       " written without row lock");
            }
            accounts_[account.id] = account;
        }

        domain::AccountId createAccount(const domain::Account& account) override {
            domain::AccountId id = state_->nextAccountId.fetch_add(1);
            auto row = std::make_shared<RowLock>();
            std::unique_lock<std::timed_mutex> guard(row->mutex);
            if (state_->rows.insertIfAbsent(id, row) != row) {
                throw std::logic_error("Row lock for account " + std::to_string(id) + " already exists");
            }
            held_.emplace(id, Held{row, std::move(guard)});
            created_.push_back(id);

            domain::Account copy = account;
            copy.id = id;
            accounts_[id] = copy;
            return id;
        }

        bool recordOperation(const std::string& operationId, domain::EntryReason) override {
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            if (!state_->operations.insert(operationId).second) {
                return false;
            }
            claimedOperations_.push_back(operationId);
            return true;
        }

        domain::LedgerEntry appendEntry(const domain::LedgerEntry& entry) override {
            domain::LedgerEntry copy = entry;
            copy.entryId = state_->nextEntryId.fetch_add(1);
            entries_.push_back(copy);
            return copy;
        }

        int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                           const domain::Timestamp& since) override {
            int64_t sum = 0;
            for (const auto& e : entries_) {
                if (e.accountId == accountId && e.reason == reason && e.createdAt >= since) {
                    sum += e.delta;
                }
            }
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            for (const auto& e : state_->entries) {
                if (e.accountId == accountId && e.reason == reason && e.createdAt >= since) {
                    sum += e.delta;
                }
            }
            return sum;
        }

        std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) override {
            return findPendingOrCommitted(orders_, state_->orders, orderId);
        }

        void saveOrder(const domain::EscrowOrder& order) override {
            orders_[order.orderId] = order;
        }

        std::optional<domain::Loan> findLoan(const std::string& loanId) override {
            return findPendingOrCommitted(loans_, state_->loans, loanId);
        }

        void saveLoan(const domain::Loan& loan) override {
            loans_[loan.loanId] = loan;
        }

        std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) override {
            return findPendingOrCommitted(subscriptions_, state_->subscriptions, subscriptionId);
        }

        void saveSubscription(const domain::Subscription& subscription) override {
            subscriptions_[subscription.subscriptionId] = subscription;
        }

        std::optional<domain::ScheduledObligation> findObligation(
            const std::string& subscriptionId, const domain::Date& dueDate) override {
            return findPendingOrCommitted(obligations_, state_->obligations, keyOf(subscriptionId, dueDate));
        }

        bool insertObligation(const domain::ScheduledObligation& obligation) override {
            auto key = keyOf(obligation.subscriptionId, obligation.dueDate);
            {
                std::lock_guard<std::mutex> lock(state_->dataMutex);
                if (!state_->obligationKeys.insert(key).second) {
                    return false;
                }
            }
            claimedObligations_.push_back(key);
            obligations_[key] = obligation;
            return true;
        }

        void updateObligation(const domain::ScheduledObligation& obligation) override {
            obligations_[keyOf(obligation.subscriptionId, obligation.dueDate)] = obligation;
        }

        void commit() override {
            if (state_->failNextCommit.exchange(false)) {
                throw domain::StoreUnavailableError("connection lost before commit");
            }
            if (!state_->available) {
                throw domain::StoreUnavailableError("store is offline");
            }
            {
                std::lock_guard<std::mutex> lock(state_->dataMutex);
                for (const auto& [id, account] : accounts_) {
                    state_->accounts[id] = account;
                }
                state_->entries.insert(state_->entries.end(), entries_.begin(), entries_.end());
                for (const auto& [id, order] : orders_) {
                    state_->orders[id] = order;
                }
                for (const auto& [id, loan] : loans_) {
                    state_->loans[id] = loan;
                }
                for (const auto& [id, subscription] : subscriptions_) {
                    state_->subscriptions[id] = subscription;
                }
                for (const auto& [key, obligation] : obligations_) {
                    state_->obligations[key] = obligation;
                }
            }
            committed_ = true;
            held_.clear();
        }

    private:
        struct Held {
            std::shared_ptr<RowLock> row;
            std::unique_lock<std::timed_mutex> lock;    // освобождается раньше row
        };

        std::shared_ptr<State> state_;
        bool committed_ = false;

        std::map<domain::AccountId, Held> held_;
        std::vector<domain::AccountId> created_;
        std::vector<std::string> claimedOperations_;
        std::vector<ObligationKey> claimedObligations_;

        std::map<domain::AccountId, domain::Account> accounts_;
        std::vector<domain::LedgerEntry> entries_;
        std::unordered_map<std::string, domain::EscrowOrder> orders_;
        std::unordered_map<std::string, domain::Loan> loans_;
        std::map<std::string, domain::Subscription> subscriptions_;
        std::map<ObligationKey, domain::ScheduledObligation> obligations_;

        template <typename Map, typename Key>
        auto findPendingOrCommitted(const Map& pending, const Map& committed, const Key& key)
            -> std::optional<typename Map::mapped_type>
        {
            auto it = pending.find(key);
            if (it != pending.end()) {
                return it->second;
            }
            std::lock_guard<std::mutex> lock(state_->dataMutex);
            auto found = committed.find(key);
            if (found == committed.end()) {
                return std::nullopt;
            }
            return found->second;
        }

        void rollback() {
            {
                std::lock_guard<std::mutex> lock(state_->dataMutex);
                for (const auto& op : claimedOperations_) {
                    state_->operations.erase(op);
                }
                for (const auto& key : claimedObligations_) {
                    state_->obligationKeys.erase(key);
                }
            }
            for (auto id : created_) {
                state_->rows.erase(id);
            }
            held_.clear();
        }
    };

public:
    InMemoryLedgerStore() : state_(std::make_shared<State>()) {
        std::cout << "[InMemoryLedgerStore] Initialized" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerSession> begin() override {
        ensureAvailable();
        return std::make_unique<Session>(state_);
    }

    std::optional<domain::Account> findAccount(domain::AccountId id) override {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        auto it = state_->accounts.find(id);
        if (it == state_->accounts.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        ensureAvailable();
        std::vector<domain::Account> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& [id, account] : state_->accounts) {
            if (account.ownerId == ownerId) {
                result.push_back(account);
            }
        }
        return result;
    }

    std::vector<domain::Account> allAccounts() override {
        ensureAvailable();
        std::vector<domain::Account> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& [id, account] : state_->accounts) {
            result.push_back(account);
        }
        return result;
    }

    std::vector<domain::LedgerEntry> entriesForAccount(domain::AccountId id) override {
        return filterEntries([id](const domain::LedgerEntry& e) { return e.accountId == id; });
    }

    std::vector<domain::LedgerEntry> entriesForOperation(const std::string& operationId) override {
        return filterEntries([&operationId](const domain::LedgerEntry& e) {
            return e.operationId == operationId;
        });
    }

    std::vector<domain::LedgerEntry> allEntries() override {
        return filterEntries([](const domain::LedgerEntry&) { return true; });
    }

    int64_t sumEntries(domain::AccountId accountId, domain::EntryReason reason,
                       const domain::Timestamp& since) override {
        int64_t sum = 0;
        for (const auto& e : filterEntries([&](const domain::LedgerEntry& e) {
                 return e.accountId == accountId && e.reason == reason && e.createdAt >= since;
             })) {
            sum += e.delta;
        }
        return sum;
    }

    std::optional<domain::EscrowOrder> findOrder(const std::string& orderId) override {
        return findCommitted(state_->orders, orderId);
    }

    std::optional<domain::Loan> findLoan(const std::string& loanId) override {
        return findCommitted(state_->loans, loanId);
    }

    std::optional<domain::Subscription> findSubscription(const std::string& subscriptionId) override {
        return findCommitted(state_->subscriptions, subscriptionId);
    }

    std::vector<domain::Subscription> activeSubscriptions() override {
        ensureAvailable();
        std::vector<domain::Subscription> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& [id, subscription] : state_->subscriptions) {
            if (subscription.active) {
                result.push_back(subscription);
            }
        }
        return result;
    }

    std::vector<domain::ScheduledObligation> obligationsDueBy(const domain::Date& date) override {
        ensureAvailable();
        std::vector<domain::ScheduledObligation> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& [key, obligation] : state_->obligations) {
            if (obligation.status == domain::ObligationStatus::SCHEDULED && obligation.dueDate <= date) {
                result.push_back(obligation);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a.dueDate < b.dueDate;
        });
        return result;
    }

    std::vector<domain::ScheduledObligation> obligationsForSubscription(
        const std::string& subscriptionId) override {
        ensureAvailable();
        std::vector<domain::ScheduledObligation> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& [key, obligation] : state_->obligations) {
            if (key.first == subscriptionId) {
                result.push_back(obligation);
            }
        }
        return result;
    }

    // =========================================================================
    // Для тестов
    // =========================================================================

    void failNextCommit() {
        state_->failNextCommit = true;
    }

    void setAvailable(bool available) {
        state_->available = available;
    }

private:
    std::shared_ptr<State> state_;

    void ensureAvailable() const {
        if (!state_->available) {
            throw domain::StoreUnavailableError("store is offline");
        }
    }

    template <typename Predicate>
    std::vector<domain::LedgerEntry> filterEntries(Predicate predicate) {
        ensureAvailable();
        std::vector<domain::LedgerEntry> result;
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        for (const auto& e : state_->entries) {
            if (predicate(e)) {
                result.push_back(e);
            }
        }
        return result;
    }

    template <typename Map, typename Key>
    auto findCommitted(const Map& map, const Key& key) -> std::optional<typename Map::mapped_type> {
        ensureAvailable();
        std::lock_guard<std::mutex> lock(state_->dataMutex);
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

} // namespace wallet::adapters::secondary
