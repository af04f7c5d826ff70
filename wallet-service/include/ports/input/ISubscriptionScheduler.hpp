#pragma once

#include "domain/Account.hpp"
#include "domain/Date.hpp"
#include "domain/Subscription.hpp"
#include "domain/ScheduledObligation.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wallet::ports::input {

/**
 * @brief Что сделал ensureNextPayment
 */
enum class EnsureStatus {
    CREATED,    ///< Обязательство создано
    EXISTING,   ///< Уже было, ничего не изменилось
    SKIPPED     ///< Подписка не продлевается, нет даты или дата за горизонтом
};

struct EnsureResult {
    EnsureStatus status = EnsureStatus::SKIPPED;
    std::optional<domain::ScheduledObligation> obligation;
    std::string reason;
};

/**
 * @brief Итог syncAll
 */
struct SyncReport {
    int synced = 0;         ///< Подписок с обязательством в горизонте (создано или было)
    int skipped = 0;
    int created = 0;
    int totalActive = 0;
};

/**
 * @brief Итог executeDue
 */
struct ChargeReport {
    int settled = 0;
    int failed = 0;
    int deferred = 0;       ///< LOCK_TIMEOUT, повторим в следующий проход
    int paused = 0;         ///< Подписка на паузе, обязательство ждёт resume
};

struct SubscriptionRequest {
    std::string ownerId;
    domain::AccountId accountId = 0;
    std::string serviceName;
    std::string category;
    int64_t amount = 0;
    domain::BillingCycle billingCycle = domain::BillingCycle::MONTHLY;
    domain::Date firstBillingDate;
    bool autoRenew = true;
};

struct SubscriptionResult : domain::OperationOutcome {
    std::optional<domain::Subscription> subscription;

    static SubscriptionResult from(const domain::OperationOutcome& outcome) {
        SubscriptionResult r;
        static_cast<domain::OperationOutcome&>(r) = outcome;
        return r;
    }
};

/**
 * @brief Планировщик списаний по подпискам
 */
class ISubscriptionScheduler {
public:
    virtual ~ISubscriptionScheduler() = default;

    virtual SubscriptionResult subscribe(const SubscriptionRequest& request) = 0;
    virtual SubscriptionResult cancel(const std::string& ownerId, const std::string& subscriptionId) = 0;

    /**
     * @brief Приостановить продление (autoRenew = false), подписка остаётся активной
     */
    virtual SubscriptionResult pause(const std::string& ownerId, const std::string& subscriptionId) = 0;

    /**
     * @brief Снять паузу: циклы до today пропускаются, ближайший планируется
     */
    virtual SubscriptionResult resume(const std::string& ownerId, const std::string& subscriptionId,
                                      const domain::Date& today) = 0;

    /**
     * @brief Гарантировать ровно одно обязательство на следующую дату списания
     */
    virtual EnsureResult ensureNextPayment(const std::string& subscriptionId, const domain::Date& today) = 0;

    virtual SyncReport syncAll(const domain::Date& today) = 0;

    /**
     * @brief Провести списания по обязательствам с dueDate <= today
     */
    virtual ChargeReport executeDue(const domain::Date& today) = 0;

    /**
     * @brief Обязательство на dueDate оплачено: сдвинуть якорную дату
     *        подписки и запланировать следующий цикл
     */
    virtual SubscriptionResult processCompletion(const std::string& subscriptionId,
                                                 const domain::Date& dueDate,
                                                 const domain::Date& today) = 0;

    /**
     * @brief Вернуть FAILED обязательство в SCHEDULED (после пополнения счёта)
     */
    virtual domain::OperationOutcome retryObligation(const std::string& subscriptionId,
                                                     const domain::Date& dueDate) = 0;

    virtual std::vector<domain::ScheduledObligation> obligations(const std::string& subscriptionId) = 0;
};

inline std::string toString(EnsureStatus status) {
    switch (status) {
        case EnsureStatus::CREATED: return "created";
        case EnsureStatus::EXISTING: return "existing";
        case EnsureStatus::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

} // namespace wallet::ports::input
