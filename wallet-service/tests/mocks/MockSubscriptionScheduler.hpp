#pragma once

#include "ports/input/ISubscriptionScheduler.hpp"
#include <gmock/gmock.h>

namespace wallet::tests {

class MockSubscriptionScheduler : public ports::input::ISubscriptionScheduler {
public:
    MOCK_METHOD(ports::input::SubscriptionResult, subscribe,
                (const ports::input::SubscriptionRequest& request), (override));
    MOCK_METHOD(ports::input::SubscriptionResult, cancel,
                (const std::string& ownerId, const std::string& subscriptionId), (override));
    MOCK_METHOD(ports::input::SubscriptionResult, pause,
                (const std::string& ownerId, const std::string& subscriptionId), (override));
    MOCK_METHOD(ports::input::SubscriptionResult, resume,
                (const std::string& ownerId, const std::string& subscriptionId, const domain::Date& today),
                (override));
    MOCK_METHOD(ports::input::EnsureResult, ensureNextPayment,
                (const std::string& subscriptionId, const domain::Date& today), (override));
    MOCK_METHOD(ports::input::SyncReport, syncAll, (const domain::Date& today), (override));
    MOCK_METHOD(ports::input::ChargeReport, executeDue, (const domain::Date& today), (override));
    MOCK_METHOD(ports::input::SubscriptionResult, processCompletion,
                (const std::string& subscriptionId, const domain::Date& dueDate, const domain::Date& today),
                (override));
    MOCK_METHOD(domain::OperationOutcome, retryObligation,
                (const std::string& subscriptionId, const domain::Date& dueDate), (override));
    MOCK_METHOD(std::vector<domain::ScheduledObligation>, obligations,
                (const std::string& subscriptionId), (override));
};

} // namespace wallet::tests
