#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

enum class ObligationStatus {
    SCHEDULED,
    SETTLED,
    FAILED
};

inline std::string toString(ObligationStatus status) {
    switch (status) {
        case ObligationStatus::SCHEDULED: return "SCHEDULED";
        case ObligationStatus::SETTLED: return "SETTLED";
        case ObligationStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline ObligationStatus parseObligationStatus(const std::string& str) {
    if (str == "SCHEDULED") return ObligationStatus::SCHEDULED;
    if (str == "SETTLED") return ObligationStatus::SETTLED;
    if (str == "FAILED") return ObligationStatus::FAILED;
    throw std::invalid_argument("Unknown obligation status: " + str);
}

} // namespace wallet::domain
