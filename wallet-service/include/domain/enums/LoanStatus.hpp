#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

enum class LoanStatus {
    ACTIVE,
    REPAID
};

inline std::string toString(LoanStatus status) {
    switch (status) {
        case LoanStatus::ACTIVE: return "ACTIVE";
        case LoanStatus::REPAID: return "REPAID";
        default: return "UNKNOWN";
    }
}

inline LoanStatus parseLoanStatus(const std::string& str) {
    if (str == "ACTIVE") return LoanStatus::ACTIVE;
    if (str == "REPAID") return LoanStatus::REPAID;
    throw std::invalid_argument("Unknown loan status: " + str);
}

} // namespace wallet::domain
