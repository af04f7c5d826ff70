#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

enum class AccountStatus {
    ACTIVE,
    FROZEN,
    CLOSED
};

inline std::string toString(AccountStatus status) {
    switch (status) {
        case AccountStatus::ACTIVE: return "ACTIVE";
        case AccountStatus::FROZEN: return "FROZEN";
        case AccountStatus::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

inline AccountStatus parseAccountStatus(const std::string& str) {
    if (str == "ACTIVE") return AccountStatus::ACTIVE;
    if (str == "FROZEN") return AccountStatus::FROZEN;
    if (str == "CLOSED") return AccountStatus::CLOSED;
    throw std::invalid_argument("Unknown account status: " + str);
}

} // namespace wallet::domain
