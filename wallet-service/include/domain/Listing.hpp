#pragma once

#include "Account.hpp"
#include <string>
#include <cstdint>

namespace wallet::domain {

/**
 * @brief Объявление маркетплейса (данные внешнего каталога)
 */
struct Listing {
    std::string listingId;
    AccountId sellerAccountId = 0;
    int64_t price = 0;          ///< Центы
    bool available = false;
};

} // namespace wallet::domain
