#pragma once

#include "domain/Listing.hpp"
#include <optional>
#include <string>

namespace wallet::ports::output {

/**
 * @brief Каталог маркетплейса (внешний коллаборатор)
 *
 * Поставляет продавца и доступность объявления для createOrder
 * и снимает объявление с продажи на время сделки.
 */
class IListingCatalog {
public:
    virtual ~IListingCatalog() = default;

    virtual std::optional<domain::Listing> findListing(const std::string& listingId) = 0;

    /**
     * @brief Атомарно перевести доступное объявление в проданные
     * @return false, если объявления нет или его уже купили
     */
    virtual bool markSold(const std::string& listingId) = 0;

    /**
     * @brief Вернуть проданное объявление в продажу (сделка не состоялась)
     */
    virtual void reopen(const std::string& listingId) = 0;
};

} // namespace wallet::ports::output
