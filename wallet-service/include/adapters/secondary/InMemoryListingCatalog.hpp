// include/adapters/secondary/InMemoryListingCatalog.hpp
#pragma once

#include "ports/output/IListingCatalog.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>
#include <mutex>

namespace wallet::adapters::secondary {

/**
 * @brief In-memory каталог объявлений для WALLET_STORE=memory и тестов
 *
 * Объявления добавляются через addListing (каталог маркетплейса
 * в этом режиме не подключён).
 */
class InMemoryListingCatalog : public ports::output::IListingCatalog {
public:
    InMemoryListingCatalog() {
        std::cout << "[InMemoryListingCatalog] Created" << std::endl;
    }

    void addListing(const domain::Listing& listing) {
        listings_.insert(listing.listingId, std::make_shared<domain::Listing>(listing));
    }

    bool markSold(const std::string& listingId) override {
        return setAvailable(listingId, true, false);
    }

    void reopen(const std::string& listingId) override {
        setAvailable(listingId, false, true);
    }

    std::optional<domain::Listing> findListing(const std::string& listingId) override {
        auto listing = listings_.find(listingId);
        return listing ? std::optional<domain::Listing>(*listing) : std::nullopt;
    }

private:
    ThreadSafeMap<std::string, domain::Listing> listings_;
    std::mutex statusMutex_;

    /**
     * @brief Сменить доступность, если сейчас она равна expected
     *
     * Записи в таблице не меняются на месте: читатели держат старые копии.
     */
    bool setAvailable(const std::string& listingId, bool expected, bool available) {
        std::lock_guard<std::mutex> lock(statusMutex_);
        auto listing = listings_.find(listingId);
        if (!listing || listing->available != expected) {
            return false;
        }
        auto updated = std::make_shared<domain::Listing>(*listing);
        updated->available = available;
        listings_.insert(listingId, updated);
        return true;
    }
};

} // namespace wallet::adapters::secondary
