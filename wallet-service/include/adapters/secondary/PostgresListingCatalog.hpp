// include/adapters/secondary/PostgresListingCatalog.hpp
#pragma once

#include "ports/output/IListingCatalog.hpp"
#include "settings/DbSettings.hpp"
#include "domain/StoreUnavailableError.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief Каталог объявлений маркетплейса поверх таблицы marketplace_listings
 *
 * Таблица принадлежит сервису маркетплейса. Кошелёк читает её и меняет
 * только status: 'active' → 'sold' при создании заказа и обратно при возврате.
 * - listing_id VARCHAR(64) PRIMARY KEY
 * - seller_account_id BIGINT (кошелёк продавца)
 * - price_cents BIGINT
 * - status VARCHAR(16): 'active' | 'sold' | 'inactive'
 */
class PostgresListingCatalog : public ports::output::IListingCatalog {
public:
    explicit PostgresListingCatalog(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresListingCatalog] Listings from " << settings_->describe() << std::endl;
    }

    std::optional<domain::Listing> findListing(const std::string& listingId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT listing_id, seller_account_id, price_cents, status "
                "FROM marketplace_listings WHERE listing_id = $1",
                listingId
            );

            if (result.empty()) {
                return std::nullopt;
            }

            domain::Listing listing;
            listing.listingId = result[0]["listing_id"].as<std::string>();
            listing.sellerAccountId = result[0]["seller_account_id"].as<domain::AccountId>();
            listing.price = result[0]["price_cents"].as<int64_t>();
            listing.available = result[0]["status"].as<std::string>() == "active";
            return listing;

        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresListingCatalog] findListing error: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    bool markSold(const std::string& listingId) override {
        return updateStatus(listingId, "active", "sold");
    }

    void reopen(const std::string& listingId) override {
        if (!updateStatus(listingId, "sold", "active")) {
            std::cerr << "[PostgresListingCatalog] Listing " << listingId << " was not sold, left as is" << std::endl;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    bool updateStatus(const std::string& listingId, const std::string& from, const std::string& to) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE marketplace_listings SET status = $3 "
                "WHERE listing_id = $1 AND status = $2",
                listingId, from, to
            );
            txn.commit();
            return result.affected_rows() == 1;

        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresListingCatalog] updateStatus error: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }
};

} // namespace wallet::adapters::secondary
