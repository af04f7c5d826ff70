/**
 * @file InMemoryListingCatalogTest.cpp
 * @brief Unit tests for InMemoryListingCatalog
 */

#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryListingCatalog.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace wallet::adapters::secondary;
using wallet::domain::Listing;

TEST(InMemoryListingCatalogTest, FindListing_ReturnsAdded) {
    InMemoryListingCatalog catalog;
    catalog.addListing({"lst-1", 7, 1999, true});

    auto listing = catalog.findListing("lst-1");

    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->sellerAccountId, 7);
    EXPECT_EQ(listing->price, 1999);
    EXPECT_TRUE(listing->available);
}

TEST(InMemoryListingCatalogTest, FindListing_Unknown) {
    InMemoryListingCatalog catalog;
    EXPECT_FALSE(catalog.findListing("lst-404").has_value());
}

TEST(InMemoryListingCatalogTest, MarkSold_MakesUnavailable) {
    InMemoryListingCatalog catalog;
    catalog.addListing({"lst-1", 7, 1999, true});

    EXPECT_TRUE(catalog.markSold("lst-1"));
    EXPECT_FALSE(catalog.findListing("lst-1")->available);
    EXPECT_FALSE(catalog.markSold("lst-404"));
}

TEST(InMemoryListingCatalogTest, MarkSold_SecondClaimFails) {
    InMemoryListingCatalog catalog;
    catalog.addListing({"lst-1", 7, 1999, true});

    EXPECT_TRUE(catalog.markSold("lst-1"));
    EXPECT_FALSE(catalog.markSold("lst-1"));
}

TEST(InMemoryListingCatalogTest, Reopen_AllowsNewClaim) {
    InMemoryListingCatalog catalog;
    catalog.addListing({"lst-1", 7, 1999, true});
    ASSERT_TRUE(catalog.markSold("lst-1"));

    catalog.reopen("lst-1");

    EXPECT_TRUE(catalog.findListing("lst-1")->available);
    EXPECT_TRUE(catalog.markSold("lst-1"));
    catalog.reopen("lst-404");
    EXPECT_FALSE(catalog.findListing("lst-404").has_value());
}

TEST(InMemoryListingCatalogTest, MarkSold_ConcurrentClaims_OneWins) {
    InMemoryListingCatalog catalog;
    catalog.addListing({"lst-1", 7, 1999, true});

    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (catalog.markSold("lst-1")) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins.load(), 1);
}
