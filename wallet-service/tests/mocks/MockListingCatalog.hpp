#pragma once

#include "ports/output/IListingCatalog.hpp"
#include <gmock/gmock.h>

namespace wallet::tests {

class MockListingCatalog : public ports::output::IListingCatalog {
public:
    MOCK_METHOD(std::optional<domain::Listing>, findListing, (const std::string& listingId), (override));
    MOCK_METHOD(bool, markSold, (const std::string& listingId), (override));
    MOCK_METHOD(void, reopen, (const std::string& listingId), (override));
};

} // namespace wallet::tests
