#pragma once

#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/want_entry.hpp"

#include <optional>
#include <string>
#include <utility>

namespace stockcheck_test {

// Builds a listing with the fields most tests care about; the rest keep
// their defaults.
inline stockcheck::domain::InventoryListing makeListing(
    const std::string& name, int quantity, double price = 1.0,
    std::optional<std::string> location = std::nullopt,
    stockcheck::domain::Language language =
        stockcheck::domain::Language::English) {
  stockcheck::domain::InventoryListing listing;
  listing.name = name;
  listing.quantity = quantity;
  listing.price = price;
  listing.location = std::move(location);
  listing.language = language;
  listing.condition = stockcheck::domain::Condition::NearMint;
  listing.set_code = "M10";
  listing.set_name = "Magic 2010";
  listing.collector_number = "146";
  return listing;
}

inline stockcheck::domain::WantEntry makeWant(int quantity,
                                              const std::string& name) {
  stockcheck::domain::WantEntry want;
  want.quantity = quantity;
  want.name = name;
  return want;
}

}  // namespace stockcheck_test
