#include "stockcheck/domain/inventory_listing.hpp"

#include "stockcheck/text/text_utils.hpp"

#include <limits>

namespace stockcheck {
namespace domain {

namespace {

constexpr int kCopiesPerPlayset = 4;

}  // namespace

bool operator==(const InventoryListing& lhs, const InventoryListing& rhs) {
  return lhs.cardmarket_id == rhs.cardmarket_id && lhs.name == rhs.name &&
         lhs.set_name == rhs.set_name && lhs.set_code == rhs.set_code &&
         lhs.collector_number == rhs.collector_number &&
         lhs.condition == rhs.condition && lhs.language == rhs.language &&
         lhs.is_foil == rhs.is_foil && lhs.is_signed == rhs.is_signed &&
         lhs.is_playset == rhs.is_playset && lhs.quantity == rhs.quantity &&
         lhs.price == rhs.price && lhs.location == rhs.location &&
         lhs.comment == rhs.comment && lhs.rarity == rhs.rarity &&
         lhs.name_de == rhs.name_de && lhs.name_es == rhs.name_es &&
         lhs.name_fr == rhs.name_fr && lhs.name_it == rhs.name_it;
}

bool operator!=(const InventoryListing& lhs, const InventoryListing& rhs) {
  return !(lhs == rhs);
}

// -----------------------------------------------------------------------------
// nameIn(): localized column, English fallback
// -----------------------------------------------------------------------------
const std::string& nameIn(const InventoryListing& listing, Language language) {
  const std::string* localized = nullptr;
  switch (language) {
    case Language::German:  localized = &listing.name_de; break;
    case Language::Spanish: localized = &listing.name_es; break;
    case Language::French:  localized = &listing.name_fr; break;
    case Language::Italian: localized = &listing.name_it; break;
    case Language::English: break;
  }
  if (localized != nullptr && !trim(*localized).empty()) {
    return *localized;
  }
  return listing.name;
}

const std::string& localizedName(const InventoryListing& listing) {
  return nameIn(listing, listing.language);
}

int effectiveQuantity(const InventoryListing& listing) {
  if (listing.quantity <= 0) {
    return 0;
  }
  if (!listing.is_playset) {
    return listing.quantity;
  }
  if (listing.quantity > std::numeric_limits<int>::max() / kCopiesPerPlayset) {
    return std::numeric_limits<int>::max();
  }
  return listing.quantity * kCopiesPerPlayset;
}

bool hasLocation(const InventoryListing& listing) {
  return listing.location.has_value() && !trim(*listing.location).empty();
}

}  // namespace domain
}  // namespace stockcheck
