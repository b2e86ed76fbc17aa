#pragma once

#include "stockcheck/domain/condition.hpp"
#include "stockcheck/domain/language.hpp"

#include <optional>
#include <string>

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// InventoryListing: one sellable card variant in the inventory snapshot
// -----------------------------------------------------------------------------
//
// @brief  A single row of the stock export: a specific printing, grade,
//         language and finish of a card, with the number of copies on hand
//         and the asking price.
//
// @details
// Listings are created once per row by io::InventoryReader and are never
// mutated afterwards. The matcher, planner and renderers all work on
// const references or copies.
//
// quantity is already sanitised by the reader: it is a non-negative copy
// count, or zero when the export held something unparsable. For playset
// rows (is_playset) one unit of quantity stands for four physical copies;
// see effectiveQuantity().
//
// price is the unit price in the shop currency, parsed from a
// locale-formatted string ("1,50" or "1.50"). Zero when unparsable.
//
// location is the storage bin code ("A-0-1-4-L0"), std::nullopt when the
// export carried no location for the row.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct InventoryListing {
  std::string cardmarket_id;
  std::string name;              // English card name, the match key
  std::string set_name;          // e.g. "Magic 2010"
  std::string set_code;          // e.g. "M10"
  std::string collector_number;
  Condition condition{Condition::Unknown};
  Language language{Language::English};
  bool is_foil{false};
  bool is_signed{false};
  bool is_playset{false};
  int quantity{0};
  double price{0.0};
  std::optional<std::string> location;
  std::string comment;
  std::string rarity;

  // Localized names as exported; empty when the export has none.
  std::string name_de;
  std::string name_es;
  std::string name_fr;
  std::string name_it;
};

bool operator==(const InventoryListing& lhs, const InventoryListing& rhs);
bool operator!=(const InventoryListing& lhs, const InventoryListing& rhs);

// Card name in the given language's column, English when that column is
// empty.
const std::string& nameIn(const InventoryListing& listing, Language language);

// nameIn() for the listing's own printing language.
const std::string& localizedName(const InventoryListing& listing);

// Physical copies represented by the row (quantity * 4 for playsets),
// saturating at INT_MAX.
int effectiveQuantity(const InventoryListing& listing);

// True when the listing carries a non-blank storage location.
bool hasLocation(const InventoryListing& listing);

}  // namespace domain
}  // namespace stockcheck
