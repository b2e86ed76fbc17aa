#pragma once

#include "stockcheck/domain/inventory_listing.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stockcheck {
namespace analysis {

// Fill level of one storage bin.
struct BinUsage {
  std::string location;  // "A-0-1-4"
  int cards{0};
  int free_slots{0};     // may be negative for overfilled bins
};

enum class BinSortOrder {
  ByFreeSlots,  // most free slots first, then by location
  ByLocation,
};

// -----------------------------------------------------------------------------
// BinAnalyzer: free space per storage bin
// -----------------------------------------------------------------------------
//
// @brief  Sums listed quantities per storage bin and reports the bins that
//         still have room for new stock.
//
// @details
// A listing's bin is the first four '-' separated parts of its location
// ("A-0-1-4-L0-R" → "A-0-1-4"), provided there are at least four parts and
// the fourth is numeric. Listings without such a location are not counted
// anywhere. Quantities are listing quantities (playsets count once, as in
// the stock export).
//
// Thread model:
//   Immutable after construction; analyze() is const and may run
//   concurrently.
// -----------------------------------------------------------------------------
class BinAnalyzer {
 public:
  static constexpr int kDefaultCapacity = 60;

  explicit BinAnalyzer(int capacity = kDefaultCapacity);

  // -------------------------------------------------------------------------
  // analyze(inventory, min_free_slots, order)
  // -------------------------------------------------------------------------
  //
  // @brief  Returns every bin with at least min_free_slots free slots.
  //
  // @param  inventory       Listings to count.
  // @param  min_free_slots  Threshold; 0 returns all non-overfilled bins.
  // @param  order           Result ordering.
  // -------------------------------------------------------------------------
  std::vector<BinUsage> analyze(
      const std::vector<domain::InventoryListing>& inventory,
      int min_free_slots,
      BinSortOrder order = BinSortOrder::ByFreeSlots) const;

  int capacity() const { return capacity_; }

  // "A-0-1-4-L0" → "A-0-1-4"; std::nullopt when the location names no bin.
  static std::optional<std::string> binOf(std::string_view location);

 private:
  int capacity_;
};

// Renders the report: a heading with the bin capacity, then
// "<bin>: <cards> cards (<free> slots free)" per bin.
std::string formatBinReport(const std::vector<BinUsage>& bins, int capacity);

}  // namespace analysis
}  // namespace stockcheck
