#pragma once

#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/match_status.hpp"
#include "stockcheck/domain/want_entry.hpp"

#include <vector>

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// MatchResult: reconciliation output for one want entry
// -----------------------------------------------------------------------------
//
// @brief  Carries the originating want entry, every listing that satisfies
//         its name, the summed on-hand quantity and the derived status.
//
// @details
// matches keeps the full listings rather than a count so that renderers
// can show per-row detail (location, grade, language, finish, price).
// Listings appear in inventory order.
//
// Invariant: status == classify(!matches.empty(), available_quantity,
//            want.quantity).
//
// Ownership:
//   Holds copies, so a result stays valid after the inventory snapshot it
//   was computed from has been replaced.
// -----------------------------------------------------------------------------
struct MatchResult {
  WantEntry want;
  std::vector<InventoryListing> matches;
  int available_quantity{0};
  MatchStatus status{MatchStatus::NotInStock};
};

inline bool operator==(const MatchResult& lhs, const MatchResult& rhs) {
  return lhs.want == rhs.want && lhs.matches == rhs.matches &&
         lhs.available_quantity == rhs.available_quantity &&
         lhs.status == rhs.status;
}

inline bool operator!=(const MatchResult& lhs, const MatchResult& rhs) {
  return !(lhs == rhs);
}

}  // namespace domain
}  // namespace stockcheck
