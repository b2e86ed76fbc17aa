#pragma once

#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/language.hpp"
#include "stockcheck/domain/match_result.hpp"
#include "stockcheck/domain/want_entry.hpp"

#include <optional>
#include <vector>

namespace stockcheck {
namespace planning {

// One listing chosen for fulfilment and how many copies to take from it.
struct PickLine {
  domain::InventoryListing listing;
  int quantity{0};
};

// -----------------------------------------------------------------------------
// PickPlan: copies to pull for one want entry
// -----------------------------------------------------------------------------
// picked_quantity is the sum of lines[].quantity and never exceeds
// want.quantity. shortfall = want.quantity - picked_quantity.
// -----------------------------------------------------------------------------
struct PickPlan {
  domain::WantEntry want;
  std::vector<PickLine> lines;
  int picked_quantity{0};
  int shortfall{0};
};

struct PlanOptions {
  std::optional<domain::Language> preferred_language;
};

// -----------------------------------------------------------------------------
// planPicks(results, options)
// -----------------------------------------------------------------------------
//
// @brief  Decides which listings to pull copies from to fill each want.
//
// @details
// Candidates for a want entry are its MatchResult::matches ordered by
//   1. preferred language first (when options.preferred_language is set),
//   2. ascending unit price,
// with ties left in inventory order. Copies are then taken greedily until
// the desired quantity is reached. A listing contributes at most
// domain::effectiveQuantity() copies; listings with no copies on hand are
// skipped.
//
// Entries that are not in stock produce a plan with no lines and the full
// quantity as shortfall. One plan per result, in result order.
//
// Thread model: pure function, safe from any thread.
// -----------------------------------------------------------------------------
std::vector<PickPlan> planPicks(const std::vector<domain::MatchResult>& results,
                                const PlanOptions& options = {});

PickPlan planEntry(const domain::MatchResult& result,
                   const PlanOptions& options = {});

}  // namespace planning
}  // namespace stockcheck
