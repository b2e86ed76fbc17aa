#pragma once

#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/language.hpp"
#include "stockcheck/domain/match_result.hpp"
#include "stockcheck/domain/want_entry.hpp"

#include <optional>
#include <vector>

namespace stockcheck {
namespace matching {

// -----------------------------------------------------------------------------
// MatchOptions
// -----------------------------------------------------------------------------
// language_filter restricts matching to listings printed in one language
// (the "preferred language only" switch of the stock checker) and lets the
// want-list use that language's card names. Unset by default, in which
// case every language matches.
// -----------------------------------------------------------------------------
struct MatchOptions {
  std::optional<domain::Language> language_filter;
};

// -----------------------------------------------------------------------------
// match(inventory, wants): stock reconciliation
// -----------------------------------------------------------------------------
//
// @brief  Reconciles a want-list against an inventory snapshot, producing
//         one MatchResult per want entry in want-list order.
//
// @details
// For each want entry:
//   1. Keep the listings whose English name, or one of its localized
//      names (nameDE/ES/FR/IT), equals the wanted name, compared
//      case-insensitively (ASCII). With a language filter only listings
//      in that language are kept, matched on the English name or the
//      name in that language. No trimming and no fuzzy matching.
//      Inventory order is preserved.
//   2. Sum the physical copies of the kept listings (effectiveQuantity:
//      playsets count four per unit, negative quantities count as zero).
//      The sum saturates at INT_MAX.
//   3. Classify with domain::classify().
//
// Matching is by display name only; two printings of the same card are
// the same card here, and a card whose export names all differ from the
// want-list spelling will not match.
//
// Properties:
//   - Total: never throws, never fails. Empty inputs are fine.
//   - Pure: no I/O, no shared state. Identical inputs give identical
//     output, in the same order.
//   - O(|inventory| × |wants|).
//
// Thread model:
//   Safe to call concurrently from several threads as long as each caller
//   holds its own (or an immutable shared) inventory.
// -----------------------------------------------------------------------------
std::vector<domain::MatchResult> match(
    const std::vector<domain::InventoryListing>& inventory,
    const std::vector<domain::WantEntry>& wants);

std::vector<domain::MatchResult> match(
    const std::vector<domain::InventoryListing>& inventory,
    const std::vector<domain::WantEntry>& wants, const MatchOptions& options);

// Reconciles a single want entry. match() is this function applied to
// every entry in order.
domain::MatchResult matchEntry(
    const std::vector<domain::InventoryListing>& inventory,
    const domain::WantEntry& want, const MatchOptions& options = {});

}  // namespace matching
}  // namespace stockcheck
