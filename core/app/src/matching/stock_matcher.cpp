#include "stockcheck/matching/stock_matcher.hpp"

#include "stockcheck/text/text_utils.hpp"

#include <algorithm>
#include <limits>

namespace stockcheck {
namespace matching {

namespace {

constexpr domain::Language kLocalizedLanguages[] = {
    domain::Language::German, domain::Language::Spanish,
    domain::Language::French, domain::Language::Italian,
};

// With a language filter the listing must be printed in that language and
// the wanted name may be the English one or the one in that language.
// Without a filter any of the listing's names will do.
bool accepts(const domain::InventoryListing& listing,
             const domain::WantEntry& want, const MatchOptions& options) {
  if (options.language_filter) {
    if (listing.language != *options.language_filter) {
      return false;
    }
    return iequals(listing.name, want.name) ||
           iequals(domain::nameIn(listing, *options.language_filter),
                   want.name);
  }

  if (iequals(listing.name, want.name)) {
    return true;
  }
  for (domain::Language language : kLocalizedLanguages) {
    if (iequals(domain::nameIn(listing, language), want.name)) {
      return true;
    }
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// matchEntry(): filter (stable), sum physical copies, classify
// -----------------------------------------------------------------------------
domain::MatchResult matchEntry(
    const std::vector<domain::InventoryListing>& inventory,
    const domain::WantEntry& want, const MatchOptions& options) {
  domain::MatchResult result;
  result.want = want;

  // Rows may each hold up to INT_MAX copies; sum wide and clamp.
  long long available = 0;
  for (const auto& listing : inventory) {
    if (accepts(listing, want, options)) {
      result.matches.push_back(listing);
      available += domain::effectiveQuantity(listing);
    }
  }
  result.available_quantity = static_cast<int>(std::min<long long>(
      available, std::numeric_limits<int>::max()));

  result.status = domain::classify(!result.matches.empty(),
                                   result.available_quantity, want.quantity);
  return result;
}

std::vector<domain::MatchResult> match(
    const std::vector<domain::InventoryListing>& inventory,
    const std::vector<domain::WantEntry>& wants, const MatchOptions& options) {
  std::vector<domain::MatchResult> results;
  results.reserve(wants.size());
  for (const auto& want : wants) {
    results.push_back(matchEntry(inventory, want, options));
  }
  return results;
}

std::vector<domain::MatchResult> match(
    const std::vector<domain::InventoryListing>& inventory,
    const std::vector<domain::WantEntry>& wants) {
  return match(inventory, wants, MatchOptions{});
}

}  // namespace matching
}  // namespace stockcheck
