#include "stockcheck/analysis/bin_analyzer.hpp"

#include "stockcheck/format/location_code.hpp"
#include "stockcheck/io/field_parsers.hpp"
#include "stockcheck/text/text_utils.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <sstream>

namespace stockcheck {
namespace analysis {

BinAnalyzer::BinAnalyzer(int capacity) : capacity_(capacity) {}

// -----------------------------------------------------------------------------
// binOf(): first four parts, fourth must be numeric
// -----------------------------------------------------------------------------
std::optional<std::string> BinAnalyzer::binOf(std::string_view location) {
  std::string_view text = trim(location);
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (parts.size() < 4) {
    std::size_t dash = text.find('-', start);
    if (dash == std::string_view::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, dash - start));
    start = dash + 1;
  }

  if (parts.size() < 4 || !io::parseQuantity(parts[3])) {
    return std::nullopt;
  }

  std::string bin;
  for (std::size_t i = 0; i < 4; ++i) {
    if (i > 0) {
      bin += '-';
    }
    bin += parts[i];
  }
  return bin;
}

// -----------------------------------------------------------------------------
// analyze(): sum per bin, filter by free slots, order
// -----------------------------------------------------------------------------
std::vector<BinUsage> BinAnalyzer::analyze(
    const std::vector<domain::InventoryListing>& inventory,
    int min_free_slots, BinSortOrder order) const {
  // std::map keeps the aggregation deterministic before sorting.
  std::map<std::string, long long> cards_per_bin;
  for (const auto& listing : inventory) {
    if (!domain::hasLocation(listing)) {
      continue;
    }
    if (auto bin = binOf(*listing.location)) {
      cards_per_bin[*bin] += std::max(listing.quantity, 0);
    }
  }

  std::vector<BinUsage> bins;
  for (const auto& [location, total] : cards_per_bin) {
    int cards = static_cast<int>(
        std::min<long long>(total, std::numeric_limits<int>::max()));
    int free_slots = capacity_ - cards;
    if (free_slots >= min_free_slots) {
      bins.push_back(BinUsage{location, cards, free_slots});
    }
  }

  auto by_location = [](const BinUsage& a, const BinUsage& b) {
    if (a.location == b.location) {
      return false;
    }
    auto ka = format::parseLocationCode(a.location);
    auto kb = format::parseLocationCode(b.location);
    return ka != kb ? ka < kb : a.location < b.location;
  };

  if (order == BinSortOrder::ByFreeSlots) {
    std::sort(bins.begin(), bins.end(),
              [&by_location](const BinUsage& a, const BinUsage& b) {
                if (a.free_slots != b.free_slots) {
                  return a.free_slots > b.free_slots;
                }
                return by_location(a, b);
              });
  } else {
    std::sort(bins.begin(), bins.end(), by_location);
  }
  return bins;
}

std::string formatBinReport(const std::vector<BinUsage>& bins, int capacity) {
  std::ostringstream out;
  out << "Bin Analysis (Maximum Capacity per Bin: " << capacity << " cards)\n"
      << "-----------------------------------------------\n\n";
  if (bins.empty()) {
    out << "No bins with enough free slots.\n";
    return out.str();
  }
  for (const auto& bin : bins) {
    out << bin.location << ": " << bin.cards << " cards (" << bin.free_slots
        << " slots free)\n";
  }
  return out.str();
}

}  // namespace analysis
}  // namespace stockcheck
