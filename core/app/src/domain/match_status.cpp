#include "stockcheck/domain/match_status.hpp"

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// classify(): pure function of (has_matches, available, desired)
// -----------------------------------------------------------------------------
MatchStatus classify(bool has_matches, int available_quantity,
                     int desired_quantity) {
  if (!has_matches) {
    return MatchStatus::NotInStock;
  }
  if (available_quantity >= desired_quantity) {
    return MatchStatus::FullyAvailable;
  }
  return MatchStatus::PartiallyAvailable;
}

const char* matchStatusToString(MatchStatus status) {
  switch (status) {
    case MatchStatus::FullyAvailable:     return "FULLY_AVAILABLE";
    case MatchStatus::PartiallyAvailable: return "PARTIALLY_AVAILABLE";
    case MatchStatus::NotInStock:         return "NOT_IN_STOCK";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace stockcheck
