#pragma once

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// MatchStatus: availability classification of one want entry
// -----------------------------------------------------------------------------
//
// @brief  Outcome of reconciling a want entry against the inventory.
//
// @details
// NotInStock is an ordinary result, not an error. The classification is a
// pure function of three values (see classify()):
//
//   no matching listing               → NotInStock
//   summed quantity >= desired        → FullyAvailable
//   otherwise                         → PartiallyAvailable
//
// A want entry whose only matches carry quantity zero is therefore
// PartiallyAvailable: the card is listed but no copy is on hand.
// -----------------------------------------------------------------------------
enum class MatchStatus {
  FullyAvailable,
  PartiallyAvailable,
  NotInStock,
};

MatchStatus classify(bool has_matches, int available_quantity,
                     int desired_quantity);

// "FULLY_AVAILABLE", "PARTIALLY_AVAILABLE", "NOT_IN_STOCK".
const char* matchStatusToString(MatchStatus status);

}  // namespace domain
}  // namespace stockcheck
