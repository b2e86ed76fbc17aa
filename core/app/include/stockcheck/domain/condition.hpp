#pragma once

#include <string_view>

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// Condition: Cardmarket card grading scale
// -----------------------------------------------------------------------------
//
// @brief  Enumerates the grades a listing can carry, best to worst.
//
// @details
// The inventory export writes either the two-letter grade code ("NM") or
// the full grade name ("Near Mint"). Anything the reader does not
// recognise maps to Unknown instead of rejecting the row; the grade is
// display information only and never takes part in matching.
// -----------------------------------------------------------------------------
enum class Condition {
  Mint,         // MT
  NearMint,     // NM
  Excellent,    // EX
  Good,         // GD
  LightPlayed,  // LP
  Played,       // PL
  Poor,         // PO
  Unknown,
};

Condition parseCondition(std::string_view text);

// Two-letter grade code, "??" for Unknown.
const char* conditionCode(Condition condition);

}  // namespace domain
}  // namespace stockcheck
