#pragma once

#include <string>

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// WantEntry: one line of a want-list ("4 Lightning Bolt")
// -----------------------------------------------------------------------------
// quantity is always positive; io::WantsListReader drops lines that do not
// carry a positive leading integer.
// -----------------------------------------------------------------------------
struct WantEntry {
  int quantity{0};
  std::string name;
};

inline bool operator==(const WantEntry& lhs, const WantEntry& rhs) {
  return lhs.quantity == rhs.quantity && lhs.name == rhs.name;
}

inline bool operator!=(const WantEntry& lhs, const WantEntry& rhs) {
  return !(lhs == rhs);
}

}  // namespace domain
}  // namespace stockcheck
