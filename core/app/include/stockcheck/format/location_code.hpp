#pragma once

#include <string_view>
#include <vector>

namespace stockcheck {
namespace format {

// -----------------------------------------------------------------------------
// parseLocationCode(location)
// -----------------------------------------------------------------------------
//
// @brief  Turns a storage location such as "B-2-10-3-L0-R" into a sort key.
//
// @details
// Everything from the first "-L0" on is ignored. The remainder is split on
// '-': the first part's leading letter gives the bay (A=1, B=2, C=3, D=4,
// anything else 0), every following part is read as an integer (0 when it
// is not one). Keys compare lexicographically, so "A-0-2" sorts before
// "A-0-10" and every A bay before every B bay.
// -----------------------------------------------------------------------------
std::vector<int> parseLocationCode(std::string_view location);

// Strict weak ordering on locations via parseLocationCode(); blank
// locations sort after every real one.
bool locationLess(std::string_view lhs, std::string_view rhs);

}  // namespace format
}  // namespace stockcheck
