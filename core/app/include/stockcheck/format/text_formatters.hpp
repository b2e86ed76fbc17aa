#pragma once

#include "stockcheck/domain/match_result.hpp"
#include "stockcheck/planning/pick_planner.hpp"

#include <string>
#include <vector>

namespace stockcheck {
namespace format {

// -----------------------------------------------------------------------------
// Text renderers for reconciliation output
// -----------------------------------------------------------------------------
//
// @brief  Turn MatchResult / PickPlan sequences into console text.
//
// @details
// The renderers only read what the matcher and planner produced; they do
// not filter, merge or re-aggregate. Prices are printed with two decimals
// followed by " €".
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// formatSummary(results)
// -------------------------------------------------------------------------
// @brief  One line per want entry, then a totals line:
//
//   4 x Lightning Bolt: 5 available - Fully available
//   10 x Bolt: 5 available - Partially available (missing 5)
//   1 x Shock: 0 available - Not in stock
//   ========================
//   3 entries: 1 fully available, 1 partially available, 1 not in stock
// -------------------------------------------------------------------------
std::string formatSummary(const std::vector<domain::MatchResult>& results);

// -------------------------------------------------------------------------
// formatPickingList(results)
// -------------------------------------------------------------------------
// @brief  Per want entry a header line followed by one row per matched
//         listing:
//
//   4 x Lightning Bolt (Fully available, 5 on hand)
//       A-0-1-4          | 2x | M10 #146 | NM | English | Non-foil | 1.50 €
//       location unknown | 3x | M10 #146 | EX | German  | Foil | 2.00 € | Signed
//
// @details
// Rows within one want entry are ordered by storage location
// (locationLess(); listings without a location come last, ties keep
// inventory order). Listings sharing a location stay on separate rows
// even when only their grade or finish differs. Entries that are not in
// stock get a single "(not in stock)" row.
// -------------------------------------------------------------------------
std::string formatPickingList(const std::vector<domain::MatchResult>& results);

// -------------------------------------------------------------------------
// formatInvoiceList(plans)
// -------------------------------------------------------------------------
// @brief  Aligned table of picked copies with unit price, line total and a
//         grand total. Plans with no lines are left out.
// -------------------------------------------------------------------------
std::string formatInvoiceList(const std::vector<planning::PickPlan>& plans);

// -------------------------------------------------------------------------
// formatStockUpdateCsv(plans)
// -------------------------------------------------------------------------
// @brief  Stock export CSV with the picked quantities negated, ready to
//         be imported as a stock reduction. Fields containing commas or
//         quotes are quoted.
// -------------------------------------------------------------------------
std::string formatStockUpdateCsv(const std::vector<planning::PickPlan>& plans);

// "Fully available", "Partially available (missing N)", "Not in stock".
std::string statusLabel(const domain::MatchResult& result);

}  // namespace format
}  // namespace stockcheck
