#pragma once

#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/match_result.hpp"
#include "stockcheck/planning/pick_planner.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace stockcheck {
namespace format {

// -----------------------------------------------------------------------------
// JSON rendering (nlohmann::json)
// -----------------------------------------------------------------------------
// Used by the "json" output format and by the command endpoint. Enum
// values are written as strings; a listing without a location writes
// "location": null.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::InventoryListing& listing);
nlohmann::json toJson(const domain::MatchResult& result);
nlohmann::json toJson(const std::vector<domain::MatchResult>& results);
nlohmann::json toJson(const planning::PickPlan& plan);
nlohmann::json toJson(const std::vector<planning::PickPlan>& plans);

}  // namespace format
}  // namespace stockcheck
