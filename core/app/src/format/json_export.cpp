#include "stockcheck/format/json_export.hpp"

#include <utility>

namespace stockcheck {
namespace format {

nlohmann::json toJson(const domain::InventoryListing& listing) {
  nlohmann::json j;
  j["cardmarket_id"] = listing.cardmarket_id;
  j["name"] = listing.name;
  j["localized_name"] = domain::localizedName(listing);
  j["set"] = listing.set_name;
  j["set_code"] = listing.set_code;
  j["collector_number"] = listing.collector_number;
  j["condition"] = domain::conditionCode(listing.condition);
  j["language"] = domain::languageName(listing.language);
  j["is_foil"] = listing.is_foil;
  j["is_signed"] = listing.is_signed;
  j["is_playset"] = listing.is_playset;
  j["quantity"] = listing.quantity;
  j["price"] = listing.price;
  if (domain::hasLocation(listing)) {
    j["location"] = *listing.location;
  } else {
    j["location"] = nullptr;
  }
  j["comment"] = listing.comment;
  j["rarity"] = listing.rarity;
  return j;
}

nlohmann::json toJson(const domain::MatchResult& result) {
  nlohmann::json j;
  j["name"] = result.want.name;
  j["desired_quantity"] = result.want.quantity;
  j["available_quantity"] = result.available_quantity;
  j["status"] = domain::matchStatusToString(result.status);

  nlohmann::json matches = nlohmann::json::array();
  for (const auto& listing : result.matches) {
    matches.push_back(toJson(listing));
  }
  j["matches"] = std::move(matches);
  return j;
}

nlohmann::json toJson(const std::vector<domain::MatchResult>& results) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& result : results) {
    j.push_back(toJson(result));
  }
  return j;
}

nlohmann::json toJson(const planning::PickPlan& plan) {
  nlohmann::json j;
  j["name"] = plan.want.name;
  j["desired_quantity"] = plan.want.quantity;
  j["picked_quantity"] = plan.picked_quantity;
  j["shortfall"] = plan.shortfall;

  nlohmann::json lines = nlohmann::json::array();
  for (const auto& line : plan.lines) {
    nlohmann::json l;
    l["quantity"] = line.quantity;
    l["listing"] = toJson(line.listing);
    lines.push_back(std::move(l));
  }
  j["lines"] = std::move(lines);
  return j;
}

nlohmann::json toJson(const std::vector<planning::PickPlan>& plans) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& plan : plans) {
    j.push_back(toJson(plan));
  }
  return j;
}

}  // namespace format
}  // namespace stockcheck
