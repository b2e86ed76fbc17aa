#include "stockcheck/planning/pick_planner.hpp"

#include <algorithm>

namespace stockcheck {
namespace planning {

// -----------------------------------------------------------------------------
// planEntry(): order candidates, then allocate greedily
// -----------------------------------------------------------------------------
PickPlan planEntry(const domain::MatchResult& result,
                   const PlanOptions& options) {
  PickPlan plan;
  plan.want = result.want;

  std::vector<const domain::InventoryListing*> candidates;
  candidates.reserve(result.matches.size());
  for (const auto& listing : result.matches) {
    candidates.push_back(&listing);
  }

  auto preferred = [&options](const domain::InventoryListing* l) {
    return options.preferred_language &&
           l->language == *options.preferred_language;
  };

  // stable_sort keeps inventory order among equally ranked listings.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [&preferred](const domain::InventoryListing* a,
                                const domain::InventoryListing* b) {
                     bool pa = preferred(a);
                     bool pb = preferred(b);
                     if (pa != pb) {
                       return pa;
                     }
                     return a->price < b->price;
                   });

  int remaining = result.want.quantity;
  for (const auto* listing : candidates) {
    if (remaining <= 0) {
      break;
    }
    int on_hand = domain::effectiveQuantity(*listing);
    if (on_hand <= 0) {
      continue;
    }
    int take = std::min(remaining, on_hand);
    plan.lines.push_back(PickLine{*listing, take});
    plan.picked_quantity += take;
    remaining -= take;
  }

  plan.shortfall = std::max(remaining, 0);
  return plan;
}

std::vector<PickPlan> planPicks(const std::vector<domain::MatchResult>& results,
                                const PlanOptions& options) {
  std::vector<PickPlan> plans;
  plans.reserve(results.size());
  for (const auto& result : results) {
    plans.push_back(planEntry(result, options));
  }
  return plans;
}

}  // namespace planning
}  // namespace stockcheck
