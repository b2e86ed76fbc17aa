#include "stockcheck/domain/condition.hpp"

#include "stockcheck/text/text_utils.hpp"

namespace stockcheck {
namespace domain {

namespace {

struct GradeSpelling {
  Condition condition;
  const char* code;
  const char* name;
};

// Both spellings the export uses. "Lightly Played" shows up in older
// exports next to the current "Light Played".
constexpr GradeSpelling kSpellings[] = {
    {Condition::Mint, "MT", "Mint"},
    {Condition::NearMint, "NM", "Near Mint"},
    {Condition::Excellent, "EX", "Excellent"},
    {Condition::Good, "GD", "Good"},
    {Condition::LightPlayed, "LP", "Light Played"},
    {Condition::LightPlayed, "LP", "Lightly Played"},
    {Condition::Played, "PL", "Played"},
    {Condition::Poor, "PO", "Poor"},
};

}  // namespace

Condition parseCondition(std::string_view text) {
  std::string_view trimmed = trim(text);
  for (const auto& spelling : kSpellings) {
    if (iequals(trimmed, spelling.code) || iequals(trimmed, spelling.name)) {
      return spelling.condition;
    }
  }
  return Condition::Unknown;
}

const char* conditionCode(Condition condition) {
  switch (condition) {
    case Condition::Mint:        return "MT";
    case Condition::NearMint:    return "NM";
    case Condition::Excellent:   return "EX";
    case Condition::Good:        return "GD";
    case Condition::LightPlayed: return "LP";
    case Condition::Played:      return "PL";
    case Condition::Poor:        return "PO";
    case Condition::Unknown:     return "??";
  }
  return "??";
}

}  // namespace domain
}  // namespace stockcheck
