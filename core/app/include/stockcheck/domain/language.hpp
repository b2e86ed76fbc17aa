#pragma once

#include <optional>
#include <string_view>

namespace stockcheck {
namespace domain {

// -----------------------------------------------------------------------------
// Language: printing language of a listing
// -----------------------------------------------------------------------------
//
// @brief  The five languages the shop stocks. The inventory export spells
//         them out ("German"), the UI and want-list tooling use the
//         two-letter code ("de").
//
// Thread model:
//   Plain enum, value type. Thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class Language {
  English,
  German,
  Spanish,
  French,
  Italian,
};

// -----------------------------------------------------------------------------
// parseLanguage(text)
// -----------------------------------------------------------------------------
//
// @brief  Accepts full names and two-letter codes, case-insensitively.
//
// @return The language, or std::nullopt if the text names none of the five.
// -----------------------------------------------------------------------------
std::optional<Language> parseLanguage(std::string_view text);

const char* languageName(Language language);
const char* languageCode(Language language);

}  // namespace domain
}  // namespace stockcheck
