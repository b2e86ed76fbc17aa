#include "stockcheck/domain/language.hpp"

#include "stockcheck/text/text_utils.hpp"

namespace stockcheck {
namespace domain {

namespace {

constexpr Language kAllLanguages[] = {
    Language::English, Language::German, Language::Spanish,
    Language::French,  Language::Italian,
};

}  // namespace

// -----------------------------------------------------------------------------
// parseLanguage(): full name or two-letter code
// -----------------------------------------------------------------------------
std::optional<Language> parseLanguage(std::string_view text) {
  std::string_view trimmed = trim(text);
  for (Language language : kAllLanguages) {
    if (iequals(trimmed, languageName(language)) ||
        iequals(trimmed, languageCode(language))) {
      return language;
    }
  }
  return std::nullopt;
}

const char* languageName(Language language) {
  switch (language) {
    case Language::English: return "English";
    case Language::German:  return "German";
    case Language::Spanish: return "Spanish";
    case Language::French:  return "French";
    case Language::Italian: return "Italian";
  }
  return "Unknown";
}

const char* languageCode(Language language) {
  switch (language) {
    case Language::English: return "en";
    case Language::German:  return "de";
    case Language::Spanish: return "es";
    case Language::French:  return "fr";
    case Language::Italian: return "it";
  }
  return "??";
}

}  // namespace domain
}  // namespace stockcheck
