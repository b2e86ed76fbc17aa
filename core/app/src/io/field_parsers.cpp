#include "stockcheck/io/field_parsers.hpp"

#include "stockcheck/text/text_utils.hpp"

#include <cctype>
#include <limits>
#include <locale>
#include <sstream>
#include <string>

namespace stockcheck {
namespace io {

namespace {

bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Rewrites a locale-formatted number into "1234.50" form. Returns an empty
// string when the separators cannot be interpreted.
std::string normalizeDecimal(std::string_view text) {
  std::size_t dots = 0;
  std::size_t commas = 0;
  std::size_t last_dot = std::string_view::npos;
  std::size_t last_comma = std::string_view::npos;

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '.') {
      ++dots;
      last_dot = i;
    } else if (c == ',') {
      ++commas;
      last_comma = i;
    } else if (!isDigit(c)) {
      return {};
    }
  }

  // Pick the decimal separator; the other character groups thousands.
  char decimal = '\0';
  char grouping = '\0';
  if (dots > 0 && commas > 0) {
    decimal = (last_dot > last_comma) ? '.' : ',';
    grouping = (decimal == '.') ? ',' : '.';
    if ((decimal == '.' ? dots : commas) != 1) {
      return {};
    }
  } else if (dots == 1) {
    decimal = '.';
  } else if (commas == 1) {
    decimal = ',';
  } else if (dots > 1) {
    grouping = '.';
  } else if (commas > 1) {
    grouping = ',';
  }

  std::string out;
  out.reserve(text.size());
  bool has_digit = false;
  for (char c : text) {
    if (c == grouping) {
      continue;
    }
    if (c == decimal) {
      out.push_back('.');
    } else {
      has_digit = true;
      out.push_back(c);
    }
  }
  return has_digit ? out : std::string{};
}

}  // namespace

// -----------------------------------------------------------------------------
// parseQuantity(): digits only, bounded by int range
// -----------------------------------------------------------------------------
std::optional<int> parseQuantity(std::string_view text) {
  std::string_view trimmed = trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  long long value = 0;
  for (char c : trimmed) {
    if (!isDigit(c)) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
    if (value > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
  }
  return static_cast<int>(value);
}

int quantityOrZero(std::string_view text) {
  return parseQuantity(text).value_or(0);
}

// -----------------------------------------------------------------------------
// parsePrice(): normalise separators, then parse in the classic locale
// -----------------------------------------------------------------------------
std::optional<double> parsePrice(std::string_view text) {
  std::string_view trimmed = trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  std::string normalized = normalizeDecimal(trimmed);
  if (normalized.empty()) {
    return std::nullopt;
  }

  // The global locale may use ',' as decimal point; parse in "C".
  std::istringstream stream(normalized);
  stream.imbue(std::locale::classic());
  double value = 0.0;
  stream >> value;
  if (stream.fail() || stream.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }
  return value;
}

double priceOrZero(std::string_view text) {
  return parsePrice(text).value_or(0.0);
}

bool parseFlag(std::string_view text) {
  std::string_view trimmed = trim(text);
  return trimmed == "1" || iequals(trimmed, "true") ||
         iequals(trimmed, "yes") || iequals(trimmed, "x");
}

}  // namespace io
}  // namespace stockcheck
