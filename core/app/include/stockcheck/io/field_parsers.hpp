#pragma once

#include <optional>
#include <string_view>

namespace stockcheck {
namespace io {

// -----------------------------------------------------------------------------
// Field parsers: parse-or-default adapters for export columns
// -----------------------------------------------------------------------------
//
// @brief  Convert raw text columns into typed values without throwing.
//
// @details
// Every parser returns std::nullopt on failure; the *OrZero variants apply
// the tolerant default the readers use. This keeps sanitisation at the
// reader boundary so the matcher only ever sees clean values.
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// parseQuantity(text)
// -------------------------------------------------------------------------
// @brief  Parses a non-negative copy count.
//
// @return The count, or std::nullopt for empty text, signs, decimals,
//         non-digit characters or values beyond int range.
// -------------------------------------------------------------------------
std::optional<int> parseQuantity(std::string_view text);

int quantityOrZero(std::string_view text);

// -------------------------------------------------------------------------
// parsePrice(text)
// -------------------------------------------------------------------------
// @brief  Parses a locale-formatted decimal ("1.50", "1,50", "1.234,50",
//         "1,234.50").
//
// @details
// Either '.' or ',' may be the decimal separator. When both occur, the
// one appearing last is the decimal separator and every occurrence of the
// other is treated as a thousands separator. When only one kind occurs,
// a single occurrence is the decimal separator; several occurrences of
// the same character are thousands separators ("1.234.567").
// A trailing currency sign or code is not accepted.
//
// @return The value, or std::nullopt for empty or malformed text and for
//         negative prices.
// -------------------------------------------------------------------------
std::optional<double> parsePrice(std::string_view text);

double priceOrZero(std::string_view text);

// "1", "true", "yes", "x" (any case) → true. Everything else → false.
bool parseFlag(std::string_view text);

}  // namespace io
}  // namespace stockcheck
