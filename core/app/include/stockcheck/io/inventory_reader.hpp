#pragma once

#include "stockcheck/domain/inventory_listing.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace stockcheck {
namespace io {

// -----------------------------------------------------------------------------
// InventoryReadResult
// -----------------------------------------------------------------------------
// listings holds the accepted rows in file order. skipped_rows counts rows
// dropped because their price or quantity column was empty.
// -----------------------------------------------------------------------------
struct InventoryReadResult {
  std::vector<domain::InventoryListing> listings;
  std::size_t skipped_rows{0};
};

// -----------------------------------------------------------------------------
// InventoryReader: delimited stock export → InventoryListing rows
// -----------------------------------------------------------------------------
//
// @brief  Reads the Cardmarket stock export (and the shop's own variant of
//         it with an extra "location" column) into listings.
//
// @details
// Format handling:
//   - The first non-empty line is the header. Columns are located by
//     header name (case-insensitive), so column order does not matter and
//     absent columns simply read as empty.
//   - The delimiter is detected from the header: ';' if the header holds
//     more semicolons than commas, ',' otherwise.
//   - Fields may be double-quoted; a doubled quote inside a quoted field
//     is a literal quote. Quoted fields may contain the delimiter but not
//     line breaks.
//   - Every field is trimmed.
//
// Row policy (tolerant, never throws for bad rows):
//   - Rows whose price or quantity field is empty are skipped and counted.
//   - A quantity that does not parse becomes 0, a price that does not
//     parse becomes 0.0.
//   - An unknown language becomes English; an unknown grade becomes
//     Condition::Unknown. Both are logged as warnings.
//   - An empty location column becomes std::nullopt.
//
// Recognised columns: cardmarketId, quantity, name, set, setCode, cn,
// condition, language, isFoil, isSigned, isPlayset, price, comment,
// location, rarity, nameDE, nameES, nameFR, nameIT.
//
// Thread model:
//   Stateless; the static functions may be called from any thread.
// -----------------------------------------------------------------------------
class InventoryReader {
 public:
  // -------------------------------------------------------------------------
  // read(input)
  // -------------------------------------------------------------------------
  //
  // @brief  Parses an export from an already opened stream.
  //
  // @return Accepted listings plus the count of skipped rows. An empty
  //         stream, or one with only a header, yields no listings.
  // -------------------------------------------------------------------------
  static InventoryReadResult read(std::istream& input);

  // -------------------------------------------------------------------------
  // readFile(path)
  // -------------------------------------------------------------------------
  //
  // @brief  Opens path and delegates to read().
  //
  // @throws InputError if the file cannot be opened.
  // -------------------------------------------------------------------------
  static InventoryReadResult readFile(const std::string& path);

  // Splits one line on delimiter, honouring double quotes. Exposed for tests.
  static std::vector<std::string> splitRecord(const std::string& line,
                                              char delimiter);
};

}  // namespace io
}  // namespace stockcheck
