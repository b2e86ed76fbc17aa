#pragma once

#include "stockcheck/domain/want_entry.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stockcheck {
namespace io {

struct WantsList {
  std::vector<domain::WantEntry> entries;
  std::size_t skipped_lines{0};  // malformed lines, not blanks or headers
};

// -----------------------------------------------------------------------------
// WantsListReader: deck-list style text → WantEntry lines
// -----------------------------------------------------------------------------
//
// @brief  Reads "<quantity> <card name>" lines as exported by deck builders.
//
// @details
//   - Blank lines and the section header "Deck" are ignored silently.
//   - Every other line must be a positive integer, a space, and a
//     non-empty name. Lines that are not are skipped, counted and logged
//     as warnings; they never abort the read.
//   - The name keeps its inner spacing and punctuation; surrounding
//     whitespace is removed.
//
// Thread model:
//   Stateless; the static functions may be called from any thread.
// -----------------------------------------------------------------------------
class WantsListReader {
 public:
  static WantsList read(std::istream& input);

  // Convenience for want-lists that arrive as a string (command endpoint).
  static WantsList parse(const std::string& text);

  // @throws InputError if the file cannot be opened.
  static WantsList readFile(const std::string& path);

  // Parses a single line. std::nullopt for malformed lines; blank lines and
  // headers must be filtered by the caller.
  static std::optional<domain::WantEntry> parseLine(std::string_view line);

  static constexpr std::string_view kDeckHeader = "Deck";
};

}  // namespace io
}  // namespace stockcheck
