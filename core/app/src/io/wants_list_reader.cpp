#include "stockcheck/io/wants_list_reader.hpp"

#include "stockcheck/errors.hpp"
#include "stockcheck/io/field_parsers.hpp"
#include "stockcheck/text/text_utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace stockcheck {
namespace io {

// -----------------------------------------------------------------------------
// parseLine(): "<positive integer> <name>"
// -----------------------------------------------------------------------------
std::optional<domain::WantEntry> WantsListReader::parseLine(
    std::string_view line) {
  std::string_view trimmed = trim(line);
  std::size_t space = trimmed.find(' ');
  if (space == std::string_view::npos) {
    return std::nullopt;
  }

  auto quantity = parseQuantity(trimmed.substr(0, space));
  if (!quantity || *quantity <= 0) {
    return std::nullopt;
  }

  std::string_view name = trim(trimmed.substr(space + 1));
  if (name.empty()) {
    return std::nullopt;
  }

  domain::WantEntry entry;
  entry.quantity = *quantity;
  entry.name = std::string(name);
  return entry;
}

WantsList WantsListReader::read(std::istream& input) {
  WantsList result;
  std::string line;

  while (std::getline(input, line)) {
    std::string_view trimmed = trim(line);
    if (trimmed.empty() || trimmed == kDeckHeader) {
      continue;
    }

    if (auto entry = parseLine(trimmed)) {
      result.entries.push_back(std::move(*entry));
    } else {
      std::cerr << "[WantsListReader] WARNING: could not parse line: "
                << trimmed << "\n";
      ++result.skipped_lines;
    }
  }

  return result;
}

WantsList WantsListReader::parse(const std::string& text) {
  std::istringstream stream(text);
  return read(stream);
}

WantsList WantsListReader::readFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw InputError("cannot open wants list: " + path);
  }

  std::cerr << "[WantsListReader] Reading wants list from " << path << "\n";
  WantsList result = read(file);
  std::cerr << "[WantsListReader] Loaded " << result.entries.size()
            << " entr" << (result.entries.size() == 1 ? "y" : "ies")
            << ", skipped " << result.skipped_lines
            << " unparsable line(s).\n";
  return result;
}

}  // namespace io
}  // namespace stockcheck
