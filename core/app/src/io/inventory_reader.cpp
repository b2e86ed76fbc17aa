#include "stockcheck/io/inventory_reader.hpp"

#include "stockcheck/errors.hpp"
#include "stockcheck/io/field_parsers.hpp"
#include "stockcheck/text/text_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace stockcheck {
namespace io {

namespace {

// Column name → index, keyed by lower-cased header text.
using ColumnIndex = std::unordered_map<std::string, std::size_t>;

char detectDelimiter(const std::string& header) {
  auto semicolons = std::count(header.begin(), header.end(), ';');
  auto commas = std::count(header.begin(), header.end(), ',');
  return semicolons > commas ? ';' : ',';
}

// Strips a UTF-8 byte order mark, which spreadsheet exports often prepend.
void stripBom(std::string& line) {
  if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
      static_cast<unsigned char>(line[1]) == 0xBB &&
      static_cast<unsigned char>(line[2]) == 0xBF) {
    line.erase(0, 3);
  }
}

void stripCarriageReturn(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

// An odd number of quote characters leaves a quoted field open; escaped
// quotes ("") always come in pairs.
bool hasOpenQuote(const std::string& record) {
  return std::count(record.begin(), record.end(), '"') % 2 != 0;
}

// Accessor for one record; absent columns read as empty.
class Row {
 public:
  Row(const ColumnIndex& columns, const std::vector<std::string>& fields)
      : columns_(columns), fields_(fields) {}

  const std::string& get(const char* column) const {
    static const std::string kEmpty;
    auto it = columns_.find(column);
    if (it == columns_.end() || it->second >= fields_.size()) {
      return kEmpty;
    }
    return fields_[it->second];
  }

 private:
  const ColumnIndex& columns_;
  const std::vector<std::string>& fields_;
};

domain::InventoryListing toListing(const Row& row, std::size_t line_number) {
  domain::InventoryListing listing;
  listing.cardmarket_id = row.get("cardmarketid");
  listing.name = row.get("name");
  listing.set_name = row.get("set");
  listing.set_code = row.get("setcode");
  listing.collector_number = row.get("cn");
  listing.comment = row.get("comment");
  listing.rarity = row.get("rarity");
  listing.name_de = row.get("namede");
  listing.name_es = row.get("namees");
  listing.name_fr = row.get("namefr");
  listing.name_it = row.get("nameit");

  listing.is_foil = parseFlag(row.get("isfoil"));
  listing.is_signed = parseFlag(row.get("issigned"));
  listing.is_playset = parseFlag(row.get("isplayset"));

  const std::string& quantity_text = row.get("quantity");
  auto quantity = parseQuantity(quantity_text);
  if (!quantity) {
    std::cerr << "[InventoryReader] WARNING: line " << line_number
              << ": unparsable quantity '" << quantity_text << "' for "
              << listing.name << ", using 0.\n";
  }
  listing.quantity = quantity.value_or(0);

  const std::string& price_text = row.get("price");
  auto price = parsePrice(price_text);
  if (!price) {
    std::cerr << "[InventoryReader] WARNING: line " << line_number
              << ": unparsable price '" << price_text << "' for "
              << listing.name << ", using 0.00.\n";
  }
  listing.price = price.value_or(0.0);

  const std::string& condition_text = row.get("condition");
  listing.condition = domain::parseCondition(condition_text);
  if (listing.condition == domain::Condition::Unknown &&
      !condition_text.empty()) {
    std::cerr << "[InventoryReader] WARNING: line " << line_number
              << ": unknown condition '" << condition_text << "'.\n";
  }

  const std::string& language_text = row.get("language");
  auto language = domain::parseLanguage(language_text);
  if (!language && !language_text.empty()) {
    std::cerr << "[InventoryReader] WARNING: line " << line_number
              << ": unknown language '" << language_text
              << "', assuming English.\n";
  }
  listing.language = language.value_or(domain::Language::English);

  const std::string& location = row.get("location");
  if (!location.empty()) {
    listing.location = location;
  }
  return listing;
}

}  // namespace

// -----------------------------------------------------------------------------
// splitRecord(): quote-aware field split, fields trimmed
// -----------------------------------------------------------------------------
std::vector<std::string> InventoryReader::splitRecord(const std::string& line,
                                                      char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      fields.emplace_back(trim(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  fields.emplace_back(trim(current));
  return fields;
}

// -----------------------------------------------------------------------------
// read(): header, then one listing per accepted record
// -----------------------------------------------------------------------------
InventoryReadResult InventoryReader::read(std::istream& input) {
  InventoryReadResult result;

  std::string line;
  std::size_t line_number = 0;

  // Locate the header (first non-blank line).
  std::string header;
  while (std::getline(input, line)) {
    ++line_number;
    stripCarriageReturn(line);
    if (line_number == 1) {
      stripBom(line);
    }
    if (!trim(line).empty()) {
      header = line;
      break;
    }
  }
  if (header.empty()) {
    std::cerr << "[InventoryReader] WARNING: inventory has no header row.\n";
    return result;
  }

  const char delimiter = detectDelimiter(header);
  ColumnIndex columns;
  const auto names = splitRecord(header, delimiter);
  for (std::size_t i = 0; i < names.size(); ++i) {
    columns.emplace(toLower(names[i]), i);
  }

  while (std::getline(input, line)) {
    ++line_number;
    stripCarriageReturn(line);
    if (trim(line).empty()) {
      continue;
    }

    // A quoted field may span physical lines; keep its line breaks.
    const std::size_t record_line = line_number;
    std::string record = line;
    while (hasOpenQuote(record) && std::getline(input, line)) {
      ++line_number;
      stripCarriageReturn(line);
      record += '\n';
      record += line;
    }

    const auto fields = splitRecord(record, delimiter);
    Row row(columns, fields);
    if (row.get("price").empty() || row.get("quantity").empty()) {
      ++result.skipped_rows;
      continue;
    }
    result.listings.push_back(toListing(row, record_line));
  }

  return result;
}

InventoryReadResult InventoryReader::readFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw InputError("cannot open inventory file: " + path);
  }

  std::cerr << "[InventoryReader] Reading inventory from " << path << "\n";
  InventoryReadResult result = read(file);
  std::cerr << "[InventoryReader] Loaded " << result.listings.size()
            << " listing(s), skipped " << result.skipped_rows
            << " with empty price/quantity.\n";
  return result;
}

}  // namespace io
}  // namespace stockcheck
