#include "stockcheck/format/text_formatters.hpp"

#include "stockcheck/format/location_code.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace stockcheck {
namespace format {

namespace {

constexpr const char* kSeparator = "========================";
constexpr const char* kCurrency = " €";
constexpr const char* kUnknownLocation = "location unknown";

std::string money(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

std::string locationText(const domain::InventoryListing& listing) {
  return domain::hasLocation(listing) ? *listing.location
                                      : std::string(kUnknownLocation);
}

std::string printing(const domain::InventoryListing& listing) {
  std::string text = listing.set_code;
  if (!listing.collector_number.empty()) {
    if (!text.empty()) {
      text += ' ';
    }
    text += '#';
    text += listing.collector_number;
  }
  return text.empty() ? std::string("-") : text;
}

// Card name with " (Foil, Signed)" style suffix, as shown on invoices.
std::string decoratedName(const domain::InventoryListing& listing) {
  std::vector<const char*> specials;
  if (listing.is_foil) {
    specials.push_back("Foil");
  }
  if (listing.is_signed) {
    specials.push_back("Signed");
  }
  std::string name = listing.name;
  if (!specials.empty()) {
    name += " (";
    for (std::size_t i = 0; i < specials.size(); ++i) {
      if (i > 0) {
        name += ", ";
      }
      name += specials[i];
    }
    name += ')';
  }
  return name;
}

std::string csvField(const std::string& value) {
  if (value.find_first_of(",\"\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

std::string statusLabel(const domain::MatchResult& result) {
  switch (result.status) {
    case domain::MatchStatus::FullyAvailable:
      return "Fully available";
    case domain::MatchStatus::PartiallyAvailable:
      return "Partially available (missing " +
             std::to_string(result.want.quantity - result.available_quantity) +
             ")";
    case domain::MatchStatus::NotInStock:
      return "Not in stock";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// formatSummary()
// -----------------------------------------------------------------------------
std::string formatSummary(const std::vector<domain::MatchResult>& results) {
  std::ostringstream out;
  if (results.empty()) {
    out << "No entries in wants list.\n";
    return out.str();
  }

  std::size_t fully = 0;
  std::size_t partial = 0;
  std::size_t missing = 0;
  for (const auto& result : results) {
    out << result.want.quantity << " x " << result.want.name << ": "
        << result.available_quantity << " available - " << statusLabel(result)
        << "\n";
    switch (result.status) {
      case domain::MatchStatus::FullyAvailable:     ++fully; break;
      case domain::MatchStatus::PartiallyAvailable: ++partial; break;
      case domain::MatchStatus::NotInStock:         ++missing; break;
    }
  }

  out << kSeparator << "\n"
      << results.size() << (results.size() == 1 ? " entry: " : " entries: ")
      << fully << " fully available, " << partial << " partially available, "
      << missing << " not in stock\n";
  return out.str();
}

// -----------------------------------------------------------------------------
// formatPickingList()
// -----------------------------------------------------------------------------
std::string formatPickingList(const std::vector<domain::MatchResult>& results) {
  std::ostringstream out;
  if (results.empty()) {
    out << "No entries in wants list.\n";
    return out.str();
  }

  // Common widths so every group lines up.
  std::size_t location_width = 0;
  std::size_t printing_width = 0;
  std::size_t language_width = 0;
  for (const auto& result : results) {
    for (const auto& listing : result.matches) {
      location_width = std::max(location_width, locationText(listing).size());
      printing_width = std::max(printing_width, printing(listing).size());
      language_width = std::max(
          language_width,
          std::string(domain::languageName(listing.language)).size());
    }
  }

  long long total_on_hand = 0;
  for (const auto& result : results) {
    out << result.want.quantity << " x " << result.want.name << " ("
        << statusLabel(result);
    if (result.status != domain::MatchStatus::NotInStock) {
      out << ", " << result.available_quantity << " on hand";
    }
    out << ")\n";

    if (result.matches.empty()) {
      out << "    (not in stock)\n";
      continue;
    }

    std::vector<const domain::InventoryListing*> rows;
    rows.reserve(result.matches.size());
    for (const auto& listing : result.matches) {
      rows.push_back(&listing);
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const domain::InventoryListing* a,
                        const domain::InventoryListing* b) {
                       return locationLess(a->location.value_or(""),
                                           b->location.value_or(""));
                     });

    for (const auto* listing : rows) {
      out << "    " << std::left << std::setw(static_cast<int>(location_width))
          << locationText(*listing) << " | " << listing->quantity << "x | "
          << std::setw(static_cast<int>(printing_width)) << printing(*listing)
          << " | " << domain::conditionCode(listing->condition) << " | "
          << std::setw(static_cast<int>(language_width))
          << domain::languageName(listing->language) << " | "
          << (listing->is_foil ? "Foil" : "Non-foil") << " | "
          << money(listing->price) << kCurrency;
      if (listing->is_signed) {
        out << " | Signed";
      }
      if (listing->is_playset) {
        out << " | Playset";
      }
      if (!listing->comment.empty()) {
        out << " | Note: " << listing->comment;
      }
      out << "\n";
    }
    total_on_hand += result.available_quantity;
  }

  out << kSeparator << "\n"
      << "Total copies on hand: " << total_on_hand << "\n";
  return out.str();
}

// -----------------------------------------------------------------------------
// formatInvoiceList()
// -----------------------------------------------------------------------------
std::string formatInvoiceList(const std::vector<planning::PickPlan>& plans) {
  std::size_t name_width = 4;      // "Name"
  std::size_t language_width = 4;  // "Lang"
  for (const auto& plan : plans) {
    for (const auto& line : plan.lines) {
      name_width = std::max(name_width, decoratedName(line.listing).size());
      language_width = std::max(
          language_width,
          std::string(domain::languageName(line.listing.language)).size());
    }
  }

  auto row = [&](std::ostringstream& out, const std::string& qty,
                 const std::string& name, const std::string& language,
                 const std::string& condition, const std::string& price,
                 const std::string& total) {
    out << std::right << std::setw(3) << qty << " x " << std::left
        << std::setw(static_cast<int>(name_width)) << name << " | "
        << std::setw(static_cast<int>(language_width)) << language << " | "
        << std::setw(4) << condition << " | " << std::right << std::setw(6)
        << price << " | " << std::setw(7) << total << "\n";
  };

  std::ostringstream out;
  row(out, "Qty", "Name", "Lang", "Cond", "Price", "Total");
  const std::string rule(name_width + language_width + 35, '-');
  out << rule << "\n";

  double grand_total = 0.0;
  long long copies = 0;
  for (const auto& plan : plans) {
    for (const auto& line : plan.lines) {
      double line_total = line.listing.price * line.quantity;
      grand_total += line_total;
      copies += line.quantity;
      row(out, std::to_string(line.quantity), decoratedName(line.listing),
          domain::languageName(line.listing.language),
          domain::conditionCode(line.listing.condition),
          money(line.listing.price), money(line_total));
    }
  }

  out << rule << "\n"
      << "Total: " << copies << (copies == 1 ? " copy, " : " copies, ")
      << money(grand_total) << kCurrency << "\n";
  return out.str();
}

// -----------------------------------------------------------------------------
// formatStockUpdateCsv()
// -----------------------------------------------------------------------------
std::string formatStockUpdateCsv(const std::vector<planning::PickPlan>& plans) {
  std::ostringstream out;
  out << "cardmarketId,quantity,name,set,setCode,cn,condition,language,"
         "isFoil,isPlayset,isSigned,price,comment,location,nameDE,nameES,"
         "nameFR,nameIT,rarity\n";

  for (const auto& plan : plans) {
    for (const auto& line : plan.lines) {
      const auto& l = line.listing;
      out << csvField(l.cardmarket_id) << ',' << -line.quantity << ','
          << csvField(l.name) << ',' << csvField(l.set_name) << ','
          << csvField(l.set_code) << ',' << csvField(l.collector_number) << ','
          << domain::conditionCode(l.condition) << ','
          << domain::languageName(l.language) << ','
          << (l.is_foil ? "1" : "") << ',' << (l.is_playset ? "1" : "") << ','
          << (l.is_signed ? "1" : "") << ',' << money(l.price) << ','
          << csvField(l.comment) << ',' << csvField(l.location.value_or(""))
          << ',' << csvField(l.name_de) << ',' << csvField(l.name_es) << ','
          << csvField(l.name_fr) << ',' << csvField(l.name_it) << ','
          << csvField(l.rarity) << "\n";
    }
  }
  return out.str();
}

}  // namespace format
}  // namespace stockcheck
