#include "stockcheck/format/location_code.hpp"

#include "stockcheck/io/field_parsers.hpp"
#include "stockcheck/text/text_utils.hpp"

namespace stockcheck {
namespace format {

std::vector<int> parseLocationCode(std::string_view location) {
  std::string_view main_part = trim(location);
  std::size_t suffix = main_part.find("-L0");
  if (suffix != std::string_view::npos) {
    main_part = main_part.substr(0, suffix);
  }

  std::vector<int> key;
  std::size_t start = 0;
  bool first = true;
  while (start <= main_part.size()) {
    std::size_t dash = main_part.find('-', start);
    std::size_t end = (dash == std::string_view::npos) ? main_part.size() : dash;
    std::string_view part = main_part.substr(start, end - start);

    if (first) {
      char bay = part.empty() ? 'A' : part.front();
      switch (bay) {
        case 'A': key.push_back(1); break;
        case 'B': key.push_back(2); break;
        case 'C': key.push_back(3); break;
        case 'D': key.push_back(4); break;
        default:  key.push_back(0); break;
      }
      first = false;
    } else {
      key.push_back(io::quantityOrZero(part));
    }

    if (dash == std::string_view::npos) {
      break;
    }
    start = dash + 1;
  }
  return key;
}

bool locationLess(std::string_view lhs, std::string_view rhs) {
  bool lhs_blank = trim(lhs).empty();
  bool rhs_blank = trim(rhs).empty();
  if (lhs_blank || rhs_blank) {
    return !lhs_blank && rhs_blank;
  }
  return parseLocationCode(lhs) < parseLocationCode(rhs);
}

}  // namespace format
}  // namespace stockcheck
