#pragma once

#include "stockcheck/domain/language.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace stockcheck {
namespace config {

// What the one-shot command line run prints.
enum class OutputFormat {
  Summary,
  PickingList,
  Invoice,
  UpdateCsv,
  Json,
  Bins,
};

// "summary", "picking", "invoice", "update_csv", "json", "bins".
std::optional<OutputFormat> parseOutputFormat(std::string_view text);
const char* outputFormatName(OutputFormat format);

// -----------------------------------------------------------------------------
// ServerConfig: ZeroMQ command/telemetry endpoints
// -----------------------------------------------------------------------------
struct ServerConfig {
  bool enabled{false};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// AppConfig: everything the executable needs to run
// -----------------------------------------------------------------------------
//
// @brief  Input paths, output choice, matching preferences and server
//         endpoints.
//
// @details
// Loaded from a JSON file (every key optional, defaults below), then
// overridden by command line flags in main(). Example:
//
//   {
//     "inventory_path": "stock.csv",
//     "wants_path": "wants.txt",
//     "output_format": "picking",
//     "preferred_language": "de",
//     "preferred_language_only": false,
//     "bin_capacity": 60,
//     "min_free_slots": 5,
//     "server": {
//       "enabled": true,
//       "command_endpoint": "tcp://127.0.0.1:5556",
//       "publish_endpoint": "tcp://127.0.0.1:5557"
//     }
//   }
//
// preferred_language orders pick plans; with preferred_language_only it
// also restricts matching to that language.
//
// Thread model:
//   Plain value type, copied into the engine at construction.
// -----------------------------------------------------------------------------
struct AppConfig {
  std::string inventory_path;
  std::string wants_path;
  OutputFormat output_format{OutputFormat::Summary};
  std::optional<domain::Language> preferred_language;
  bool preferred_language_only{false};
  int bin_capacity{60};
  int min_free_slots{0};
  ServerConfig server;
};

// -----------------------------------------------------------------------------
// configFromJson(j)
// -----------------------------------------------------------------------------
//
// @brief  Builds an AppConfig from a parsed JSON object.
//
// @throws ConfigError for a non-object document, wrongly typed keys,
//         unknown output formats or languages, bin_capacity <= 0 or
//         min_free_slots < 0, and preferred_language_only without a
//         preferred_language.
// -----------------------------------------------------------------------------
AppConfig configFromJson(const nlohmann::json& j);

// @throws ConfigError if the file cannot be opened or is not valid JSON,
//         plus everything configFromJson() throws.
AppConfig loadConfig(const std::string& path);

// Checks cross-field constraints; throws ConfigError.
void validate(const AppConfig& config);

}  // namespace config
}  // namespace stockcheck
