#include "stockcheck/config/app_config.hpp"

#include "stockcheck/errors.hpp"

#include <fstream>
#include <iostream>

namespace stockcheck {
namespace config {

namespace {

struct FormatName {
  OutputFormat format;
  const char* name;
};

constexpr FormatName kFormatNames[] = {
    {OutputFormat::Summary, "summary"},
    {OutputFormat::PickingList, "picking"},
    {OutputFormat::Invoice, "invoice"},
    {OutputFormat::UpdateCsv, "update_csv"},
    {OutputFormat::Json, "json"},
    {OutputFormat::Bins, "bins"},
};

// Reads j[key] into out when present; wrong types become ConfigError.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid value for '") + key +
                      "': " + e.what());
  }
}

}  // namespace

std::optional<OutputFormat> parseOutputFormat(std::string_view text) {
  for (const auto& entry : kFormatNames) {
    if (text == entry.name) {
      return entry.format;
    }
  }
  return std::nullopt;
}

const char* outputFormatName(OutputFormat format) {
  for (const auto& entry : kFormatNames) {
    if (entry.format == format) {
      return entry.name;
    }
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// configFromJson(): defaults, then every present key
// -----------------------------------------------------------------------------
AppConfig configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  AppConfig config;
  readOptional(j, "inventory_path", config.inventory_path);
  readOptional(j, "wants_path", config.wants_path);
  readOptional(j, "preferred_language_only", config.preferred_language_only);
  readOptional(j, "bin_capacity", config.bin_capacity);
  readOptional(j, "min_free_slots", config.min_free_slots);

  std::string format_name;
  readOptional(j, "output_format", format_name);
  if (!format_name.empty()) {
    auto format = parseOutputFormat(format_name);
    if (!format) {
      throw ConfigError("unknown output_format: " + format_name);
    }
    config.output_format = *format;
  }

  std::string language_name;
  readOptional(j, "preferred_language", language_name);
  if (!language_name.empty()) {
    auto language = domain::parseLanguage(language_name);
    if (!language) {
      throw ConfigError("unknown preferred_language: " + language_name);
    }
    config.preferred_language = language;
  }

  auto server = j.find("server");
  if (server != j.end() && !server->is_null()) {
    if (!server->is_object()) {
      throw ConfigError("'server' must be a JSON object");
    }
    readOptional(*server, "enabled", config.server.enabled);
    readOptional(*server, "command_endpoint", config.server.command_endpoint);
    readOptional(*server, "publish_endpoint", config.server.publish_endpoint);
  }

  validate(config);
  return config;
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }

  std::cerr << "[Config] Loaded " << path << "\n";
  return configFromJson(j);
}

void validate(const AppConfig& config) {
  if (config.bin_capacity <= 0) {
    throw ConfigError("bin_capacity must be positive");
  }
  if (config.min_free_slots < 0) {
    throw ConfigError("min_free_slots must not be negative");
  }
  if (config.preferred_language_only && !config.preferred_language) {
    throw ConfigError(
        "preferred_language_only requires a preferred_language");
  }
  if (config.server.enabled && (config.server.command_endpoint.empty() ||
                                config.server.publish_endpoint.empty())) {
    throw ConfigError("server endpoints must not be empty");
  }
}

}  // namespace config
}  // namespace stockcheck
