#include "stockcheck/engine/stock_check_engine.hpp"

#include "stockcheck/errors.hpp"
#include "stockcheck/format/json_export.hpp"
#include "stockcheck/format/text_formatters.hpp"
#include "stockcheck/io/inventory_reader.hpp"
#include "stockcheck/io/wants_list_reader.hpp"
#include "stockcheck/matching/stock_matcher.hpp"
#include "stockcheck/text/text_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace stockcheck {

namespace {

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

nlohmann::json binsToJson(const std::vector<analysis::BinUsage>& bins) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& bin : bins) {
    nlohmann::json b;
    b["location"] = bin.location;
    b["cards"] = bin.cards;
    b["free_slots"] = bin.free_slots;
    array.push_back(std::move(b));
  }
  return array;
}

// Reads the mandatory "wants" string of CHECK and PLAN requests.
std::vector<domain::WantEntry> wantsFromRequest(const nlohmann::json& request) {
  auto it = request.find("wants");
  if (it == request.end() || !it->is_string()) {
    throw InputError("request needs a 'wants' string");
  }
  return io::WantsListReader::parse(it->get<std::string>()).entries;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
StockCheckEngine::StockCheckEngine(config::AppConfig config)
    : config_(std::move(config)),
      inventory_(std::make_shared<const Inventory>()) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
StockCheckEngine::~StockCheckEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): bring the command server online
// -----------------------------------------------------------------------------
void StockCheckEngine::start() {
  if (server_) {
    return;
  }

  // server_ is set before the worker thread exists; the worker reads it
  // when publishing telemetry.
  server_ = std::make_unique<StockServer>(
      [this](const std::string& request) { return executeCommand(request); },
      config_.server.command_endpoint, config_.server.publish_endpoint);
  try {
    server_->start();
  } catch (const zmq::error_t& e) {
    server_.reset();
    std::cerr << "[StockCheckEngine] ERROR: cannot start server: " << e.what()
              << "\n";
    throw;
  }

  std::cout << "[StockCheckEngine] started with "
            << inventorySnapshot()->size() << " listing(s).\n";
}

// -----------------------------------------------------------------------------
// stop(): join the server before destroying it
// -----------------------------------------------------------------------------
void StockCheckEngine::stop() {
  if (!server_) {
    return;
  }
  server_->stop();
  server_.reset();
  std::cout << "[StockCheckEngine] stopped.\n";
}

bool StockCheckEngine::isRunning() const {
  return server_ != nullptr && server_->isRunning();
}

// -----------------------------------------------------------------------------
// Inventory snapshot management
// -----------------------------------------------------------------------------
std::size_t StockCheckEngine::reloadInventory() {
  if (config_.inventory_path.empty()) {
    throw InputError("no inventory path configured");
  }
  io::InventoryReadResult result =
      io::InventoryReader::readFile(config_.inventory_path);
  std::size_t count = result.listings.size();
  loadInventory(std::move(result.listings), config_.inventory_path,
                result.skipped_rows);
  return count;
}

void StockCheckEngine::loadInventory(Inventory listings, std::string source,
                                     std::size_t skipped_rows) {
  InventoryLoadedEvent event;
  event.source = std::move(source);
  event.listing_count = listings.size();
  event.skipped_rows = skipped_rows;
  for (const auto& listing : listings) {
    event.total_quantity += listing.quantity;
  }

  auto snapshot = std::make_shared<const Inventory>(std::move(listings));
  {
    std::lock_guard lock(snapshot_mutex_);
    inventory_ = std::move(snapshot);
  }

  event.timestamp = std::chrono::system_clock::now();
  event.sequence_id = ++sequence_;
  publish(std::move(event));
}

std::shared_ptr<const StockCheckEngine::Inventory>
StockCheckEngine::inventorySnapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return inventory_;
}

// -----------------------------------------------------------------------------
// reconcile(): match on a private copy of the snapshot pointer
// -----------------------------------------------------------------------------
std::vector<domain::MatchResult> StockCheckEngine::reconcile(
    const std::vector<domain::WantEntry>& wants) const {
  auto inventory = inventorySnapshot();

  matching::MatchOptions options;
  if (config_.preferred_language_only) {
    options.language_filter = config_.preferred_language;
  }
  auto results = matching::match(*inventory, wants, options);

  ReconciliationCompletedEvent event;
  event.entries = results.size();
  for (const auto& result : results) {
    switch (result.status) {
      case domain::MatchStatus::FullyAvailable:
        ++event.fully_available;
        break;
      case domain::MatchStatus::PartiallyAvailable:
        ++event.partially_available;
        break;
      case domain::MatchStatus::NotInStock:
        ++event.not_in_stock;
        break;
    }
  }
  event.timestamp = std::chrono::system_clock::now();
  event.sequence_id = ++sequence_;
  publish(std::move(event));

  return results;
}

std::vector<planning::PickPlan> StockCheckEngine::plan(
    const std::vector<domain::MatchResult>& results) const {
  planning::PlanOptions options;
  options.preferred_language = config_.preferred_language;
  return planning::planPicks(results, options);
}

std::vector<analysis::BinUsage> StockCheckEngine::analyzeBins(
    int min_free_slots) const {
  analysis::BinAnalyzer analyzer(config_.bin_capacity);
  return analyzer.analyze(*inventorySnapshot(), min_free_slots);
}

// -----------------------------------------------------------------------------
// report(): reconcile and render for the command line
// -----------------------------------------------------------------------------
std::string StockCheckEngine::report(
    const std::vector<domain::WantEntry>& wants,
    config::OutputFormat format) const {
  using config::OutputFormat;

  if (format == OutputFormat::Bins) {
    return analysis::formatBinReport(analyzeBins(config_.min_free_slots),
                                     config_.bin_capacity);
  }

  auto results = reconcile(wants);
  switch (format) {
    case OutputFormat::Summary:
      return format::formatSummary(results);
    case OutputFormat::PickingList:
      return format::formatPickingList(results);
    case OutputFormat::Invoice:
      return format::formatInvoiceList(plan(results));
    case OutputFormat::UpdateCsv:
      return format::formatStockUpdateCsv(plan(results));
    case OutputFormat::Json:
      return format::toJson(results).dump(2) + "\n";
    case OutputFormat::Bins:
      break;
  }
  return {};
}

// -----------------------------------------------------------------------------
// executeCommand(): handle command endpoint requests
// -----------------------------------------------------------------------------
std::string StockCheckEngine::executeCommand(const std::string& request) {
  nlohmann::json response;

  try {
    std::string_view trimmed = trim(request);
    nlohmann::json body = nlohmann::json::object();
    std::string raw_command;
    if (!trimmed.empty() && trimmed.front() == '{') {
      body = nlohmann::json::parse(std::string(trimmed));
      raw_command = body.value("command", "");
    } else {
      raw_command = std::string(trimmed);
    }
    const std::string command = toLower(raw_command);

    if (command == "ping") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (command == "status") {
      auto inventory = inventorySnapshot();
      long long total_quantity = 0;
      for (const auto& listing : *inventory) {
        total_quantity += listing.quantity;
      }
      response["status"] = "ok";
      response["listings"] = inventory->size();
      response["total_quantity"] = total_quantity;
      response["inventory_path"] = config_.inventory_path;
    } else if (command == "reload") {
      std::size_t count = reloadInventory();
      response["status"] = "ok";
      response["listings"] = count;
    } else if (command == "check") {
      auto results = reconcile(wantsFromRequest(body));
      std::string format = body.value("format", "json");
      response["status"] = "ok";
      if (format == "json") {
        response["results"] = format::toJson(results);
      } else if (format == "summary") {
        response["text"] = format::formatSummary(results);
      } else if (format == "picking") {
        response["text"] = format::formatPickingList(results);
      } else {
        response = errorResponse("Unknown format: " + format);
      }
    } else if (command == "plan") {
      auto plans = plan(reconcile(wantsFromRequest(body)));
      response["status"] = "ok";
      response["plans"] = format::toJson(plans);
      response["invoice"] = format::formatInvoiceList(plans);
    } else if (command == "bins") {
      int min_free_slots = body.value("min_free_slots", config_.min_free_slots);
      response["status"] = "ok";
      response["capacity"] = config_.bin_capacity;
      response["bins"] = binsToJson(analyzeBins(min_free_slots));
    } else {
      response = errorResponse("Unknown command: " + raw_command);
    }
  } catch (const nlohmann::json::exception& e) {
    response = errorResponse(std::string("Malformed request: ") + e.what());
  } catch (const std::exception& e) {
    std::cerr << "[StockCheckEngine] ERROR: command failed: " << e.what()
              << "\n";
    response = errorResponse(e.what());
  }

  return response.dump();
}

void StockCheckEngine::publish(TelemetryEvent event) const {
  if (server_) {
    server_->pushTelemetry(std::move(event));
  }
}

}  // namespace stockcheck
