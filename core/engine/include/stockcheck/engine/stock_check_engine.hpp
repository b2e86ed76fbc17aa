#pragma once

#include "stockcheck/analysis/bin_analyzer.hpp"
#include "stockcheck/config/app_config.hpp"
#include "stockcheck/domain/inventory_listing.hpp"
#include "stockcheck/domain/match_result.hpp"
#include "stockcheck/domain/want_entry.hpp"
#include "stockcheck/events/telemetry_events.hpp"
#include "stockcheck/network/stock_server.hpp"
#include "stockcheck/planning/pick_planner.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stockcheck {

// -----------------------------------------------------------------------------
// StockCheckEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the stock checker: owns the configuration,
//         the current inventory snapshot and the optional command server.
//
// @details
// Provides one place where main(), the command endpoint and tests get
// reconciliation, pick planning, bin analysis and rendering, all using the
// same configuration (preferred language, bin capacity, ...).
//
// Inventory snapshots:
//   The inventory is held as std::shared_ptr<const Inventory>. Loading a
//   new inventory swaps the pointer under snapshot_mutex_; every operation
//   copies the pointer first and then works lock-free on an immutable
//   vector. A reconciliation that is running while RELOAD swaps the
//   snapshot finishes on the snapshot it started with.
//
// Thread model:
//   Constructed, started, stopped and destroyed on the owner's thread.
//   Between start() and stop() executeCommand() runs on the StockServer
//   thread, concurrently with whatever the owner does; reconcile(),
//   loadInventory() and the other public operations are safe to call
//   from any thread. start()/stop() must not race with other calls.
//
// Ownership:
//   StockCheckEngine
//    ├── config_            (AppConfig: value member, immutable)
//    ├── inventory_         (shared_ptr<const Inventory>: swapped on load)
//    └── server_            (unique_ptr<StockServer>: only while started)
// -----------------------------------------------------------------------------
class StockCheckEngine {
 public:
  using Inventory = std::vector<domain::InventoryListing>;

  // Starts with an empty inventory; call reloadInventory() or
  // loadInventory() before reconciling.
  explicit StockCheckEngine(config::AppConfig config);

  // RAII: stops the server if it is still running.
  ~StockCheckEngine();

  StockCheckEngine(const StockCheckEngine&) = delete;
  StockCheckEngine& operator=(const StockCheckEngine&) = delete;
  StockCheckEngine(StockCheckEngine&&) = delete;
  StockCheckEngine& operator=(StockCheckEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Bring the StockServer up on the configured endpoints, and take
  //         it down again. Both are idempotent.
  //
  // @details
  // start() propagates zmq::error_t when an endpoint cannot be bound.
  // stop() joins the server thread before destroying the server, so no
  // command is in flight afterwards.
  // -------------------------------------------------------------------------
  void start();
  void stop();
  bool isRunning() const;

  // -------------------------------------------------------------------------
  // reloadInventory()
  // -------------------------------------------------------------------------
  //
  // @brief  Reads config.inventory_path and installs it as the new snapshot.
  //
  // @return Number of listings loaded.
  //
  // @throws InputError if no inventory path is configured or the file
  //         cannot be opened. The previous snapshot stays in place.
  // -------------------------------------------------------------------------
  std::size_t reloadInventory();

  // Installs listings as the new snapshot and publishes an
  // InventoryLoadedEvent.
  void loadInventory(Inventory listings, std::string source = "memory",
                     std::size_t skipped_rows = 0);

  std::shared_ptr<const Inventory> inventorySnapshot() const;

  // -------------------------------------------------------------------------
  // reconcile(wants)
  // -------------------------------------------------------------------------
  //
  // @brief  Matches wants against the current snapshot.
  //
  // @details
  // Applies the configured language filter when preferred_language_only
  // is set; otherwise identical to matching::match(). Publishes a
  // ReconciliationCompletedEvent when the server is running.
  // -------------------------------------------------------------------------
  std::vector<domain::MatchResult> reconcile(
      const std::vector<domain::WantEntry>& wants) const;

  // Pick plans for results, ordered by the configured preferred language.
  std::vector<planning::PickPlan> plan(
      const std::vector<domain::MatchResult>& results) const;

  std::vector<analysis::BinUsage> analyzeBins(int min_free_slots) const;

  // -------------------------------------------------------------------------
  // report(wants, format)
  // -------------------------------------------------------------------------
  //
  // @brief  Reconciles (unless format is Bins) and renders in the given
  //         format. Json output is pretty-printed with two-space indent.
  // -------------------------------------------------------------------------
  std::string report(const std::vector<domain::WantEntry>& wants,
                     config::OutputFormat format) const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one request from the command endpoint.
  //
  // @param  request  Either a bare command word ("PING", "STATUS",
  //                  "RELOAD", "BINS") or a JSON object with a "command"
  //                  key plus arguments:
  //                    {"command":"CHECK","wants":"4 Lightning Bolt\n...",
  //                     "format":"json|summary|picking"}
  //                    {"command":"PLAN","wants":"..."}
  //                    {"command":"BINS","min_free_slots":5}
  //
  // @return JSON text with "status" set to "ok" or "error". Never throws:
  //         malformed requests and failed reloads become error responses.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  const config::AppConfig& config() const { return config_; }

 private:
  void publish(TelemetryEvent event) const;

  const config::AppConfig config_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const Inventory> inventory_;

  mutable std::atomic<std::uint64_t> sequence_{0};
  std::unique_ptr<StockServer> server_;
};

}  // namespace stockcheck
