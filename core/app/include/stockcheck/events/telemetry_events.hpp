#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace stockcheck {

// Wall-clock time of an event, for ordering and auditing.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// InventoryLoadedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces that a new inventory snapshot replaced the
// previous one (initial load or RELOAD command).
// -----------------------------------------------------------------------------
struct InventoryLoadedEvent {
  std::string source;            // File path, or "memory" for direct loads
  std::size_t listing_count{0};
  std::size_t skipped_rows{0};
  long long total_quantity{0};   // Sum of listing quantities
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ReconciliationCompletedEvent
// -----------------------------------------------------------------------------
// Responsibility: Summarises one reconciliation run so subscribers (shop
// dashboard, chat bot) can follow demand without polling.
// -----------------------------------------------------------------------------
struct ReconciliationCompletedEvent {
  std::size_t entries{0};
  std::size_t fully_available{0};
  std::size_t partially_available{0};
  std::size_t not_in_stock{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TelemetryEvent
// -----------------------------------------------------------------------------
// The envelope pushed through StockServer's telemetry queue. A variant keeps
// the events as values; consumers dispatch with std::get_if.
// -----------------------------------------------------------------------------
using TelemetryEvent =
    std::variant<InventoryLoadedEvent, ReconciliationCompletedEvent>;

}  // namespace stockcheck
