#include "stockcheck/network/stock_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace stockcheck {

namespace {

std::int64_t toEpochMs(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace

// Sockets are bound in start(), not here, so a server can be built before the
// engine has loaded its first inventory.
StockServer::StockServer(CommandHandler command_handler,
                         std::string command_endpoint,
                         std::string publish_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      publish_endpoint_(std::move(publish_endpoint)) {}

StockServer::~StockServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind CMD and PUB, then hand both sockets to the worker
// -----------------------------------------------------------------------------
void StockServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto command_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto publish_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  command_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  command_socket->set(zmq::sockopt::linger, 0);
  publish_socket->set(zmq::sockopt::linger, 0);
  command_socket->bind(command_endpoint_);
  publish_socket->bind(publish_endpoint_);

  context_ = std::move(context);
  command_socket_ = std::move(command_socket);
  publish_socket_ = std::move(publish_socket);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[StockServer] started. CMD=" << command_endpoint_
            << " PUB=" << publish_endpoint_ << "\n";
}

// Safe to call twice; the destructor calls it as well.
void StockServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  command_socket_.reset();
  publish_socket_.reset();
  context_.reset();

  std::cout << "[StockServer] stopped.\n";
}

void StockServer::pushTelemetry(TelemetryEvent event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): worker body. Telemetry is flushed before each command wait, so a
// CHECK reply and its reconciliation_completed event go out close together.
// -----------------------------------------------------------------------------
void StockServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain so events queued just before stop() still go out.
  processTelemetry();
}

void StockServer::processTelemetry() {
  for (const auto& event : telemetry_queue_.drain()) {
    std::string json = formatTelemetry(event);
    zmq::message_t msg(json.data(), json.size());
    publish_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// Waits at most kPollTimeoutMs for a command line such as "CHECK {...}" and
// answers it with the handler's JSON reply.
void StockServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = command_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  command_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): inventory_loaded / reconciliation_completed payloads
// -----------------------------------------------------------------------------
std::string StockServer::formatTelemetry(const TelemetryEvent& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<InventoryLoadedEvent>(&event)) {
    j["type"] = "inventory_loaded";
    j["source"] = e->source;
    j["listing_count"] = e->listing_count;
    j["skipped_rows"] = e->skipped_rows;
    j["total_quantity"] = e->total_quantity;
    j["timestamp_ms"] = toEpochMs(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<ReconciliationCompletedEvent>(&event)) {
    j["type"] = "reconciliation_completed";
    j["entries"] = e->entries;
    j["fully_available"] = e->fully_available;
    j["partially_available"] = e->partially_available;
    j["not_in_stock"] = e->not_in_stock;
    j["timestamp_ms"] = toEpochMs(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  }
  return j.dump();
}

}  // namespace stockcheck
