#pragma once

#include "stockcheck/concurrent/thread_safe_queue.hpp"
#include "stockcheck/events/telemetry_events.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace stockcheck {

// -----------------------------------------------------------------------------
// StockServer: ZeroMQ command endpoint and telemetry feed
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers stock queries on a REP
//         socket and broadcasts telemetry on a PUB socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request string is handed to command_handler_ (bound to
//      StockCheckEngine::executeCommand()) and the returned JSON string is
//      sent back. ZMQ_RCVTIMEO keeps recv() from blocking so the loop can
//      notice stop() and drain telemetry.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes one JSON message per TelemetryEvent. Events reach the
//      server through a ThreadSafeQueue, so producers never wait on
//      serialisation or socket I/O.
//
// Thread model:
//   Constructed and destroyed on the owning thread (the engine's).
//   start() binds the sockets and spawns the worker; stop() clears the
//   running flag and joins. command_handler_ runs on the worker thread and
//   must be safe to call concurrently with the owner's own use of the
//   engine.
//
// Ownership:
//   Owned by StockCheckEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class StockServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler   Maps a request string to a JSON response.
  // @param  command_endpoint  Endpoint the REP socket binds to.
  // @param  publish_endpoint  Endpoint the PUB socket binds to.
  //
  // @details
  // No sockets are opened here; call start().
  // -------------------------------------------------------------------------
  explicit StockServer(CommandHandler command_handler,
                       std::string command_endpoint = "tcp://127.0.0.1:5556",
                       std::string publish_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~StockServer();

  StockServer(const StockServer&) = delete;
  StockServer& operator=(const StockServer&) = delete;
  StockServer(StockServer&&) = delete;
  StockServer& operator=(StockServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the context, binds both sockets, spawns the worker.
  //
  // @details
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound (e.g.
  // the port is already taken); nothing is left running in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker, joins it, then closes the sockets.
  //
  // @details
  // The worker notices within kPollTimeoutMs. Telemetry still queued is
  // published before the worker exits. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  // Enqueues an event for the PUB socket. Safe to call from any thread.
  void pushTelemetry(TelemetryEvent event);

  // JSON text for one telemetry event. Pure; exposed for tests.
  static std::string formatTelemetry(const TelemetryEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then poll for one command.
  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string publish_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> command_socket_;
  std::unique_ptr<zmq::socket_t> publish_socket_;

  ThreadSafeQueue<TelemetryEvent> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace stockcheck
