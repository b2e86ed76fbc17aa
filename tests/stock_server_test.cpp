// =============================================================================
// stock_server_test.cpp
// =============================================================================
// Tests for stockcheck::StockServer over loopback TCP.
//
// Validates:
//   - formatTelemetry() JSON for both event types
//   - REQ/REP round trip through the command handler
//   - Telemetry pushed by the caller reaches a SUB socket
//   - Idempotent start()/stop()
//   - StockCheckEngine answers commands once start()ed
//
// Each test binds its own port pair so tests never share sockets.
// =============================================================================

#include "stockcheck/engine/stock_check_engine.hpp"
#include "stockcheck/network/stock_server.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <string>

using namespace stockcheck;
using nlohmann::json;

namespace {

// Sends one request on a fresh REQ socket and waits up to two seconds.
std::string request(zmq::context_t& context, const std::string& endpoint,
                    const std::string& body) {
  zmq::socket_t socket(context, zmq::socket_type::req);
  socket.set(zmq::sockopt::rcvtimeo, 2000);
  socket.set(zmq::sockopt::linger, 0);
  socket.connect(endpoint);
  socket.send(zmq::buffer(body), zmq::send_flags::none);

  zmq::message_t reply;
  auto result = socket.recv(reply, zmq::recv_flags::none);
  if (!result.has_value()) {
    return {};
  }
  return reply.to_string();
}

}  // namespace

TEST(StockServerTelemetryTest, FormatsInventoryLoaded) {
  InventoryLoadedEvent event;
  event.source = "stock.csv";
  event.listing_count = 12;
  event.skipped_rows = 1;
  event.total_quantity = 40;
  event.timestamp = Timestamp{std::chrono::milliseconds{1500}};
  event.sequence_id = 7;

  auto j = json::parse(StockServer::formatTelemetry(event));

  EXPECT_EQ(j["type"], "inventory_loaded");
  EXPECT_EQ(j["source"], "stock.csv");
  EXPECT_EQ(j["listing_count"], 12);
  EXPECT_EQ(j["skipped_rows"], 1);
  EXPECT_EQ(j["total_quantity"], 40);
  EXPECT_EQ(j["timestamp_ms"], 1500);
  EXPECT_EQ(j["sequence_id"], 7);
}

TEST(StockServerTelemetryTest, FormatsReconciliationCompleted) {
  ReconciliationCompletedEvent event;
  event.entries = 3;
  event.fully_available = 1;
  event.partially_available = 1;
  event.not_in_stock = 1;
  event.sequence_id = 2;

  auto j = json::parse(StockServer::formatTelemetry(event));

  EXPECT_EQ(j["type"], "reconciliation_completed");
  EXPECT_EQ(j["entries"], 3);
  EXPECT_EQ(j["not_in_stock"], 1);
  EXPECT_EQ(j["timestamp_ms"], 0);
}

// -----------------------------------------------------------------------------
// 1. The handler sees the raw request and its reply goes back verbatim.
// -----------------------------------------------------------------------------
TEST(StockServerTest, CommandRoundTrip) {
  StockServer server([](const std::string& req) { return "echo:" + req; },
                     "tcp://127.0.0.1:55761", "tcp://127.0.0.1:55762");
  server.start();
  server.start();  // no-op
  ASSERT_TRUE(server.isRunning());

  zmq::context_t context(1);
  EXPECT_EQ(request(context, "tcp://127.0.0.1:55761", "STATUS"),
            "echo:STATUS");
  EXPECT_EQ(request(context, "tcp://127.0.0.1:55761", "PING"), "echo:PING");

  server.stop();
  server.stop();  // no-op
  EXPECT_FALSE(server.isRunning());
}

// -----------------------------------------------------------------------------
// 2. Telemetry reaches subscribers. PUB drops messages until the SUB has
//    joined, so keep publishing until one arrives.
// -----------------------------------------------------------------------------
TEST(StockServerTest, PublishesTelemetry) {
  StockServer server([](const std::string&) { return std::string("ok"); },
                     "tcp://127.0.0.1:55763", "tcp://127.0.0.1:55764");
  server.start();

  zmq::context_t context(1);
  zmq::socket_t subscriber(context, zmq::socket_type::sub);
  subscriber.set(zmq::sockopt::subscribe, "");
  subscriber.set(zmq::sockopt::rcvtimeo, 100);
  subscriber.set(zmq::sockopt::linger, 0);
  subscriber.connect("tcp://127.0.0.1:55764");

  std::string received;
  for (int attempt = 0; attempt < 40 && received.empty(); ++attempt) {
    ReconciliationCompletedEvent event;
    event.entries = 1;
    event.sequence_id = static_cast<std::uint64_t>(attempt + 1);
    server.pushTelemetry(event);

    zmq::message_t message;
    if (subscriber.recv(message, zmq::recv_flags::none)) {
      received = message.to_string();
    }
  }

  server.stop();

  ASSERT_FALSE(received.empty()) << "no telemetry within the timeout";
  EXPECT_EQ(json::parse(received)["type"], "reconciliation_completed");
}

// -----------------------------------------------------------------------------
// 3. A started engine serves its command set over the socket.
// -----------------------------------------------------------------------------
TEST(StockServerTest, EngineServesCommands) {
  config::AppConfig config;
  config.server.enabled = true;
  config.server.command_endpoint = "tcp://127.0.0.1:55765";
  config.server.publish_endpoint = "tcp://127.0.0.1:55766";

  StockCheckEngine engine(config);
  engine.loadInventory({stockcheck_test::makeListing("Lightning Bolt", 4)});
  engine.start();
  ASSERT_TRUE(engine.isRunning());

  zmq::context_t context(1);
  auto pong = json::parse(request(context, "tcp://127.0.0.1:55765", "PING"));
  EXPECT_EQ(pong["response"], "PONG");

  auto check = json::parse(
      request(context, "tcp://127.0.0.1:55765",
              R"({"command": "CHECK", "wants": "2 Lightning Bolt"})"));
  ASSERT_EQ(check["status"], "ok");
  EXPECT_EQ(check["results"][0]["status"], "FULLY_AVAILABLE");

  engine.stop();
  EXPECT_FALSE(engine.isRunning());
}
