// =============================================================================
// stock_check_engine_test.cpp
// =============================================================================
// Unit tests for stockcheck::StockCheckEngine without the network layer.
//
// Validates:
//   - executeCommand(): PING, STATUS, RELOAD, CHECK, PLAN, BINS
//   - Bare-word and JSON requests, case-insensitive command names
//   - Error responses for unknown commands, bad formats, malformed JSON
//   - reloadInventory() from a file and snapshot isolation
//   - preferred_language_only narrows matches
//   - report() in each output format
//
// Design: engines are never start()ed here, so no sockets are bound.
// =============================================================================

#include "stockcheck/engine/stock_check_engine.hpp"
#include "stockcheck/errors.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace stockcheck;
using nlohmann::json;
using stockcheck_test::makeListing;
using stockcheck_test::makeWant;

class StockCheckEngineTest : public ::testing::Test {
 protected:
  StockCheckEngineTest() : engine_(config::AppConfig{}) {
    engine_.loadInventory({
        makeListing("Lightning Bolt", 2, 0.50, std::string("A-0-1-1")),
        makeListing("Lightning Bolt", 3, 0.40, std::string("B-0-1-1")),
        makeListing("Counterspell", 1, 1.25, std::string("A-0-1-2")),
    });
  }

  json command(const std::string& request) {
    return json::parse(engine_.executeCommand(request));
  }

  StockCheckEngine engine_;
};

// -----------------------------------------------------------------------------
// 1. PING in every accepted spelling.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, PingAnswersPong) {
  for (const std::string request :
       {"PING", "ping", "  Ping\n", R"({"command": "PING"})"}) {
    auto response = command(request);
    EXPECT_EQ(response["status"], "ok") << request;
    EXPECT_EQ(response["response"], "PONG") << request;
  }
}

TEST_F(StockCheckEngineTest, StatusReportsSnapshot) {
  auto response = command("STATUS");

  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["listings"], 3);
  EXPECT_EQ(response["total_quantity"], 6);
  EXPECT_EQ(response["inventory_path"], "");
}

// -----------------------------------------------------------------------------
// 2. CHECK returns structured results by default.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, CheckReturnsJsonResults) {
  auto response = command(
      R"({"command": "CHECK", "wants": "4 Lightning Bolt\n2 Counterspell"})");

  ASSERT_EQ(response["status"], "ok");
  const auto& results = response["results"];
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0]["status"], "FULLY_AVAILABLE");
  EXPECT_EQ(results[0]["available_quantity"], 5);
  EXPECT_EQ(results[1]["status"], "PARTIALLY_AVAILABLE");
}

TEST_F(StockCheckEngineTest, CheckRendersText) {
  auto summary = command(
      R"({"command": "check", "wants": "1 Counterspell", "format": "summary"})");
  ASSERT_EQ(summary["status"], "ok");
  EXPECT_NE(summary["text"].get<std::string>().find(
                "1 x Counterspell: 1 available - Fully available"),
            std::string::npos);

  auto picking = command(
      R"({"command": "check", "wants": "1 Counterspell", "format": "picking"})");
  ASSERT_EQ(picking["status"], "ok");
  EXPECT_NE(picking["text"].get<std::string>().find("A-0-1-2"),
            std::string::npos);
}

TEST_F(StockCheckEngineTest, CheckErrors) {
  auto missing_wants = command("CHECK");
  EXPECT_EQ(missing_wants["status"], "error");
  EXPECT_EQ(missing_wants["response"], "request needs a 'wants' string");

  auto bad_format = command(
      R"({"command": "check", "wants": "1 Counterspell", "format": "pdf"})");
  EXPECT_EQ(bad_format["status"], "error");
  EXPECT_EQ(bad_format["response"], "Unknown format: pdf");
}

// -----------------------------------------------------------------------------
// 3. PLAN prefers the cheapest copies and renders an invoice.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, PlanReturnsPlansAndInvoice) {
  auto response =
      command(R"({"command": "PLAN", "wants": "4 Lightning Bolt"})");

  ASSERT_EQ(response["status"], "ok");
  const auto& plans = response["plans"];
  ASSERT_EQ(plans.size(), 1u);
  EXPECT_EQ(plans[0]["picked_quantity"], 4);
  EXPECT_EQ(plans[0]["shortfall"], 0);
  EXPECT_EQ(plans[0]["lines"][0]["listing"]["location"], "B-0-1-1");
  EXPECT_NE(response["invoice"].get<std::string>().find("Total: 4 copies"),
            std::string::npos);
}

TEST_F(StockCheckEngineTest, BinsUsesConfiguredCapacity) {
  auto response = command("BINS");

  ASSERT_EQ(response["status"], "ok");
  EXPECT_EQ(response["capacity"], 60);
  ASSERT_EQ(response["bins"].size(), 3u);
  EXPECT_EQ(response["bins"][0]["location"], "A-0-1-2");
  EXPECT_EQ(response["bins"][0]["free_slots"], 59);

  auto filtered = command(R"({"command": "bins", "min_free_slots": 58})");
  EXPECT_EQ(filtered["bins"].size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Anything unrecognised still gets a well-formed error reply.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, UnknownAndMalformedRequests) {
  auto unknown = command("FLY");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: FLY");

  auto malformed = command("{\"command\": ");
  EXPECT_EQ(malformed["status"], "error");
  EXPECT_EQ(malformed["response"].get<std::string>().rfind(
                "Malformed request: ", 0),
            0u);

  auto empty = command("");
  EXPECT_EQ(empty["status"], "error");
}

TEST_F(StockCheckEngineTest, ReloadWithoutPathFails) {
  auto response = command("RELOAD");
  EXPECT_EQ(response["status"], "error");
  EXPECT_EQ(response["response"], "no inventory path configured");
  EXPECT_THROW(engine_.reloadInventory(), InputError);
}

// -----------------------------------------------------------------------------
// 5. Old snapshots stay valid after a reload.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, SnapshotSurvivesReplacement) {
  auto before = engine_.inventorySnapshot();
  engine_.loadInventory({makeListing("Shock", 1)});

  EXPECT_EQ(before->size(), 3u);
  EXPECT_EQ(engine_.inventorySnapshot()->size(), 1u);
}

TEST(StockCheckEngineFileTest, ReloadReadsConfiguredFile) {
  const std::string path = ::testing::TempDir() + "stockcheck_engine_stock.csv";
  {
    std::ofstream out(path);
    out << "name,quantity,price,location\n"
           "Lightning Bolt,4,0.50,A-0-1-1\n"
           "Shock,,0.10,A-0-1-1\n";
  }

  config::AppConfig config;
  config.inventory_path = path;
  StockCheckEngine engine(config);

  EXPECT_EQ(engine.reloadInventory(), 1u);

  auto response = json::parse(engine.executeCommand("reload"));
  EXPECT_EQ(response["status"], "ok");
  EXPECT_EQ(response["listings"], 1);

  std::remove(path.c_str());
}

TEST(StockCheckEngineLanguageTest, LanguageOnlyFiltersMatches) {
  config::AppConfig config;
  config.preferred_language = domain::Language::German;
  config.preferred_language_only = true;
  StockCheckEngine engine(config);
  engine.loadInventory({
      makeListing("Lightning Bolt", 2, 0.50),
      makeListing("Lightning Bolt", 1, 0.90, std::nullopt,
                  domain::Language::German),
  });

  auto results = engine.reconcile({makeWant(2, "Lightning Bolt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].available_quantity, 1);
  EXPECT_EQ(results[0].status, domain::MatchStatus::PartiallyAvailable);
}

// -----------------------------------------------------------------------------
// 6. report() dispatches on the output format.
// -----------------------------------------------------------------------------
TEST_F(StockCheckEngineTest, ReportFormats) {
  std::vector<domain::WantEntry> wants{makeWant(1, "Counterspell")};

  EXPECT_NE(engine_.report(wants, config::OutputFormat::Summary)
                .find("1 entry: 1 fully available"),
            std::string::npos);
  EXPECT_NE(engine_.report(wants, config::OutputFormat::PickingList)
                .find("Total copies on hand: 1"),
            std::string::npos);
  EXPECT_NE(engine_.report(wants, config::OutputFormat::Invoice)
                .find("Total: 1 copy, 1.25 €"),
            std::string::npos);
  EXPECT_NE(engine_.report(wants, config::OutputFormat::UpdateCsv)
                .find(",-1,Counterspell,"),
            std::string::npos);

  auto parsed = json::parse(engine_.report(wants, config::OutputFormat::Json));
  ASSERT_TRUE(parsed.is_array());
  EXPECT_EQ(parsed[0]["name"], "Counterspell");

  EXPECT_NE(engine_.report({}, config::OutputFormat::Bins)
                .find("A-0-1-1: 2 cards (58 slots free)"),
            std::string::npos);
}
