// =============================================================================
// stock_matcher_test.cpp
// =============================================================================
// Unit tests for stockcheck::matching::match().
//
// Validates:
//   - One result per want entry, in want-list order
//   - Case-insensitive exact name matching (no trimming, no fuzzy match)
//   - Quantity aggregation and the three-way status classification
//   - Matched listings keep inventory order
//   - Determinism: repeated calls give deep-equal results
//   - The optional language filter
//   - Localized names (nameDE/ES/FR/IT) on the want-list
//   - Playset rows count as four copies; sums saturate at INT_MAX
// =============================================================================

#include "stockcheck/matching/stock_matcher.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using stockcheck::domain::InventoryListing;
using stockcheck::domain::Language;
using stockcheck::domain::MatchStatus;
using stockcheck::domain::WantEntry;
using stockcheck_test::makeListing;
using stockcheck_test::makeWant;

// =============================================================================
// Fixture: a small inventory with two "Bolt" rows and a few others.
// =============================================================================
class StockMatcherTest : public ::testing::Test {
 protected:
  std::vector<InventoryListing> inventory{
      makeListing("Bolt", 2, 0.50, std::string("A-0-1-1")),
      makeListing("Counterspell", 1, 1.20),
      makeListing("Bolt", 3, 0.40, std::string("B-0-1-1")),
      makeListing("Giant Growth", 0, 0.10),
  };
};

// -----------------------------------------------------------------------------
// 1. Empty inventory: every want resolves to NOT_IN_STOCK with no matches.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, EmptyInventoryGivesNotInStock) {
  std::vector<WantEntry> wants{makeWant(1, "Bolt"), makeWant(4, "Shock")};

  auto results = stockcheck::matching::match({}, wants);

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_EQ(result.status, MatchStatus::NotInStock);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.available_quantity, 0);
  }
}

// -----------------------------------------------------------------------------
// 2. Empty want-list yields an empty result sequence.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, EmptyWantsGivesEmptyResults) {
  EXPECT_TRUE(stockcheck::matching::match(inventory, {}).empty());
}

// -----------------------------------------------------------------------------
// 3. Result sequence mirrors the want-list: same length, same order.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, ResultsFollowWantOrder) {
  std::vector<WantEntry> wants{makeWant(1, "Shock"), makeWant(1, "Bolt"),
                               makeWant(1, "Counterspell"),
                               makeWant(2, "Bolt")};

  auto results = stockcheck::matching::match(inventory, wants);

  ASSERT_EQ(results.size(), wants.size());
  for (std::size_t i = 0; i < wants.size(); ++i) {
    EXPECT_EQ(results[i].want, wants[i]) << "mismatch at index " << i;
  }
}

// -----------------------------------------------------------------------------
// 4. Names compare case-insensitively.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, NameMatchIsCaseInsensitive) {
  std::vector<InventoryListing> stock{makeListing("Lightning Bolt", 1)};

  auto results =
      stockcheck::matching::match(stock, {makeWant(1, "lightning bolt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].matches.size(), 1u);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
}

// -----------------------------------------------------------------------------
// 5. Matching is exact apart from case: no prefix, no trimming.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, NoFuzzyOrPartialMatching) {
  std::vector<InventoryListing> stock{makeListing("Lightning Bolt", 1),
                                      makeListing("Bolt ", 1)};

  auto results = stockcheck::matching::match(
      stock, {makeWant(1, "Lightning"), makeWant(1, "Bolt")});

  EXPECT_EQ(results[0].status, MatchStatus::NotInStock);
  EXPECT_EQ(results[1].status, MatchStatus::NotInStock);
}

// -----------------------------------------------------------------------------
// 6. Quantities of all matching rows are summed: 2 + 3 = 5 >= 4.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, AggregatesQuantityFullyAvailable) {
  auto results = stockcheck::matching::match(inventory, {makeWant(4, "Bolt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].available_quantity, 5);
  EXPECT_EQ(results[0].matches.size(), 2u);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
}

// -----------------------------------------------------------------------------
// 7. Exactly the desired quantity on hand is still fully available.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, ExactQuantityIsFullyAvailable) {
  auto results = stockcheck::matching::match(inventory, {makeWant(5, "Bolt")});
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
}

// -----------------------------------------------------------------------------
// 8. Summed 5 against a want of 10 is partial.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, PartialWhenSumBelowDesired) {
  auto results =
      stockcheck::matching::match(inventory, {makeWant(10, "Bolt")});

  EXPECT_EQ(results[0].available_quantity, 5);
  EXPECT_EQ(results[0].status, MatchStatus::PartiallyAvailable);
}

// -----------------------------------------------------------------------------
// 9. A card absent from the inventory is NOT_IN_STOCK with no matches.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, MissingCardIsNotInStock) {
  auto results = stockcheck::matching::match(inventory, {makeWant(1, "Shock")});

  EXPECT_EQ(results[0].status, MatchStatus::NotInStock);
  EXPECT_TRUE(results[0].matches.empty());
  EXPECT_EQ(results[0].available_quantity, 0);
}

// -----------------------------------------------------------------------------
// 10. A listed card with zero copies is matched but only partial: status
//     depends on whether matches exist, not on the sum being positive.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, ZeroQuantityListingIsPartial) {
  auto results =
      stockcheck::matching::match(inventory, {makeWant(1, "Giant Growth")});

  EXPECT_EQ(results[0].matches.size(), 1u);
  EXPECT_EQ(results[0].available_quantity, 0);
  EXPECT_EQ(results[0].status, MatchStatus::PartiallyAvailable);
}

// -----------------------------------------------------------------------------
// 11. Negative quantities (never produced by the reader) count as zero.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, NegativeQuantityCountsAsZero) {
  std::vector<InventoryListing> stock{makeListing("Bolt", -3),
                                      makeListing("Bolt", 2)};

  auto results = stockcheck::matching::match(stock, {makeWant(2, "Bolt")});

  EXPECT_EQ(results[0].available_quantity, 2);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
}

// -----------------------------------------------------------------------------
// 12. Matches appear in inventory order, not sorted by price or location.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, PreservesInventoryOrder) {
  auto results = stockcheck::matching::match(inventory, {makeWant(1, "bolt")});

  ASSERT_EQ(results[0].matches.size(), 2u);
  EXPECT_EQ(results[0].matches[0], inventory[0]);
  EXPECT_EQ(results[0].matches[1], inventory[2]);
}

// -----------------------------------------------------------------------------
// 13. Two calls with the same input produce deep-equal output.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, IsIdempotent) {
  std::vector<WantEntry> wants{makeWant(4, "Bolt"), makeWant(1, "Shock"),
                               makeWant(1, "COUNTERSPELL")};

  auto first = stockcheck::matching::match(inventory, wants);
  auto second = stockcheck::matching::match(inventory, wants);

  EXPECT_EQ(first, second);
}

// -----------------------------------------------------------------------------
// 14. Duplicate want entries are reconciled independently.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, DuplicateWantsEachSeeAllStock) {
  auto results = stockcheck::matching::match(
      inventory, {makeWant(5, "Bolt"), makeWant(5, "Bolt")});

  EXPECT_EQ(results[0].available_quantity, 5);
  EXPECT_EQ(results[1].available_quantity, 5);
}

// -----------------------------------------------------------------------------
// 15. Language filter keeps only listings printed in that language.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, LanguageFilterRestrictsMatches) {
  std::vector<InventoryListing> stock{
      makeListing("Bolt", 2, 1.0, std::nullopt, Language::English),
      makeListing("Bolt", 3, 1.0, std::nullopt, Language::German)};

  stockcheck::matching::MatchOptions options;
  options.language_filter = Language::German;
  auto results =
      stockcheck::matching::match(stock, {makeWant(3, "Bolt")}, options);

  ASSERT_EQ(results[0].matches.size(), 1u);
  EXPECT_EQ(results[0].matches[0].language, Language::German);
  EXPECT_EQ(results[0].available_quantity, 3);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);

  options.language_filter = Language::Italian;
  auto none =
      stockcheck::matching::match(stock, {makeWant(1, "Bolt")}, options);
  EXPECT_EQ(none[0].status, MatchStatus::NotInStock);
}

// -----------------------------------------------------------------------------
// 16. A playset row of quantity 1 holds four copies, so a want of 4 is met.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, PlaysetCountsFourCopies) {
  auto playset = makeListing("Bolt", 1);
  playset.is_playset = true;

  auto results = stockcheck::matching::match({playset}, {makeWant(4, "Bolt")});

  EXPECT_EQ(results[0].available_quantity, 4);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);

  auto short_by_one =
      stockcheck::matching::match({playset}, {makeWant(5, "Bolt")});
  EXPECT_EQ(short_by_one[0].available_quantity, 4);
  EXPECT_EQ(short_by_one[0].status, MatchStatus::PartiallyAvailable);
}

// -----------------------------------------------------------------------------
// 17. Huge row quantities clamp instead of wrapping negative.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, AvailableQuantitySaturates) {
  constexpr int kMax = std::numeric_limits<int>::max();
  auto playset = makeListing("Bolt", kMax / 2);
  playset.is_playset = true;
  std::vector<InventoryListing> stock{makeListing("Bolt", kMax),
                                      makeListing("Bolt", kMax), playset};

  auto results = stockcheck::matching::match(stock, {makeWant(4, "Bolt")});

  EXPECT_EQ(results[0].available_quantity, kMax);
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
}

// -----------------------------------------------------------------------------
// 18. Without a filter a localized name finds the listing.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, MatchesLocalizedNames) {
  auto german = makeListing("Lightning Bolt", 1, 1.0, std::nullopt,
                            Language::German);
  german.name_de = "Blitzschlag";
  auto french = makeListing("Lightning Bolt", 2);
  french.name_fr = "Foudre";

  auto results = stockcheck::matching::match(
      {german, french}, {makeWant(1, "blitzschlag"), makeWant(2, "Foudre"),
                         makeWant(3, "Lightning Bolt")});

  ASSERT_EQ(results[0].matches.size(), 1u);
  EXPECT_EQ(results[0].matches[0].name_de, "Blitzschlag");
  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
  ASSERT_EQ(results[1].matches.size(), 1u);
  EXPECT_EQ(results[1].status, MatchStatus::FullyAvailable);
  EXPECT_EQ(results[2].matches.size(), 2u);
  EXPECT_EQ(results[2].available_quantity, 3);
}

// -----------------------------------------------------------------------------
// 19. With a filter only that language's name (or the English one) counts.
// -----------------------------------------------------------------------------
TEST_F(StockMatcherTest, LanguageFilterUsesThatLanguagesName) {
  auto german = makeListing("Lightning Bolt", 1, 1.0, std::nullopt,
                            Language::German);
  german.name_de = "Blitzschlag";
  german.name_it = "Fulmine";

  stockcheck::matching::MatchOptions options;
  options.language_filter = Language::German;
  auto results = stockcheck::matching::match(
      {german},
      {makeWant(1, "Blitzschlag"), makeWant(1, "Lightning Bolt"),
       makeWant(1, "Fulmine")},
      options);

  EXPECT_EQ(results[0].status, MatchStatus::FullyAvailable);
  EXPECT_EQ(results[1].status, MatchStatus::FullyAvailable);
  EXPECT_EQ(results[2].status, MatchStatus::NotInStock);
}
