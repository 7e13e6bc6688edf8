#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>
#include <set>

#include "errors.hpp"
#include "matcher.hpp"

namespace {

Frame frameAt(size_t index) {
  Frame frame;
  frame.collectionId = "c" + std::to_string(index);
  frame.frameIndex = 0;
  frame.sourcePath = "source" + std::to_string(index) + ".wav";
  frame.startSample = 0;
  frame.endSample = 100;
  return frame;
}

// Rows with loudness from `values` and a flux that should never matter
FeatureTable loudnessTable(const std::vector<float> &values) {
  FeatureTable table({"loudness", "flux"});
  for (size_t i = 0; i < values.size(); ++i) {
    table.addRow(frameAt(i), {{"loudness", "flux"}, {values[i], 1000.0f * i}});
  }
  return table;
}

FeatureVector loudnessQuery(float loudness) {
  return FeatureVector{{"loudness", "flux"}, {loudness, -50.0f}};
}

} // namespace

TEST_CASE("Matcher::match returns the only row of a one-row table") {
  FeatureTable table({"loudness"});
  table.addRow(frameAt(0), {{"loudness"}, {0.0f}});
  std::mt19937 rng(1);

  const MatchDecision decision =
      Matcher::match(FeatureVector{{"loudness"}, {0.5f}}, table, {"loudness"},
                     {SelectionPolicy::Best, 1}, rng);

  REQUIRE(decision.row == 0);
  REQUIRE(decision.frame.collectionId == "c0");
  REQUIRE(decision.candidates.size() == 1);
  REQUIRE(decision.candidates[0].distance == Catch::Approx(0.5f));
}

TEST_CASE("Matcher::nearest ranks by distance with ties in row order") {
  const FeatureTable table = loudnessTable({3.0f, 1.0f, 1.0f, 0.0f, 5.0f});

  const auto candidates =
      Matcher::nearest(loudnessQuery(1.0f), table, 5, {"loudness"});

  std::vector<size_t> rows;
  for (const auto &candidate : candidates) {
    rows.push_back(candidate.row);
  }
  REQUIRE(rows == std::vector<size_t>{1, 2, 3, 0, 4});
  REQUIRE(candidates[2].distance == Catch::Approx(1.0f));
  REQUIRE(candidates[4].distance == Catch::Approx(4.0f));
}

TEST_CASE("Matcher::nearest only compares the selected features") {
  const FeatureTable table = loudnessTable({0.0f, 0.9f});

  const auto byLoudness =
      Matcher::nearest(loudnessQuery(1.0f), table, 1, {"loudness"});
  REQUIRE(byLoudness[0].row == 1);

  const auto byFlux = Matcher::nearest(loudnessQuery(1.0f), table, 1, {"flux"});
  REQUIRE(byFlux[0].row == 0);
}

TEST_CASE("Matcher::nearest uses Euclidean distance over all columns") {
  FeatureTable table({"a", "b"});
  table.addRow(frameAt(0), {{"a", "b"}, {3.0f, 4.0f}});

  const auto candidates =
      Matcher::nearest(FeatureVector{{"a", "b"}, {0.0f, 0.0f}}, table, 1,
                       {"a", "b"});

  REQUIRE(candidates[0].distance == Catch::Approx(5.0f));
}

TEST_CASE("Best policy is deterministic") {
  const FeatureTable table = loudnessTable({0.4f, 0.1f, 0.3f, 0.2f});
  std::mt19937 rng(42);

  for (int i = 0; i < 20; ++i) {
    const MatchDecision decision = Matcher::match(
        loudnessQuery(0.22f), table, {"loudness"}, {SelectionPolicy::Best, 3},
        rng);
    REQUIRE(decision.row == 3);
  }
}

TEST_CASE("Random policy only picks among the k nearest") {
  const FeatureTable table =
      loudnessTable({0.0f, 0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f});
  std::mt19937 rng(42);

  std::set<size_t> seen;
  for (int i = 0; i < 200; ++i) {
    const MatchDecision decision =
        Matcher::match(loudnessQuery(0.0f), table, {"loudness"},
                       {SelectionPolicy::RandomAmongTopK, 3}, rng);
    REQUIRE(decision.row < 3);
    REQUIRE(decision.candidates.size() == 3);
    seen.insert(decision.row);
  }
  REQUIRE(seen.size() > 1);
}

TEST_CASE("Matcher rejects malformed queries") {
  const FeatureTable table = loudnessTable({0.0f, 1.0f});
  const FeatureVector query = loudnessQuery(0.5f);

  REQUIRE_THROWS_AS(Matcher::nearest(query, table, 1, {}), InvalidQueryError);
  REQUIRE_THROWS_AS(Matcher::nearest(query, table, 1, {"hfc"}),
                    InvalidQueryError);
  REQUIRE_THROWS_AS(Matcher::nearest(query, table, 0, {"loudness"}),
                    InvalidQueryError);
  REQUIRE_THROWS_AS(Matcher::nearest(query, table, 3, {"loudness"}),
                    InvalidQueryError);

  const FeatureVector partial{{"flux"}, {0.0f}};
  REQUIRE_THROWS_AS(Matcher::nearest(partial, table, 1, {"loudness"}),
                    InvalidQueryError);

  const FeatureVector undefined =
      loudnessQuery(std::numeric_limits<float>::quiet_NaN());
  REQUIRE_THROWS_AS(Matcher::nearest(undefined, table, 1, {"loudness"}),
                    InvalidQueryError);
}

TEST_CASE("Matcher::parsePolicy maps choice names") {
  REQUIRE(Matcher::parsePolicy("best") == SelectionPolicy::Best);
  REQUIRE(Matcher::parsePolicy("random") == SelectionPolicy::RandomAmongTopK);
  REQUIRE_THROWS_AS(Matcher::parsePolicy("worst"), std::invalid_argument);
}
