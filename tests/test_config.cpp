#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "config.hpp"
#include "features.hpp"

TEST_CASE("parseArgs defaults to the full pipeline") {
  const Config config = parseArgs({});

  REQUIRE(config.step == Step::All);
  REQUIRE(config.analyze());
  REQUIRE(config.mosaic());
  REQUIRE(config.frameSize == DEFAULT_FRAME_SIZE);
  REQUIRE(config.neighbours == DEFAULT_NEIGHBOURS);
  REQUIRE(config.choice == SelectionPolicy::RandomAmongTopK);
  REQUIRE(config.features == defaultSimilarityFeatures());
  REQUIRE(config.resolvedOutputPath() == "target.wav.reconstructed.wav");
  REQUIRE(config.provenancePath() ==
          "target.wav.reconstructed.wav.provenance.csv");
}

TEST_CASE("parseArgs reads every option") {
  const Config config = parseArgs(
      {"--step", "mosaic", "--collection", "m.csv", "--target", "t.wav",
       "--frame-size", "4096", "--beats", "beats.txt", "--source-table",
       "s.csv", "--target-table", "tt.csv", "--output", "out.wav", "--choice",
       "best", "--neighbours", "3", "--features", "mfcc_0,loudness", "--seed",
       "17", "--jobs", "4"});

  REQUIRE(config.step == Step::Mosaic);
  REQUIRE_FALSE(config.analyze());
  REQUIRE(config.collectionPath == "m.csv");
  REQUIRE(config.targetPath == "t.wav");
  REQUIRE(config.frameSize == 4096);
  REQUIRE(config.beatsPath == "beats.txt");
  REQUIRE(config.sourceTablePath == "s.csv");
  REQUIRE(config.targetTablePath == "tt.csv");
  REQUIRE(config.resolvedOutputPath() == "out.wav");
  REQUIRE(config.choice == SelectionPolicy::Best);
  REQUIRE(config.neighbours == 3);
  REQUIRE(config.features == std::vector<std::string>{"mfcc_0", "loudness"});
  REQUIRE(config.seeded);
  REQUIRE(config.seed == 17);
  REQUIRE(config.jobs == 4);
}

TEST_CASE("parseArgs rejects invalid input") {
  REQUIRE_THROWS_AS(parseArgs({"--step", "download"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--frame-size", "0"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--frame-size", "-5"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--frame-size", "255"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--neighbours", "ten"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--choice", "worst"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--features", ","}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--target"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--volume", "11"}), std::invalid_argument);
}

TEST_CASE("parseArgs accepts the smallest analyzable frame size") {
  REQUIRE(parseArgs({"--frame-size", "256"}).frameSize == MIN_ANALYSIS_SIZE);
}

TEST_CASE("parseArgs rejects seeds and job counts that do not fit") {
  REQUIRE_THROWS_AS(parseArgs({"--seed", "4294967296"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parseArgs({"--jobs", "4294967297"}), std::invalid_argument);
  REQUIRE(parseArgs({"--seed", "4294967295"}).seed == 4294967295u);
}

TEST_CASE("parseArgs recognizes help") {
  REQUIRE(parseArgs({"--help"}).showHelp);
  REQUIRE(usage("tessera").find("--frame-size") != std::string::npos);
}
