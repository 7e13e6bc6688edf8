#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <filesystem>
#include <fstream>

#include "csv.hpp"
#include "errors.hpp"
#include "mosaic.hpp"

namespace {

Frame makeFrame(const std::string &id, size_t index, const std::string &path,
                size_t start, size_t end) {
  Frame frame;
  frame.collectionId = id;
  frame.frameIndex = index;
  frame.sourcePath = path;
  frame.startSample = start;
  frame.endSample = end;
  return frame;
}

FeatureVector loudness(float value) {
  return FeatureVector{{"loudness"}, {value}};
}

// Every source file is a constant signal; its length depends on the name
std::vector<float> fakeDecode(const std::string &path) {
  if (path == "target.wav") {
    return std::vector<float>(500, 0.9f);
  }
  if (path == "take.wav") {
    return std::vector<float>(300, 0.75f);
  }
  if (path == "short.wav") {
    return std::vector<float>(50, 0.25f);
  }
  return std::vector<float>(1000, 0.5f);
}

MatchFunction always(const Frame &frame) {
  return [frame](const FeatureVector &) {
    MatchDecision decision;
    decision.row = 0;
    decision.frame = frame;
    decision.candidates = {{0, 0.0f}};
    return decision;
  };
}

size_t nonSilent(const std::vector<float> &samples) {
  size_t count = 0;
  for (float sample : samples) {
    if (sample != 0.0f) {
      ++count;
    }
  }
  return count;
}

} // namespace

TEST_CASE("Mosaic::assemble writes each target frame range once") {
  FeatureTable target({"loudness"});
  target.addRow(makeFrame("target.wav", 0, "target.wav", 0, 100), loudness(0));
  target.addRow(makeFrame("target.wav", 1, "target.wav", 100, 200),
                loudness(0));
  target.addRow(makeFrame("target.wav", 2, "target.wav", 300, 400),
                loudness(0));
  SegmentCache cache(fakeDecode);

  const ReconstructedAudio audio = Mosaic::assemble(
      target, 500, always(makeFrame("7", 0, "source.wav", 0, 100)), cache);

  REQUIRE(audio.samples.size() == 500);
  REQUIRE(audio.samplesWritten == 300);
  REQUIRE(nonSilent(audio.samples) == 300);
  for (size_t i = 200; i < 300; ++i) {
    REQUIRE(audio.samples[i] == 0.0f);
  }
  for (size_t i = 400; i < 500; ++i) {
    REQUIRE(audio.samples[i] == 0.0f);
  }
  REQUIRE(audio.samples[0] == 0.5f);
  REQUIRE(audio.samples[399] == 0.5f);
  REQUIRE(cache.decodeCount() == 1);
}

TEST_CASE("Mosaic::assemble writes only what the source file holds") {
  FeatureTable target({"loudness"});
  target.addRow(makeFrame("target.wav", 0, "target.wav", 0, 100), loudness(0));
  SegmentCache cache(fakeDecode);

  const ReconstructedAudio audio = Mosaic::assemble(
      target, 200, always(makeFrame("9", 0, "short.wav", 20, 40)), cache);

  // short.wav has 30 samples from sample 20 on
  REQUIRE(audio.samplesWritten == 30);
  REQUIRE(nonSilent(audio.samples) == 30);
  REQUIRE(audio.samples[29] == 0.25f);
  REQUIRE(audio.samples[30] == 0.0f);
  REQUIRE(audio.provenance[0].samplesWritten == 30);
}

TEST_CASE("Mosaic::assemble records provenance in target order") {
  FeatureTable target({"loudness"});
  target.addRow(makeFrame("target.wav", 0, "target.wav", 0, 10), loudness(0));
  target.addRow(makeFrame("target.wav", 1, "target.wav", 10, 20), loudness(1));
  SegmentCache cache(fakeDecode);

  const Frame low = makeFrame("low", 4, "source.wav", 0, 10);
  const Frame high = makeFrame("high", 2, "source.wav", 10, 20);
  const ReconstructedAudio audio = Mosaic::assemble(
      target, 20,
      [&](const FeatureVector &query) {
        MatchDecision decision;
        decision.row = query.value("loudness") > 0.5f ? 1 : 0;
        decision.frame = decision.row == 1 ? high : low;
        decision.candidates = {{decision.row, 0.125f}};
        return decision;
      },
      cache);

  REQUIRE(audio.collectionIds() == std::vector<std::string>{"low", "high"});
  REQUIRE(audio.provenance[0].targetFrameId == "target.wav_f0");
  REQUIRE(audio.provenance[1].sourceFrameId == "high_f2");
  REQUIRE(audio.provenance[1].distance == Catch::Approx(0.125f));
}

TEST_CASE("Mosaic::reconstruct matches against the source table") {
  FeatureTable source({"loudness"});
  source.addRow(makeFrame("quiet", 0, "quiet.wav", 0, 100), loudness(0.0f));
  source.addRow(makeFrame("loud", 0, "loud.wav", 0, 100), loudness(1.0f));

  FeatureTable target({"loudness"});
  target.addRow(makeFrame("target.wav", 0, "target.wav", 0, 100),
                loudness(0.9f));
  target.addRow(makeFrame("target.wav", 1, "target.wav", 100, 200),
                loudness(0.1f));

  SegmentCache cache(fakeDecode);
  std::mt19937 rng(3);

  // k larger than the source table is clamped
  const ReconstructedAudio audio =
      Mosaic::reconstruct(source, target, "target.wav", {"loudness"},
                          {SelectionPolicy::Best, 10}, rng, cache);

  REQUIRE(audio.samples.size() == 500);
  REQUIRE(audio.collectionIds() == std::vector<std::string>{"loud", "quiet"});
  REQUIRE(audio.samplesWritten == 200);
  REQUIRE(cache.decodeCount() == 3);
}

TEST_CASE("Mosaic::reconstruct sizes the output from a reloaded target table") {
  FeatureTable source({"loudness"});
  source.addRow(makeFrame("loud", 0, "loud.wav", 0, 100), loudness(1.0f));

  FeatureTable analyzed({"loudness"});
  analyzed.addRow(makeFrame("take.wav", 0, "take.wav", 0, 100),
                  loudness(0.9f));
  analyzed.addRow(makeFrame("take.wav", 1, "take.wav", 100, 200),
                  loudness(0.8f));
  const auto path =
      std::filesystem::temp_directory_path() / "tessera_test_target.csv";
  analyzed.saveCsv(path.string());
  const FeatureTable target = FeatureTable::loadCsv(path.string());
  std::filesystem::remove(path);

  SegmentCache cache(fakeDecode);
  std::mt19937 rng(3);

  // target.wav is only used for a table without rows
  const ReconstructedAudio audio =
      Mosaic::reconstruct(source, target, "target.wav", {"loudness"},
                          {SelectionPolicy::Best, 1}, rng, cache);

  REQUIRE(audio.samples.size() == 300);
  REQUIRE(audio.samplesWritten == 200);
  REQUIRE(audio.samples[250] == 0.0f);
  REQUIRE(cache.decodeCount() == 2);
}

TEST_CASE("Mosaic::reconstruct of a target without frames is silent") {
  FeatureTable source({"loudness"});
  FeatureTable target({"loudness"});
  SegmentCache cache(fakeDecode);
  std::mt19937 rng(3);

  const ReconstructedAudio audio =
      Mosaic::reconstruct(source, target, "target.wav", {"loudness"},
                          {SelectionPolicy::Best, 1}, rng, cache);

  REQUIRE(audio.samples.size() == 500);
  REQUIRE(nonSilent(audio.samples) == 0);
  REQUIRE(audio.provenance.empty());
}

TEST_CASE("Mosaic::reconstruct needs source frames") {
  FeatureTable source({"loudness"});
  FeatureTable target({"loudness"});
  target.addRow(makeFrame("target.wav", 0, "target.wav", 0, 100),
                loudness(0.5f));
  SegmentCache cache(fakeDecode);
  std::mt19937 rng(3);

  REQUIRE_THROWS_AS(Mosaic::reconstruct(source, target, "target.wav",
                                        {"loudness"},
                                        {SelectionPolicy::Best, 1}, rng, cache),
                    InvalidQueryError);
}

TEST_CASE("Mosaic::writeProvenance writes one row per target frame") {
  ReconstructedAudio audio;
  audio.provenance.push_back({"t_f0", "a_f3", "a", 0.5f, 100});
  audio.provenance.push_back({"t_f1", "b,c_f0", "b,c", 1.0f, 80});
  const auto path =
      std::filesystem::temp_directory_path() / "tessera_test_provenance.csv";

  Mosaic::writeProvenance(path.string(), audio);

  std::ifstream in(path);
  Csv::Row row;
  REQUIRE(Csv::readRow(in, row));
  REQUIRE(row.front() == "target_frame_id");
  REQUIRE(Csv::readRow(in, row));
  REQUIRE(row == Csv::Row{"t_f0", "a_f3", "a", "0.5", "100"});
  REQUIRE(Csv::readRow(in, row));
  REQUIRE(row[2] == "b,c");
  REQUIRE_FALSE(Csv::readRow(in, row));
  in.close();
  std::filesystem::remove(path);
}
