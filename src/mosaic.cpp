#include "mosaic.hpp"
#include "csv.hpp"
#include "errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

std::vector<std::string> ReconstructedAudio::collectionIds() const {
  std::vector<std::string> ids;
  ids.reserve(provenance.size());
  for (const auto &entry : provenance) {
    ids.push_back(entry.collectionId);
  }
  return ids;
}

ReconstructedAudio Mosaic::assemble(const FeatureTable &target,
                                    size_t totalLength,
                                    const MatchFunction &match,
                                    SegmentCache &cache) {
  ReconstructedAudio audio;
  audio.samples.assign(totalLength, 0.0f);

  for (size_t i = 0; i < target.rowCount(); ++i) {
    const Frame &targetFrame = target.frame(i);
    const MatchDecision decision = match(target.vector(i));

    std::vector<float> segment = cache.getSegment(
        decision.frame.sourcePath, decision.frame.startSample,
        targetFrame.length());

    // Never write past the output either
    size_t count = 0;
    if (targetFrame.startSample < totalLength) {
      count = std::min(segment.size(), totalLength - targetFrame.startSample);
      std::copy(segment.begin(), segment.begin() + count,
                audio.samples.begin() + targetFrame.startSample);
    }
    audio.samplesWritten += count;

    float distance = 0.0f;
    for (const auto &candidate : decision.candidates) {
      if (candidate.row == decision.row) {
        distance = candidate.distance;
        break;
      }
    }
    audio.provenance.push_back({targetFrame.id(), decision.frame.id(),
                                decision.frame.collectionId, distance, count});
  }
  return audio;
}

ReconstructedAudio Mosaic::reconstruct(const FeatureTable &source,
                                       const FeatureTable &target,
                                       const std::string &fallbackPath,
                                       const std::vector<std::string> &features,
                                       MatchPolicy policy, std::mt19937 &rng,
                                       SegmentCache &cache) {
  if (source.empty() && !target.empty()) {
    throw InvalidQueryError("source table has no frames to match against");
  }
  if (policy.k > source.rowCount()) {
    std::cerr << "Warning: only " << source.rowCount()
              << " source frames, using that many neighbours instead of "
              << policy.k << "\n";
    policy.k = source.rowCount();
  }

  const std::string recordingPath =
      target.empty() ? fallbackPath : target.frame(0).sourcePath;
  const size_t totalLength = cache.samples(recordingPath)->size();

  std::cout << "Reconstructing audio file...\n";
  return assemble(
      target, totalLength,
      [&](const FeatureVector &query) {
        return Matcher::match(query, source, features, policy, rng);
      },
      cache);
}

void Mosaic::writeProvenance(const std::string &path,
                             const ReconstructedAudio &audio) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open " + path + " for writing");
  }
  Csv::writeRow(out, {"target_frame_id", "source_frame_id", "collection_id",
                      "distance", "samples_written"});
  for (const auto &entry : audio.provenance) {
    std::ostringstream distance;
    distance.precision(std::numeric_limits<float>::max_digits10);
    distance << entry.distance;
    Csv::writeRow(out, {entry.targetFrameId, entry.sourceFrameId,
                        entry.collectionId, distance.str(),
                        std::to_string(entry.samplesWritten)});
  }
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
}
