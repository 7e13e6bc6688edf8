#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "audio.hpp"
#include "matcher.hpp"
#include "table.hpp"

struct ProvenanceEntry {
  std::string targetFrameId;
  std::string sourceFrameId;
  std::string collectionId;
  float distance;
  size_t samplesWritten;
};

struct ReconstructedAudio {
  // same length as the target recording; uncovered samples stay 0
  std::vector<float> samples;
  // one entry per target frame, in target order
  std::vector<ProvenanceEntry> provenance;
  size_t samplesWritten{0};

  std::vector<std::string> collectionIds() const;
};

using MatchFunction = std::function<MatchDecision(const FeatureVector &)>;

namespace Mosaic {

// Walk the target rows in order, pick a source frame for each and copy the
// target frame's length of source audio, starting at the chosen frame, to
// the target frame's position. Source reads that run past the end of their
// file are truncated, never padded.
ReconstructedAudio assemble(const FeatureTable &target, size_t totalLength,
                            const MatchFunction &match, SegmentCache &cache);

// assemble() against `source` with the matcher. The output is as long as
// the recording the target frames were cut from; `fallbackPath` names it
// only when the target table has no rows. k is clamped to the source row
// count.
ReconstructedAudio reconstruct(const FeatureTable &source,
                               const FeatureTable &target,
                               const std::string &fallbackPath,
                               const std::vector<std::string> &features,
                               MatchPolicy policy, std::mt19937 &rng,
                               SegmentCache &cache);

// target_frame_id, source_frame_id, collection_id, distance, samples_written
void writeProvenance(const std::string &path, const ReconstructedAudio &audio);

} // namespace Mosaic
