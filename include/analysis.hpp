#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "audio.hpp"
#include "collection.hpp"
#include "globals.hpp"
#include "table.hpp"

struct AnalysisOptions {
  size_t frameSize{DEFAULT_FRAME_SIZE};
  // Target only: cut frames at these positions instead of fixed sizes
  bool syncWithEvents{false};
  std::vector<size_t> eventSamples;
  // Worker threads for collection analysis
  unsigned jobs{1};
};

struct AnalysisReport {
  FeatureTable table;
  size_t filesAnalyzed{0};
  std::vector<std::string> skippedFiles;
};

class AnalysisCore {
  AnalysisOptions options;
  AudioLoader loader;

public:
  explicit AnalysisCore(AnalysisOptions options,
                        AudioLoader loader = Audio::readMonoFile);

  // Load, segment and analyze one file. Any failure, including a file that
  // cannot be decoded, is reported as AnalysisError.
  FeatureTable analyzeSound(const std::string &path,
                            const std::string &collectionId,
                            bool syncWithEvents = false) const;

  // Analyze every entry with fixed-size frames. Files that fail analysis are
  // skipped and listed in the report; rows keep manifest order regardless
  // of the number of jobs.
  AnalysisReport
  analyzeCollection(const std::vector<CollectionEntry> &entries) const;

  // The target's path doubles as its collection id
  FeatureTable analyzeTarget(const std::string &path) const;

  const AnalysisOptions &getOptions() const;
};
