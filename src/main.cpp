#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis.hpp"
#include "audio.hpp"
#include "collection.hpp"
#include "config.hpp"
#include "mosaic.hpp"
#include "segment.hpp"
#include "table.hpp"

namespace {

AnalysisOptions analysisOptions(const Config &config) {
  AnalysisOptions options;
  options.frameSize = config.frameSize;
  options.jobs = config.jobs;
  if (!config.beatsPath.empty()) {
    options.syncWithEvents = true;
    options.eventSamples = Segmenter::secondsToSamples(
        Segmenter::readEventTimes(config.beatsPath), SAMPLE_RATE);
  }
  return options;
}

void analyze(const Config &config, FeatureTable &source, FeatureTable &target) {
  AnalysisCore analysisCore(analysisOptions(config));

  std::cout << "Analyzing source collection...\n";
  const std::vector<CollectionEntry> entries =
      Collection::loadManifest(config.collectionPath);
  AnalysisReport report = analysisCore.analyzeCollection(entries);
  source = std::move(report.table);
  source.saveCsv(config.sourceTablePath);
  std::cout << "Saved source analysis table with " << source.rowCount()
            << " entries to " << config.sourceTablePath << "\n";
  if (!report.skippedFiles.empty()) {
    std::cerr << "Skipped " << report.skippedFiles.size() << " of "
              << entries.size() << " files that could not be analyzed\n";
  }

  std::cout << "Analyzing target audio file...\n";
  target = analysisCore.analyzeTarget(config.targetPath);
  target.saveCsv(config.targetTablePath);
  std::cout << "Saved target analysis table with " << target.rowCount()
            << " entries to " << config.targetTablePath << "\n";
}

void reportSources(const Config &config, const ReconstructedAudio &audio) {
  std::vector<CollectionEntry> entries;
  try {
    entries = Collection::loadManifest(config.collectionPath);
  } catch (const std::runtime_error &e) {
    std::cerr << "Warning: cannot list source sounds: " << e.what() << "\n";
    return;
  }

  std::cout << "Sounds used in the reconstruction:\n";
  for (const auto &entry :
       Collection::entriesUsed(entries, audio.collectionIds())) {
    std::cout << "  " << entry.collectionId << "  " << entry.path;
    for (const auto &field : entry.metadata) {
      std::cout << "  " << field.first << "=" << field.second;
    }
    std::cout << "\n";
  }
}

void mosaic(const Config &config, const FeatureTable &source,
            const FeatureTable &target) {
  std::cout << "Performing audio mosaicing...\n";

  std::mt19937 rng(config.seeded ? config.seed : std::random_device{}());
  MatchPolicy policy;
  policy.selection = config.choice;
  policy.k = config.neighbours;

  SegmentCache cache;
  ReconstructedAudio audio =
      Mosaic::reconstruct(source, target, config.targetPath, config.features,
                          policy, rng, cache);

  const std::string output = config.resolvedOutputPath();
  Audio::writeMonoWav(output, audio.samples);
  Mosaic::writeProvenance(config.provenancePath(), audio);
  std::cout << "Audio generated and saved in " << output << " ("
            << audio.samplesWritten << " of " << audio.samples.size()
            << " samples covered, " << cache.decodeCount()
            << " files decoded)\n";

  reportSources(config, audio);
}

int run(const Config &config) {
  FeatureTable source;
  FeatureTable target;

  if (config.analyze()) {
    analyze(config, source, target);
  } else {
    source = FeatureTable::loadCsv(config.sourceTablePath);
    target = FeatureTable::loadCsv(config.targetTablePath);
  }

  if (config.mosaic()) {
    mosaic(config, source, target);
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "tessera";

  Config config;
  try {
    config = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n" << usage(program);
    return 1;
  }

  if (config.showHelp) {
    std::cout << usage(program);
    return 0;
  }

  try {
    return run(config);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
