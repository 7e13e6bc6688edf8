#include "analysis.hpp"
#include "errors.hpp"
#include "segment.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace {

std::mutex logMutex;

} // namespace

AnalysisCore::AnalysisCore(AnalysisOptions options, AudioLoader loader)
    : options(std::move(options)), loader(std::move(loader)) {
  this->options.frameSize = Segmenter::evenFrameSize(this->options.frameSize);
  if (this->options.jobs == 0) {
    this->options.jobs = 1;
  }
}

FeatureTable AnalysisCore::analyzeSound(const std::string &path,
                                        const std::string &collectionId,
                                        bool syncWithEvents) const {
  std::vector<float> samples;
  try {
    samples = loader(path);
  } catch (const AudioFileError &e) {
    throw AnalysisError(e.what());
  }

  const std::vector<FrameBounds> bounds =
      syncWithEvents ? Segmenter::events(samples.size(), options.eventSamples)
                     : Segmenter::fixed(samples.size(), options.frameSize);

  FeatureTable table;
  for (size_t i = 0; i < bounds.size(); ++i) {
    Frame frame;
    frame.collectionId = collectionId;
    frame.frameIndex = i;
    frame.sourcePath = path;
    frame.startSample = bounds[i].start;
    frame.endSample = bounds[i].end;

    std::vector<float> frameSamples(samples.begin() + frame.startSample,
                                    samples.begin() + frame.endSample);
    try {
      table.addRow(frame, buildFeatureVector(frameSamples));
    } catch (const AnalysisError &e) {
      throw AnalysisError(path + " frame " + std::to_string(i) + ": " +
                          e.what());
    }
  }
  return table;
}

AnalysisReport
AnalysisCore::analyzeCollection(const std::vector<CollectionEntry> &entries) const {
  const size_t count = entries.size();
  std::vector<FeatureTable> partials(count);
  // char, not bool: workers write neighbouring slots concurrently
  std::vector<char> skipped(count, 0);
  std::vector<std::exception_ptr> failures(count);
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      const CollectionEntry &entry = entries[i];
      {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cout << "Analyzing sound with id " << entry.collectionId << " ["
                  << i + 1 << "/" << count << "]\n";
      }
      try {
        partials[i] = analyzeSound(entry.path, entry.collectionId);
      } catch (const AnalysisError &e) {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cerr << "Skipping " << entry.path << ": " << e.what() << "\n";
        skipped[i] = 1;
      } catch (...) {
        failures[i] = std::current_exception();
      }
    }
  };

  const unsigned threads =
      static_cast<unsigned>(std::min<size_t>(options.jobs, count));
  if (threads <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    for (unsigned t = 0; t < threads; ++t) {
      pool.emplace_back(worker);
    }
    for (auto &thread : pool) {
      thread.join();
    }
  }

  for (const auto &failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  AnalysisReport report;
  for (size_t i = 0; i < count; ++i) {
    if (skipped[i]) {
      report.skippedFiles.push_back(entries[i].path);
      continue;
    }
    report.table.append(partials[i]);
    ++report.filesAnalyzed;
  }
  return report;
}

FeatureTable AnalysisCore::analyzeTarget(const std::string &path) const {
  std::cout << "Analyzing target sound: " << path << "\n";
  return analyzeSound(path, path, options.syncWithEvents);
}

const AnalysisOptions &AnalysisCore::getOptions() const { return options; }
