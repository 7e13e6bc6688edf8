#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "globals.hpp"
#include "matcher.hpp"

enum class Step { Analyze, Mosaic, All };

struct Config {
  Step step{Step::All};
  std::string collectionPath{"dataframe.csv"};
  std::string targetPath{"target.wav"};
  size_t frameSize{DEFAULT_FRAME_SIZE};
  // beat times in seconds, one per line; switches the target to
  // event-synced frames
  std::string beatsPath;
  std::string sourceTablePath{"dataframe_source.csv"};
  std::string targetTablePath{"dataframe_target.csv"};
  std::string outputPath;
  SelectionPolicy choice{SelectionPolicy::RandomAmongTopK};
  size_t neighbours{DEFAULT_NEIGHBOURS};
  std::vector<std::string> features;
  bool seeded{false};
  unsigned seed{0};
  unsigned jobs{1};
  bool showHelp{false};

  Config();

  bool analyze() const { return step != Step::Mosaic; }
  bool mosaic() const { return step != Step::Analyze; }

  // --output, or "{target}.reconstructed.wav"
  std::string resolvedOutputPath() const;
  std::string provenancePath() const;
};

// Arguments without the program name. Throws std::invalid_argument.
Config parseArgs(const std::vector<std::string> &args);

std::string usage(const std::string &program);
