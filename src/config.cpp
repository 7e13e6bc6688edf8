#include "config.hpp"
#include "features.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

unsigned long long parseCount(const std::string &option,
                              const std::string &value) {
  try {
    size_t consumed = 0;
    if (!value.empty() && value[0] == '-') {
      throw std::invalid_argument(value);
    }
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw std::invalid_argument("invalid value '" + value + "' for " + option);
  }
}

unsigned parseUnsigned(const std::string &option, const std::string &value) {
  unsigned long long parsed = parseCount(option, value);
  if (parsed > std::numeric_limits<unsigned>::max()) {
    throw std::invalid_argument("value '" + value + "' for " + option +
                                " is out of range");
  }
  return static_cast<unsigned>(parsed);
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

Step parseStep(const std::string &value) {
  if (value == "analyze")
    return Step::Analyze;
  if (value == "mosaic")
    return Step::Mosaic;
  if (value == "all")
    return Step::All;
  throw std::invalid_argument("invalid step '" + value + "'");
}

} // namespace

Config::Config() : features(defaultSimilarityFeatures()) {}

std::string Config::resolvedOutputPath() const {
  if (!outputPath.empty()) {
    return outputPath;
  }
  return targetPath + ".reconstructed.wav";
}

std::string Config::provenancePath() const {
  return resolvedOutputPath() + ".provenance.csv";
}

Config parseArgs(const std::vector<std::string> &args) {
  Config config;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &option = args[i];
    if (option == "-h" || option == "--help") {
      config.showHelp = true;
      continue;
    }
    if (i + 1 >= args.size()) {
      throw std::invalid_argument(option.rfind("--", 0) == 0
                                      ? "missing value for " + option
                                      : "unexpected argument " + option);
    }
    const std::string &value = args[++i];

    if (option == "--step") {
      config.step = parseStep(value);
    } else if (option == "--collection") {
      config.collectionPath = value;
    } else if (option == "--target") {
      config.targetPath = value;
    } else if (option == "--frame-size") {
      config.frameSize = parseCount(option, value);
      if (config.frameSize < MIN_ANALYSIS_SIZE) {
        throw std::invalid_argument("--frame-size must be at least " +
                                    std::to_string(MIN_ANALYSIS_SIZE));
      }
    } else if (option == "--beats") {
      config.beatsPath = value;
    } else if (option == "--source-table") {
      config.sourceTablePath = value;
    } else if (option == "--target-table") {
      config.targetTablePath = value;
    } else if (option == "--output") {
      config.outputPath = value;
    } else if (option == "--choice") {
      config.choice = Matcher::parsePolicy(value);
    } else if (option == "--neighbours") {
      config.neighbours = parseCount(option, value);
      if (config.neighbours == 0) {
        throw std::invalid_argument("--neighbours must be positive");
      }
    } else if (option == "--features") {
      config.features = splitList(value);
      if (config.features.empty()) {
        throw std::invalid_argument("--features needs at least one name");
      }
    } else if (option == "--seed") {
      config.seed = parseUnsigned(option, value);
      config.seeded = true;
    } else if (option == "--jobs") {
      config.jobs = parseUnsigned(option, value);
      if (config.jobs == 0) {
        throw std::invalid_argument("--jobs must be positive");
      }
    } else {
      throw std::invalid_argument("unknown option " + option);
    }
  }
  return config;
}

std::string usage(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "  --step analyze|mosaic|all   steps to run (default all)\n"
      << "  --collection PATH           collection manifest CSV "
         "(default dataframe.csv)\n"
      << "  --target PATH               target audio file (default "
         "target.wav)\n"
      << "  --frame-size N              frame size in samples (default "
      << DEFAULT_FRAME_SIZE << ")\n"
      << "  --beats PATH                beat times in seconds for the "
         "target\n"
      << "  --source-table PATH         source analysis CSV "
         "(default dataframe_source.csv)\n"
      << "  --target-table PATH         target analysis CSV "
         "(default dataframe_target.csv)\n"
      << "  --output PATH               reconstructed WAV "
         "(default TARGET.reconstructed.wav)\n"
      << "  --choice best|random        frame selection (default random)\n"
      << "  --neighbours K              candidates for random choice "
         "(default "
      << DEFAULT_NEIGHBOURS << ")\n"
      << "  --features a,b,c            features compared\n"
      << "  --seed N                    seed for random choice\n"
      << "  --jobs N                    analysis worker threads (default 1)\n"
      << "  -h, --help                  show this help\n";
  return out.str();
}
