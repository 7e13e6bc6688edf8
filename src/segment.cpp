#include "segment.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

size_t Segmenter::evenFrameSize(size_t frameSize) {
  if (frameSize == 0) {
    throw std::invalid_argument("frame size must be positive");
  }
  if (frameSize % 2 != 0) {
    ++frameSize;
  }
  return frameSize;
}

std::vector<FrameBounds> Segmenter::fixed(size_t sampleCount,
                                          size_t frameSize) {
  frameSize = evenFrameSize(frameSize);

  std::vector<size_t> boundaries;
  for (size_t start = 0; start < sampleCount; start += frameSize) {
    boundaries.push_back(start);
  }

  std::vector<FrameBounds> frames;
  for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
    frames.push_back({boundaries[i], boundaries[i + 1]});
  }
  return frames;
}

std::vector<FrameBounds>
Segmenter::events(size_t sampleCount, const std::vector<size_t> &eventSamples) {
  std::vector<size_t> boundaries;
  for (size_t position : eventSamples) {
    if (!boundaries.empty() && position < boundaries.back()) {
      throw std::invalid_argument("event positions must be ascending");
    }
    if (position > sampleCount) {
      continue;
    }
    if (!boundaries.empty() && position == boundaries.back()) {
      continue;
    }
    boundaries.push_back(position);
  }

  std::vector<FrameBounds> frames;
  for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
    frames.push_back({boundaries[i], boundaries[i + 1]});
  }
  return frames;
}

std::vector<size_t> Segmenter::secondsToSamples(const std::vector<double> &seconds,
                                                int sampleRate) {
  std::vector<size_t> samples;
  samples.reserve(seconds.size());
  for (double t : seconds) {
    if (!(t >= 0.0)) {
      throw std::invalid_argument("event time must be non-negative");
    }
    samples.push_back(static_cast<size_t>(std::llround(t * sampleRate)));
  }
  return samples;
}

std::vector<double> Segmenter::readEventTimes(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open event file " + path);
  }

  std::vector<double> times;
  std::string line;
  size_t lineNumber = 0;
  while (std::getline(in, line)) {
    ++lineNumber;
    size_t hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    std::istringstream fields(line);
    double t = 0.0;
    if (!(fields >> t)) {
      if (line.find_first_not_of(" \t\r") != std::string::npos) {
        throw std::runtime_error("Invalid event time at " + path + ":" +
                                 std::to_string(lineNumber));
      }
      continue;
    }
    times.push_back(t);
  }
  return times;
}
