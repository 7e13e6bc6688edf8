#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct FrameBounds {
  size_t start;
  size_t end;
};

namespace Segmenter {

// Odd frame sizes are bumped to the next even value
size_t evenFrameSize(size_t frameSize);

// Consecutive frameSize intervals starting at 0. One frame is emitted per
// pair of adjacent boundaries, so the last boundary (and the partial tail
// after it) produces no frame.
std::vector<FrameBounds> fixed(size_t sampleCount, size_t frameSize);

// One frame per pair of consecutive event positions. Events past the end of
// the buffer are ignored and repeated events collapse.
std::vector<FrameBounds> events(size_t sampleCount,
                                const std::vector<size_t> &eventSamples);

// Convert event times in seconds to sample positions
std::vector<size_t> secondsToSamples(const std::vector<double> &seconds,
                                     int sampleRate);

// One time in seconds per line; blank lines and '#' comments are skipped
std::vector<double> readEventTimes(const std::string &path);

} // namespace Segmenter
