#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Decodes a whole file to mono float samples at SAMPLE_RATE
using AudioLoader = std::function<std::vector<float>(const std::string &)>;

namespace Audio {

// Any format miniaudio can decode, downmixed and resampled.
// Throws AudioFileError.
std::vector<float> readMonoFile(const std::string &path);

// Mono 32-bit float WAV at SAMPLE_RATE. Throws AudioFileError.
void writeMonoWav(const std::string &path, const std::vector<float> &samples);

} // namespace Audio

// Decoded source files keyed by path, one decode per path for the lifetime
// of the cache. Concurrent requests for a path that is still decoding wait
// for that decode instead of starting another one.
class SegmentCache {
public:
  using Buffer = std::shared_ptr<const std::vector<float>>;

  explicit SegmentCache(AudioLoader loader = Audio::readMonoFile);

  // Whole decoded file. A failed decode is rethrown and not cached.
  Buffer samples(const std::string &path);

  // [startSample, startSample + length) clipped to the decoded length; a
  // start past the end gives an empty segment
  std::vector<float> getSegment(const std::string &path, size_t startSample,
                                size_t length);

  size_t decodeCount() const;
  size_t size() const;

private:
  AudioLoader loader;
  mutable std::mutex mutex;
  std::unordered_map<std::string, std::shared_future<Buffer>> buffers;
  std::atomic<size_t> decodes{0};
};
