#include "audio.hpp"
#include "errors.hpp"
#include "globals.hpp"

#include "miniaudio.h"

#include <algorithm>
#include <iostream>

namespace {

constexpr ma_uint64 readChunkFrames = 4096;

} // namespace

std::vector<float> Audio::readMonoFile(const std::string &path) {
  // Let miniaudio downmix and resample to the analysis format
  ma_decoder_config config = ma_decoder_config_init(
      ma_format_f32, 1, static_cast<ma_uint32>(SAMPLE_RATE));

  ma_decoder decoder;
  ma_result result = ma_decoder_init_file(path.c_str(), &config, &decoder);
  if (result != MA_SUCCESS) {
    throw AudioFileError("Failed to open " + path + ": " +
                         ma_result_description(result));
  }

  // Some decoders cannot report their length up front, so read in chunks
  std::vector<float> samples;
  std::vector<float> chunk(readChunkFrames);
  while (true) {
    ma_uint64 framesRead = 0;
    result = ma_decoder_read_pcm_frames(&decoder, chunk.data(),
                                        readChunkFrames, &framesRead);
    if (result != MA_SUCCESS && result != MA_AT_END) {
      ma_decoder_uninit(&decoder);
      throw AudioFileError("Failed to decode " + path + ": " +
                           ma_result_description(result));
    }
    samples.insert(samples.end(), chunk.begin(), chunk.begin() + framesRead);
    if (result == MA_AT_END || framesRead < readChunkFrames) {
      break;
    }
  }
  ma_decoder_uninit(&decoder);

  std::cout << "Read " << samples.size() << " frames from " << path << "\n";
  return samples;
}

void Audio::writeMonoWav(const std::string &path,
                         const std::vector<float> &samples) {
  ma_encoder_config config =
      ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, 1,
                             static_cast<ma_uint32>(SAMPLE_RATE));

  ma_encoder encoder;
  ma_result result = ma_encoder_init_file(path.c_str(), &config, &encoder);
  if (result != MA_SUCCESS) {
    throw AudioFileError("Failed to create " + path + ": " +
                         ma_result_description(result));
  }

  ma_uint64 framesWritten = 0;
  result = ma_encoder_write_pcm_frames(&encoder, samples.data(),
                                       samples.size(), &framesWritten);
  ma_encoder_uninit(&encoder);
  if (result != MA_SUCCESS || framesWritten != samples.size()) {
    throw AudioFileError("Failed to write " + path);
  }
}

SegmentCache::SegmentCache(AudioLoader loader) : loader(std::move(loader)) {}

SegmentCache::Buffer SegmentCache::samples(const std::string &path) {
  std::promise<Buffer> promise;
  std::shared_future<Buffer> future;
  bool decodeHere = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = buffers.find(path);
    if (it == buffers.end()) {
      future = promise.get_future().share();
      buffers.emplace(path, future);
      decodeHere = true;
    } else {
      future = it->second;
    }
  }

  if (decodeHere) {
    try {
      auto buffer = std::make_shared<const std::vector<float>>(loader(path));
      decodes.fetch_add(1);
      promise.set_value(std::move(buffer));
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        buffers.erase(path);
      }
      // Waiters and this caller both see the failure through the future
      promise.set_exception(std::current_exception());
    }
  }
  return future.get();
}

std::vector<float> SegmentCache::getSegment(const std::string &path,
                                            size_t startSample, size_t length) {
  Buffer buffer = samples(path);
  if (startSample >= buffer->size()) {
    return {};
  }
  const size_t available = std::min(length, buffer->size() - startSample);
  return std::vector<float>(buffer->begin() + startSample,
                            buffer->begin() + startSample + available);
}

size_t SegmentCache::decodeCount() const { return decodes.load(); }

size_t SegmentCache::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return buffers.size();
}
