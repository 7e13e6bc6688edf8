#pragma once

#include <cstddef>
#include <string>

// One contiguous span of samples [startSample, endSample) of an audio file
struct Frame {
  std::string collectionId;
  size_t frameIndex{0};
  std::string sourcePath;
  size_t startSample{0};
  size_t endSample{0};

  size_t length() const { return endSample - startSample; }

  // "{collectionId}_f{frameIndex}"
  std::string id() const {
    return collectionId + "_f" + std::to_string(frameIndex);
  }
};
