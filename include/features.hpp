#pragma once

#include <cstddef>
#include <string>
#include <vector>

// loudness, mfcc_0..mfcc_12, spectral_centroid, danceability, flux, hfc,
// spectral_complexity, pitch_salience, intensity
const std::vector<std::string> &featureSchema();

// Columns compared when the caller does not choose any
const std::vector<std::string> &defaultSimilarityFeatures();

// Column index of every name in `names`, in that order. Throws
// InvalidQueryError if `names` is empty or a name is not in `schema`.
std::vector<size_t> resolveColumns(const std::vector<std::string> &schema,
                                   const std::vector<std::string> &names);

struct FeatureVector {
  std::vector<std::string> names;
  std::vector<float> values;

  size_t size() const { return values.size(); }
  float value(const std::string &name) const;

  // Values of `features`, in the order given
  std::vector<float> project(const std::vector<std::string> &features) const;
};

// Compute the standard feature vector of one frame. Pure function of the
// samples; throws AnalysisError when the frame cannot be analyzed.
FeatureVector buildFeatureVector(const std::vector<float> &frame);
