#include "features.hpp"
#include "dsp.hpp"
#include "errors.hpp"
#include "globals.hpp"

#include <algorithm>
#include <cmath>

namespace {

std::vector<std::string> makeSchema() {
  std::vector<std::string> schema;
  schema.push_back("loudness");
  for (int i = 0; i < MFCC_COEFF_COUNT; ++i) {
    schema.push_back("mfcc_" + std::to_string(i));
  }
  schema.insert(schema.end(),
                {"spectral_centroid", "danceability", "flux", "hfc",
                 "spectral_complexity", "pitch_salience", "intensity"});
  return schema;
}

std::vector<std::string> makeSimilarityFeatures() {
  std::vector<std::string> features;
  for (int i = 0; i < MFCC_COEFF_COUNT; ++i) {
    features.push_back("mfcc_" + std::to_string(i));
  }
  features.insert(features.end(),
                  {"loudness", "spectral_centroid", "danceability", "flux",
                   "hfc", "spectral_complexity", "pitch_salience",
                   "intensity"});
  return features;
}

// Window `count` samples starting at `offset`, zero-padded to fftSize
void powerSpectrumOf(const std::vector<float> &frame, size_t offset,
                     size_t count, int fftSize,
                     std::vector<std::complex<float>> &spectrum,
                     std::vector<float> &powerSpec) {
  std::vector<float> windowed(frame.begin() + offset,
                              frame.begin() + offset + count);
  DSP::window(windowed, static_cast<int>(count));
  windowed.resize(fftSize, 0.0f);
  DSP::computeFFT(windowed, spectrum, fftSize);
  DSP::computePowerSpectrum(spectrum, powerSpec, fftSize);
}

} // namespace

const std::vector<std::string> &featureSchema() {
  static const std::vector<std::string> schema = makeSchema();
  return schema;
}

const std::vector<std::string> &defaultSimilarityFeatures() {
  static const std::vector<std::string> features = makeSimilarityFeatures();
  return features;
}

std::vector<size_t> resolveColumns(const std::vector<std::string> &schema,
                                   const std::vector<std::string> &names) {
  if (names.empty()) {
    throw InvalidQueryError("no features selected");
  }
  std::vector<size_t> columns;
  columns.reserve(names.size());
  for (const auto &name : names) {
    auto it = std::find(schema.begin(), schema.end(), name);
    if (it == schema.end()) {
      throw InvalidQueryError("unknown feature '" + name + "'");
    }
    columns.push_back(static_cast<size_t>(it - schema.begin()));
  }
  return columns;
}

float FeatureVector::value(const std::string &name) const {
  return values[resolveColumns(names, {name}).front()];
}

std::vector<float>
FeatureVector::project(const std::vector<std::string> &features) const {
  std::vector<float> projected;
  for (size_t column : resolveColumns(names, features)) {
    projected.push_back(values[column]);
  }
  return projected;
}

FeatureVector buildFeatureVector(const std::vector<float> &frame) {
  const size_t n = frame.size();
  if (n < MIN_ANALYSIS_SIZE) {
    throw AnalysisError("frame of " + std::to_string(n) +
                        " samples is shorter than " +
                        std::to_string(MIN_ANALYSIS_SIZE));
  }
  for (float sample : frame) {
    if (!std::isfinite(sample)) {
      throw AnalysisError("frame contains non-finite samples");
    }
  }

  // Whole-frame spectrum
  const int fftSize = DSP::fftSizeFor(n);
  std::vector<std::complex<float>> spectrum;
  std::vector<float> powerSpec;
  powerSpectrumOf(frame, 0, n, fftSize, spectrum, powerSpec);
  std::vector<float> magnitude;
  DSP::computeMagnitudeSpectrum(spectrum, magnitude, fftSize);

  float loudness = 0.0f;
  DSP::computeLoudness(frame, loudness);

  std::vector<float> melEnv;
  DSP::computeSpectralEnv(powerSpec, melEnv, SAMPLE_RATE, fftSize,
                          MEL_BAND_COUNT);
  std::vector<float> mfccs;
  DSP::computeMFCC(melEnv, mfccs, MFCC_COEFF_COUNT);

  float centroid = 0.0f;
  DSP::computeCentroid(powerSpec, fftSize, SAMPLE_RATE, centroid);

  // Flux between the two halves of the frame
  const size_t half = n / 2;
  const int halfFftSize = DSP::fftSizeFor(half);
  std::vector<std::complex<float>> halfSpectrum;
  std::vector<float> psPrev;
  std::vector<float> psCurr;
  powerSpectrumOf(frame, 0, half, halfFftSize, halfSpectrum, psPrev);
  powerSpectrumOf(frame, half, half, halfFftSize, halfSpectrum, psCurr);
  float flux = 0.0f;
  DSP::computeFlux(psCurr, psPrev, halfFftSize, flux);

  float hfc = 0.0f;
  DSP::computeHFC(powerSpec, fftSize, SAMPLE_RATE, hfc);

  float complexity = 0.0f;
  DSP::computeSpectralComplexity(magnitude, fftSize, complexity);

  float salience = 0.0f;
  DSP::computePitchSalience(magnitude, fftSize, SAMPLE_RATE, salience);

  float danceability = 0.0f;
  DSP::computeDanceability(frame, SAMPLE_RATE, danceability);

  float intensity = 0.0f;
  DSP::computeIntensity(frame, intensity);

  FeatureVector vector;
  vector.names = featureSchema();
  vector.values.reserve(vector.names.size());
  // Normalized by length so variable-length frames stay comparable
  vector.values.push_back(loudness / static_cast<float>(n));
  vector.values.insert(vector.values.end(), mfccs.begin(), mfccs.end());
  vector.values.push_back(centroid);
  vector.values.push_back(danceability);
  vector.values.push_back(flux);
  vector.values.push_back(hfc);
  vector.values.push_back(complexity);
  vector.values.push_back(salience);
  vector.values.push_back(intensity);
  return vector;
}
