#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace DSP {

// Smallest power of two >= length, never below MIN_FFT_SIZE (pffft needs
// real transforms to be a multiple of 32)
int fftSizeFor(size_t length);

// Apply a Hann window to the first `size` samples
void window(std::vector<float> &input, int size);

// Real FFT of `size` samples; output holds size / 2 + 1 bins
void computeFFT(const std::vector<float> &input,
                std::vector<std::complex<float>> &output, int size);

// Inverse of computeFFT, normalized by 1 / size
void computeIFFT(const std::vector<std::complex<float>> &input,
                 std::vector<float> &output, int size);

// Compute power spectrum from FFT input (length = size / 2 + 1)
void computePowerSpectrum(const std::vector<std::complex<float>> &input,
                          std::vector<float> &output, int size);

void computeMagnitudeSpectrum(const std::vector<std::complex<float>> &input,
                              std::vector<float> &output, int size);

// input: Power spectrum (length = fftSize / 2 + 1)
// output: Mel-scale spectral envelope (length = nMelBands), not log-scaled
void computeSpectralEnv(const std::vector<float> &powerSpec,
                        std::vector<float> &melEnv, int sampleRate, int fftSize,
                        int nMelBands);

// Compute MFCCs from a mel-scale spectral envelope
void computeMFCC(const std::vector<float> &input, std::vector<float> &output,
                 int numCoeffs);

// Stevens' power law on the signal energy
void computeLoudness(const std::vector<float> &input, float &loudness);

// Compute centroid (Hz) from input power spectrum
void computeCentroid(const std::vector<float> &input, int size, int sampleRate,
                     float &centroid);

// Compute flux from current and previous power spectra
void computeFlux(const std::vector<float> &psCurr,
                 const std::vector<float> &psPrev, int size, float &flux);

// High frequency content: power weighted by bin frequency
void computeHFC(const std::vector<float> &ps, int size, int sampleRate,
                float &hfc);

// Number of magnitude spectrum peaks above SPECTRAL_PEAK_THRESHOLD
void computeSpectralComplexity(const std::vector<float> &mag, int size,
                               float &complexity);

// Highest autocorrelation peak of the magnitude spectrum inside the
// PITCH_SALIENCE_LOW_HZ..PITCH_SALIENCE_HIGH_HZ lag range, relative to lag 0
void computePitchSalience(const std::vector<float> &mag, int size,
                          int sampleRate, float &salience);

// Mean inverse DFA exponent of the short-time energy envelope.
// Zero when the signal is too short to fit two scales.
void computeDanceability(const std::vector<float> &input, int sampleRate,
                         float &danceability);

// Coarse class from the RMS level: -1 relaxed, 0 moderate, 1 aggressive
void computeIntensity(const std::vector<float> &input, float &intensity);

} // namespace DSP
