#include "dsp.hpp"
#include "globals.hpp"

#include "pffft.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <new>
#include <stdexcept>

namespace {

using pffft::detail::PFFFT_Setup;

struct SetupDeleter {
  void operator()(PFFFT_Setup *setup) const {
    pffft::detail::pffft_destroy_setup(setup);
  }
};

using SetupPtr = std::unique_ptr<PFFFT_Setup, SetupDeleter>;

// pffft wants 16-byte aligned buffers for its SIMD paths
class AlignedBuffer {
public:
  explicit AlignedBuffer(size_t count)
      : data(static_cast<float *>(
            pffft::detail::pffft_aligned_malloc(count * sizeof(float)))),
        count(count) {
    if (!data) {
      throw std::bad_alloc();
    }
    std::fill(data, data + count, 0.0f);
  }
  ~AlignedBuffer() { pffft::detail::pffft_aligned_free(data); }

  AlignedBuffer(const AlignedBuffer &) = delete;
  AlignedBuffer &operator=(const AlignedBuffer &) = delete;

  float *get() { return data; }
  size_t size() const { return count; }

private:
  float *data;
  size_t count;
};

SetupPtr makeRealSetup(int size) {
  SetupPtr setup(pffft::detail::pffft_new_setup(size, pffft::detail::PFFFT_REAL));
  if (!setup) {
    throw std::runtime_error("Failed to initialize PFFFT");
  }
  return setup;
}

// Least-squares line through (0, y[0]) .. (n-1, y[n-1]); returns the residual
// energy
double detrendedEnergy(const std::vector<double> &y, size_t begin, size_t n) {
  double sumX = 0.0, sumY = 0.0, sumXX = 0.0, sumXY = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double x = static_cast<double>(i);
    sumX += x;
    sumY += y[begin + i];
    sumXX += x * x;
    sumXY += x * y[begin + i];
  }
  double denom = n * sumXX - sumX * sumX;
  double slope = denom != 0.0 ? (n * sumXY - sumX * sumY) / denom : 0.0;
  double intercept = (sumY - slope * sumX) / n;

  double energy = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double r = y[begin + i] - (intercept + slope * i);
    energy += r * r;
  }
  return energy;
}

} // namespace

int DSP::fftSizeFor(size_t length) {
  size_t size = MIN_FFT_SIZE;
  while (size < length) {
    size <<= 1;
  }
  return static_cast<int>(size);
}

void DSP::window(std::vector<float> &input, int size) {
  if (size < 2) {
    return;
  }
  // Apply Hann window
  for (int n = 0; n < size; ++n) {
    float w = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * n /
                                      (size - 1)));
    input[n] *= w;
  }
}

void DSP::computeFFT(const std::vector<float> &input,
                     std::vector<std::complex<float>> &output, int size) {
  SetupPtr setup = makeRealSetup(size);

  AlignedBuffer in(size);
  AlignedBuffer out(size);
  AlignedBuffer work(size);
  std::copy(input.begin(), input.begin() + std::min<size_t>(input.size(), size),
            in.get());

  pffft::detail::pffft_transform_ordered(setup.get(), in.get(), out.get(),
                                         work.get(),
                                         pffft::detail::PFFFT_FORWARD);

  // Ordered layout: DC and Nyquist real parts first, then (re, im) pairs
  const int nSpec = size / 2 + 1;
  output.resize(nSpec);
  output[0] = std::complex<float>(out.get()[0], 0.0f);
  output[nSpec - 1] = std::complex<float>(out.get()[1], 0.0f);
  for (int k = 1; k < nSpec - 1; ++k) {
    output[k] = std::complex<float>(out.get()[2 * k], out.get()[2 * k + 1]);
  }
}

void DSP::computeIFFT(const std::vector<std::complex<float>> &input,
                      std::vector<float> &output, int size) {
  SetupPtr setup = makeRealSetup(size);

  const int nSpec = size / 2 + 1;
  AlignedBuffer in(size);
  AlignedBuffer out(size);
  AlignedBuffer work(size);
  in.get()[0] = input[0].real();
  in.get()[1] = input[nSpec - 1].real();
  for (int k = 1; k < nSpec - 1; ++k) {
    in.get()[2 * k] = input[k].real();
    in.get()[2 * k + 1] = input[k].imag();
  }

  pffft::detail::pffft_transform_ordered(setup.get(), in.get(), out.get(),
                                         work.get(),
                                         pffft::detail::PFFFT_BACKWARD);

  // pffft does not scale the backward transform
  output.resize(size);
  for (int n = 0; n < size; ++n) {
    output[n] = out.get()[n] / static_cast<float>(size);
  }
}

void DSP::computePowerSpectrum(const std::vector<std::complex<float>> &input,
                               std::vector<float> &output, int size) {
  const int nSpec = size / 2 + 1;
  output.resize(nSpec);
  for (int k = 0; k < nSpec; ++k) {
    float re = input[k].real();
    float im = input[k].imag();
    output[k] = re * re + im * im;
  }
}

void DSP::computeMagnitudeSpectrum(
    const std::vector<std::complex<float>> &input, std::vector<float> &output,
    int size) {
  const int nSpec = size / 2 + 1;
  output.resize(nSpec);
  for (int k = 0; k < nSpec; ++k) {
    output[k] = std::abs(input[k]);
  }
}

void DSP::computeSpectralEnv(
    const std::vector<float> &powerSpec, // |FFT|^2, size = fftSize/2 + 1
    std::vector<float> &melEnv, int sampleRate, int fftSize, int nMelBands) {
  const int nSpec = fftSize / 2 + 1;
  melEnv.assign(nMelBands, 0.0f);

  // --- Hz <-> Mel ---
  auto hzToMel = [](float f) {
    return 2595.0f * std::log10(1.0f + f / 700.0f);
  };
  auto melToHz = [](float m) {
    return 700.0f * (std::pow(10.0f, m / 2595.0f) - 1.0f);
  };

  const float fMin = 0.0f;
  const float fMax = sampleRate * 0.5f;

  const float melMin = hzToMel(fMin);
  const float melMax = hzToMel(fMax);

  // --- Mel band edges (Hz) ---
  std::vector<float> melHz(nMelBands + 2);
  for (int i = 0; i < nMelBands + 2; ++i) {
    float mel = melMin + (melMax - melMin) * i / (nMelBands + 1);
    melHz[i] = melToHz(mel);
  }

  // --- Convert Hz -> FFT bin indices ---
  std::vector<int> bins(nMelBands + 2);
  for (int i = 0; i < nMelBands + 2; ++i) {
    int b = static_cast<int>(std::floor(melHz[i] * fftSize / sampleRate));
    bins[i] = std::clamp(b, 0, nSpec - 1);
  }

  // --- Apply triangular mel filters ---
  for (int m = 0; m < nMelBands; ++m) {
    int left = bins[m];
    int center = bins[m + 1];
    int right = bins[m + 2];

    if (center <= left || right <= center)
      continue; // avoid zero-width filters

    float energy = 0.0f;
    float norm = 0.0f;

    // Rising slope
    for (int k = left; k < center; ++k) {
      float w = (k - left) / float(center - left);
      energy += powerSpec[k] * w;
      norm += w;
    }

    // Falling slope
    for (int k = center; k < right; ++k) {
      float w = (right - k) / float(right - center);
      energy += powerSpec[k] * w;
      norm += w;
    }

    // Normalize for equal-area filters
    if (norm > 0.0f)
      energy /= norm;

    melEnv[m] = energy;
  }
}

void DSP::computeMFCC(const std::vector<float> &input,
                      std::vector<float> &output, int numCoeffs) {
  const int M = static_cast<int>(input.size()); // number of mel bands
  output.assign(numCoeffs, 0.0f);
  if (M == 0) {
    return;
  }

  // --- Step 1: log compression ---
  constexpr float eps = 1e-10f; // prevent log(0)
  std::vector<float> logMel(M);
  for (int m = 0; m < M; ++m)
    logMel[m] = std::log(input[m] + eps);

  // --- Step 2: DCT-II ---
  for (int n = 0; n < numCoeffs; ++n) {
    float sum = 0.0f;
    for (int m = 0; m < M; ++m)
      sum += logMel[m] *
             std::cos(static_cast<float>(M_PI) * n * (m + 0.5f) / M);
    output[n] = sum;
  }

  // --- Step 3: orthonormal scaling ---
  output[0] *= std::sqrt(1.0f / M);
  for (int n = 1; n < numCoeffs; ++n)
    output[n] *= std::sqrt(2.0f / M);
}

void DSP::computeLoudness(const std::vector<float> &input, float &loudness) {
  double energy = 0.0;
  for (float sample : input) {
    energy += static_cast<double>(sample) * sample;
  }
  loudness = static_cast<float>(std::pow(energy, 0.67));
}

void DSP::computeCentroid(const std::vector<float> &input, int size,
                          int sampleRate, float &centroid) {
  const int nSpec = size / 2 + 1;
  float num = 0.0f;
  float denom = 0.0f;
  for (int k = 0; k < nSpec; k++) {
    num += (static_cast<float>(k) * sampleRate / size) * input[k];
    denom += input[k];
  }
  if (denom > 0.0f) {
    centroid = num / denom;
  } else {
    centroid = 0.0f;
  }
}

void DSP::computeFlux(const std::vector<float> &psCurr,
                      const std::vector<float> &psPrev, int size, float &flux) {
  const int nSpec = size / 2 + 1;
  flux = 0.0f;
  for (int k = 0; k < nSpec; k++) {
    float diff = psCurr[k] - psPrev[k];
    flux += diff * diff;
  }
  flux = std::sqrt(flux);
}

void DSP::computeHFC(const std::vector<float> &ps, int size, int sampleRate,
                     float &hfc) {
  const int nSpec = size / 2 + 1;
  double sum = 0.0;
  for (int k = 0; k < nSpec; ++k) {
    sum += ps[k] * (static_cast<double>(k) * sampleRate / size);
  }
  hfc = static_cast<float>(sum);
}

void DSP::computeSpectralComplexity(const std::vector<float> &mag, int size,
                                    float &complexity) {
  const int nSpec = size / 2 + 1;
  int peaks = 0;
  for (int k = 1; k < nSpec - 1; ++k) {
    if (mag[k] > SPECTRAL_PEAK_THRESHOLD && mag[k] > mag[k - 1] &&
        mag[k] >= mag[k + 1]) {
      ++peaks;
    }
  }
  complexity = static_cast<float>(peaks);
}

void DSP::computePitchSalience(const std::vector<float> &mag, int size,
                               int sampleRate, float &salience) {
  const int nSpec = size / 2 + 1;
  salience = 0.0f;

  const int lowLag = static_cast<int>(
      std::ceil(PITCH_SALIENCE_LOW_HZ * size / static_cast<float>(sampleRate)));
  const int highLag = std::min(
      nSpec - 1, static_cast<int>(std::floor(PITCH_SALIENCE_HIGH_HZ * size /
                                             static_cast<float>(sampleRate))));
  if (lowLag > highLag) {
    return;
  }

  // Autocorrelation through the power spectrum of the zero-padded magnitudes
  const int acSize = fftSizeFor(2 * static_cast<size_t>(nSpec));
  std::vector<float> padded(acSize, 0.0f);
  std::copy(mag.begin(), mag.begin() + nSpec, padded.begin());

  std::vector<std::complex<float>> spectrum;
  computeFFT(padded, spectrum, acSize);
  for (auto &bin : spectrum) {
    bin = std::complex<float>(std::norm(bin), 0.0f);
  }
  std::vector<float> ac;
  computeIFFT(spectrum, ac, acSize);

  if (ac[0] <= 0.0f) {
    return;
  }
  float peak = 0.0f;
  for (int lag = lowLag; lag <= highLag; ++lag) {
    peak = std::max(peak, ac[lag]);
  }
  salience = std::clamp(peak / ac[0], 0.0f, 1.0f);
}

void DSP::computeDanceability(const std::vector<float> &input, int sampleRate,
                              float &danceability) {
  danceability = 0.0f;

  // 10 ms energy envelope
  const size_t hop =
      static_cast<size_t>(DANCEABILITY_HOP_SAMPLES) * sampleRate / SAMPLE_RATE;
  if (hop == 0) {
    return;
  }
  const size_t n = input.size() / hop;
  std::vector<double> envelope(n, 0.0);
  for (size_t i = 0; i < n; ++i) {
    double energy = 0.0;
    for (size_t j = 0; j < hop; ++j) {
      double s = input[i * hop + j];
      energy += s * s;
    }
    envelope[i] = energy / hop;
  }
  if (n == 0) {
    return;
  }

  // Integrated profile
  double mean = 0.0;
  for (double e : envelope)
    mean += e;
  mean /= n;
  std::vector<double> profile(n, 0.0);
  double acc = 0.0;
  for (size_t i = 0; i < n; ++i) {
    acc += envelope[i] - mean;
    profile[i] = acc;
  }

  // Fluctuation per scale
  std::vector<double> scales;
  std::vector<double> fluctuation;
  for (size_t tau = 4; tau <= n / 2;
       tau = std::max(tau + 1, static_cast<size_t>(std::lround(tau * 1.5)))) {
    const size_t blocks = n / tau;
    double energy = 0.0;
    for (size_t b = 0; b < blocks; ++b) {
      energy += detrendedEnergy(profile, b * tau, tau);
    }
    double f = std::sqrt(energy / (blocks * tau));
    if (f > 0.0) {
      scales.push_back(static_cast<double>(tau));
      fluctuation.push_back(f);
    }
  }
  if (scales.size() < 2) {
    return;
  }

  double sum = 0.0;
  int count = 0;
  for (size_t i = 0; i + 1 < scales.size(); ++i) {
    double alpha = std::log(fluctuation[i + 1] / fluctuation[i]) /
                   std::log(scales[i + 1] / scales[i]);
    if (alpha > 0.0) {
      sum += 1.0 / alpha;
      ++count;
    }
  }
  if (count > 0) {
    danceability = static_cast<float>(sum / count);
  }
}

void DSP::computeIntensity(const std::vector<float> &input, float &intensity) {
  intensity = -1.0f;
  if (input.empty()) {
    return;
  }
  double energy = 0.0;
  for (float sample : input) {
    energy += static_cast<double>(sample) * sample;
  }
  const double rms = std::sqrt(energy / input.size());
  const double db = 20.0 * std::log10(rms + 1e-10);
  if (db > INTENSITY_AGGRESSIVE_DB) {
    intensity = 1.0f;
  } else if (db > INTENSITY_RELAXED_DB) {
    intensity = 0.0f;
  }
}
