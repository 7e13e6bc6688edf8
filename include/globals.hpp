#pragma once

// Every buffer in the pipeline is mono at this rate
#define SAMPLE_RATE 44100

#define DEFAULT_FRAME_SIZE 8192
#define DEFAULT_NEIGHBOURS 10

#define MFCC_COEFF_COUNT 13
#define MEL_BAND_COUNT 40

// Frames shorter than this cannot be windowed and split for flux
#define MIN_ANALYSIS_SIZE 256
#define MIN_FFT_SIZE 64

#define SPECTRAL_PEAK_THRESHOLD 0.005f
#define PITCH_SALIENCE_LOW_HZ 100.0f
#define PITCH_SALIENCE_HIGH_HZ 5000.0f
#define DANCEABILITY_HOP_SAMPLES 441

#define INTENSITY_RELAXED_DB -30.0f
#define INTENSITY_AGGRESSIVE_DB -12.0f
