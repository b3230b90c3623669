#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>

// Mono, normalized to [-1, 1]. Never empty once built by the functions below.
struct Samples {
  std::vector<float> data;
  unsigned sampleRate = 0;

  double duration() const {
    return sampleRate ? (double)data.size() / sampleRate : 0.0;
  }
};

bool isSupportedAudioExtension(const std::filesystem::path& path);

// Decodes through aubio at the file's native rate and downmixes to mono.
// Throws CharterError (UnsupportedFormat, DecodeError, EmptySignal).
Samples loadAudio(const std::filesystem::path& path);

// Interleaved float PCM -> Samples (channel average, clamp).
Samples makeSamples(const std::vector<float>& interleaved, unsigned channels, unsigned sampleRate);

// Interleaved integer PCM of 8..32 bits -> Samples, scaled by 2^(bits-1).
Samples makeSamplesFromPcm(const std::vector<int32_t>& interleaved, unsigned channels,
                           unsigned bitsPerSample, unsigned sampleRate);
