#include "audio_source.hpp"
#include "charter_error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <array>
#include <aubio/aubio.h>

namespace fs = std::filesystem;

// Formats aubio can open through its sndfile / libav / wavread backends.
static const std::array<const char*, 11> kAudioExtensions = {
  "wav", "wave", "aif", "aiff", "flac", "ogg", "oga", "mp3", "m4a", "caf", "au"
};
static constexpr unsigned kReadHop = 4096;

// --------- aubio handles ---------
struct SourceHandle {
  aubio_source_t* src = nullptr;
  fmat_t* buf = nullptr;
  ~SourceHandle() {
    if (buf) del_fmat(buf);
    if (src) del_aubio_source(src);
  }
};

bool isSupportedAudioExtension(const fs::path& path) {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return std::find_if(kAudioExtensions.begin(), kAudioExtensions.end(),
                      [&](const char* e){ return ext == e; }) != kAudioExtensions.end();
}

Samples loadAudio(const fs::path& path) {
  if (!isSupportedAudioExtension(path)) {
    throw CharterError(ErrorKind::UnsupportedFormat,
                       "unsupported audio format: " + path.string());
  }
  if (!fs::exists(path)) {
    throw CharterError(ErrorKind::DecodeError, "audio file not found: " + path.string());
  }

  SourceHandle h;
  // samplerate 0 = keep the file's own rate
  h.src = new_aubio_source(path.string().c_str(), 0, kReadHop);
  if (!h.src) {
    throw CharterError(ErrorKind::DecodeError, "cannot decode " + path.string());
  }
  unsigned rate = aubio_source_get_samplerate(h.src);
  unsigned channels = aubio_source_get_channels(h.src);
  if (rate == 0 || channels == 0) {
    throw CharterError(ErrorKind::DecodeError,
                       "invalid stream parameters in " + path.string());
  }

  h.buf = new_fmat(channels, kReadHop);
  Samples out;
  out.sampleRate = rate;
  uint_t read = 0;
  do {
    aubio_source_do_multi(h.src, h.buf, &read);
    for (uint_t i = 0; i < read; ++i) {
      float sum = 0.f;
      for (unsigned ch = 0; ch < channels; ++ch) sum += h.buf->data[ch][i];
      out.data.push_back(std::clamp(sum / channels, -1.f, 1.f));
    }
  } while (read == kReadHop);

  if (out.data.empty()) {
    throw CharterError(ErrorKind::EmptySignal, "no samples in " + path.string());
  }
  return out;
}

static void checkLayout(size_t count, unsigned channels, unsigned sampleRate) {
  if (channels == 0 || sampleRate == 0) {
    throw CharterError(ErrorKind::DecodeError, "channel count and sample rate must be positive");
  }
  if (count % channels != 0) {
    throw CharterError(ErrorKind::DecodeError, "truncated PCM frame");
  }
  if (count == 0) {
    throw CharterError(ErrorKind::EmptySignal, "empty PCM buffer");
  }
}

Samples makeSamples(const std::vector<float>& interleaved, unsigned channels, unsigned sampleRate) {
  checkLayout(interleaved.size(), channels, sampleRate);
  Samples out;
  out.sampleRate = sampleRate;
  size_t frames = interleaved.size() / channels;
  out.data.resize(frames);
  for (size_t i = 0; i < frames; ++i) {
    float sum = 0.f;
    for (unsigned ch = 0; ch < channels; ++ch) sum += interleaved[i*channels + ch];
    out.data[i] = std::clamp(sum / channels, -1.f, 1.f);
  }
  return out;
}

Samples makeSamplesFromPcm(const std::vector<int32_t>& interleaved, unsigned channels,
                           unsigned bitsPerSample, unsigned sampleRate) {
  if (bitsPerSample < 8 || bitsPerSample > 32) {
    throw CharterError(ErrorKind::UnsupportedFormat,
                       "unsupported bit depth " + std::to_string(bitsPerSample));
  }
  checkLayout(interleaved.size(), channels, sampleRate);
  const double scale = std::ldexp(1.0, (int)bitsPerSample - 1);
  std::vector<float> f(interleaved.size());
  for (size_t i = 0; i < interleaved.size(); ++i)
    f[i] = (float)(interleaved[i] / scale);
  return makeSamples(f, channels, sampleRate);
}
