#include "../src/audio_source.hpp"
#include "../src/charter_error.hpp"
#include "test_signals.hpp"
#include <cassert>
#include <cmath>
#include <fstream>

namespace fs = std::filesystem;

template <typename F>
static ErrorKind errorOf(F&& f) {
  try {
    f();
  } catch (const CharterError& e) {
    return e.kind();
  }
  assert(false && "expected CharterError");
  return ErrorKind::SerializationError;
}

int main() {
  // Stereo float PCM is averaged into one channel
  {
    std::vector<float> stereo = {1.0f, 0.0f, 0.5f, -0.5f, -1.0f, -0.2f};
    Samples s = makeSamples(stereo, 2, 48000);
    assert(s.sampleRate == 48000);
    assert(s.data.size() == 3);
    assert(std::abs(s.data[0] - 0.5f) < 1e-6f);
    assert(std::abs(s.data[1] - 0.0f) < 1e-6f);
    assert(std::abs(s.data[2] + 0.6f) < 1e-6f);
  }

  // Out-of-range float input is clamped
  {
    Samples s = makeSamples({2.0f, -3.0f}, 1, 8000);
    assert(s.data[0] == 1.0f);
    assert(s.data[1] == -1.0f);
  }

  // Every channel layout ends up mono with the frame count preserved
  for (unsigned ch = 1; ch <= 6; ++ch) {
    std::vector<float> pcm(ch * 100, 0.25f);
    Samples s = makeSamples(pcm, ch, 22050);
    assert(s.data.size() == 100);
    assert(std::abs(s.data[50] - 0.25f) < 1e-6f);
  }

  // Integer PCM normalizes the same regardless of bit depth
  {
    Samples s16 = makeSamplesFromPcm({16384, -32768}, 1, 16, 44100);
    Samples s24 = makeSamplesFromPcm({4194304, -8388608}, 1, 24, 44100);
    Samples s8 = makeSamplesFromPcm({64, -128}, 1, 8, 44100);
    assert(std::abs(s16.data[0] - 0.5f) < 1e-6f);
    assert(s16.data[1] == -1.0f);
    assert(s16.data == s24.data);
    assert(s16.data == s8.data);
  }

  // Bad layouts
  assert(errorOf([]{ makeSamples({}, 1, 44100); }) == ErrorKind::EmptySignal);
  assert(errorOf([]{ makeSamples({0.1f}, 0, 44100); }) == ErrorKind::DecodeError);
  assert(errorOf([]{ makeSamples({0.1f}, 1, 0); }) == ErrorKind::DecodeError);
  assert(errorOf([]{ makeSamples({0.1f, 0.2f, 0.3f}, 2, 44100); }) == ErrorKind::DecodeError);
  assert(errorOf([]{ makeSamplesFromPcm({1, 2}, 1, 40, 44100); }) == ErrorKind::UnsupportedFormat);

  // Extension gate runs before the file is touched
  assert(isSupportedAudioExtension("song.WAV"));
  assert(isSupportedAudioExtension("dir/song.flac"));
  assert(!isSupportedAudioExtension("song.txt"));
  assert(!isSupportedAudioExtension("song"));
  assert(errorOf([]{ loadAudio("nothing_here.xyz"); }) == ErrorKind::UnsupportedFormat);
  assert(errorOf([]{ loadAudio("nothing_here.wav"); }) == ErrorKind::DecodeError);

  fs::path dir = scratchDir("rockcharter_audio_test");

  // Garbage with a known extension fails to decode
  {
    fs::path junk = dir / "junk.wav";
    std::ofstream(junk) << "this is not a wave file";
    assert(errorOf([&]{ loadAudio(junk); }) == ErrorKind::DecodeError);
  }

  // A stereo file written through aubio decodes back to its channel average
  {
    Samples tone = sineWave(440.0, 0.5, 22050, 0.5f);
    fs::path wav = dir / "stereo.wav";
    assert(writeWav(wav, tone, {1.0f, 0.2f}));
    Samples back = loadAudio(wav);
    assert(back.sampleRate == 22050);
    assert(back.data.size() == tone.data.size());
    for (size_t i = 0; i < back.data.size(); i += 97) {
      float expected = 0.6f * tone.data[i];
      assert(std::abs(back.data[i] - expected) < 2e-3f);
      assert(back.data[i] <= 1.0f && back.data[i] >= -1.0f);
    }
    assert(std::abs(back.duration() - 0.5) < 1e-3);
  }

  fs::remove_all(dir);
  return 0;
}
