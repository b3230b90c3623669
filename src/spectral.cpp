#include "spectral.hpp"
#include "charter_error.hpp"
#include "join_threads.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>
#include <thread>
#include <aubio/aubio.h>

// --------- FFT worker ---------
// aubio plans are not shareable between threads; each worker owns one.
struct FftWorker {
  aubio_fft_t* fft = nullptr;
  fvec_t* window = nullptr;
  fvec_t* in = nullptr;
  cvec_t* spec = nullptr;

  explicit FftWorker(unsigned winSize) {
    char kind[] = "hanning";
    fft = new_aubio_fft(winSize);
    window = new_aubio_window(kind, winSize);
    in = new_fvec(winSize);
    spec = new_cvec(winSize);
    if (!fft || !window || !in || !spec) {
      release();
      throw CharterError(ErrorKind::InvalidConfig,
                         "cannot create FFT of size " + std::to_string(winSize));
    }
  }
  ~FftWorker() { release(); }
  FftWorker(const FftWorker&) = delete;
  FftWorker& operator=(const FftWorker&) = delete;

  void release() {
    if (spec) del_cvec(spec);
    if (in) del_fvec(in);
    if (window) del_fvec(window);
    if (fft) del_aubio_fft(fft);
    spec = nullptr; in = nullptr; window = nullptr; fft = nullptr;
  }
};

static BinRange binsFor(const FrequencyBand& b, unsigned sampleRate, unsigned winSize) {
  const double binHz = (double)sampleRate / winSize;
  const size_t nBins = winSize / 2 + 1;
  BinRange r;
  r.first = std::min(nBins, (size_t)std::ceil(std::max(0.0, (double)b.lowHz) / binHz));
  r.last = std::min(nBins, (size_t)std::ceil(std::max(0.0, (double)b.highHz) / binHz));
  if (r.last < r.first) r.last = r.first;
  return r;
}

std::vector<BinRange> bandBins(const std::vector<FrequencyBand>& bands,
                               unsigned sampleRate, unsigned winSize) {
  const size_t nBins = winSize / 2 + 1;
  std::vector<BinRange> out;
  for (size_t i = 0; i < bands.size(); ++i) {
    BinRange r = binsFor(bands[i], sampleRate, winSize);
    // each band of a contiguous split owns at least one bin, the bands stay disjoint
    if (i > 0 && bands[i].lowHz == bands[i-1].highHz) {
      r.first = std::max(r.first, out.back().last);
      r.last = std::min(nBins, std::max(r.last, r.first + 1));
    } else if (r.last == r.first && r.first < nBins) {
      r.last = r.first + 1;
    }
    out.push_back(r);
  }
  return out;
}

static void processFrames(FftWorker& w, const Samples& s, const AnalysisParams& p,
                          const std::vector<BinRange>& ranges, size_t from, size_t to,
                          SpectralAnalysis& out) {
  const long len = (long)s.data.size();
  const long half = (long)p.winSize / 2;
  for (size_t k = from; k < to; ++k) {
    long start = (long)(k * p.hopSize) - half;
    for (unsigned i = 0; i < p.winSize; ++i) {
      long idx = start + (long)i;
      w.in->data[i] = (idx >= 0 && idx < len) ? s.data[idx] : 0.f;
    }
    fvec_weight(w.in, w.window);
    aubio_fft_do(w.fft, w.in, w.spec);

    double total = 0.0;
    for (uint_t b = 0; b < w.spec->length; ++b) {
      double m = w.spec->norm[b];
      total += m * m;
    }
    out.energy[k] = (float)total;
    for (size_t bi = 0; bi < ranges.size(); ++bi) {
      double e = 0.0;
      for (size_t b = ranges[bi].first; b < ranges[bi].last; ++b) {
        double m = w.spec->norm[b];
        e += m * m;
      }
      out.bandEnergy[bi][k] = (float)e;
    }
  }
}

SpectralAnalysis analyzeSpectrum(const Samples& samples, const AnalysisParams& params,
                                 const std::vector<FrequencyBand>& bands) {
  if (samples.data.empty() || samples.sampleRate == 0) {
    throw CharterError(ErrorKind::EmptySignal, "nothing to analyze");
  }
  if (params.hopSize == 0 || params.hopSize >= params.winSize) {
    throw CharterError(ErrorKind::InvalidConfig, "hop size must be in (0, window size)");
  }

  SpectralAnalysis out;
  out.sampleRate = samples.sampleRate;
  out.winSize = params.winSize;
  out.hopSize = params.hopSize;
  out.signalDuration = samples.duration();
  out.bands = bands;

  const size_t frames = (samples.data.size() - 1) / params.hopSize + 1;
  out.times.resize(frames);
  for (size_t k = 0; k < frames; ++k)
    out.times[k] = (double)(k * params.hopSize) / samples.sampleRate;
  out.energy.assign(frames, 0.f);
  out.bandEnergy.assign(bands.size(), std::vector<float>(frames, 0.f));

  const std::vector<BinRange> ranges = bandBins(bands, samples.sampleRate, params.winSize);

  size_t nThreads = std::clamp<size_t>(params.threads, 1, frames);
  std::vector<std::unique_ptr<FftWorker>> workers;
  for (size_t t = 0; t < nThreads; ++t)
    workers.push_back(std::make_unique<FftWorker>(params.winSize));

  if (nThreads == 1) {
    processFrames(*workers[0], samples, params, ranges, 0, frames, out);
  } else {
    // each thread owns a contiguous slice of frame indices
    std::vector<std::thread> pool;
    JoinThreads joiner{pool};
    size_t chunk = (frames + nThreads - 1) / nThreads;
    for (size_t t = 0; t < nThreads; ++t) {
      size_t from = t * chunk;
      size_t to = std::min(frames, from + chunk);
      if (from >= to) break;
      FftWorker* w = workers[t].get();
      pool.emplace_back([&, w, from, to]{
        processFrames(*w, samples, params, ranges, from, to, out);
      });
    }
  }

  out.smoothed = smoothEnvelope(out.energy, params.smoothWidth);
  return out;
}

size_t SpectralAnalysis::frameAt(double t) const {
  if (times.empty() || t <= 0.0) return 0;
  size_t k = (size_t)std::llround(t * sampleRate / hopSize);
  return std::min(k, times.size() - 1);
}

std::vector<float> smoothEnvelope(const std::vector<float>& values, unsigned width) {
  if (values.empty() || width <= 1) return values;
  const size_t half = width / 2;
  std::vector<float> out(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    size_t from = i >= half ? i - half : 0;
    size_t to = std::min(values.size(), i + half + 1);
    double sum = 0.0;
    for (size_t j = from; j < to; ++j) sum += values[j];
    // frames past either end count as silence, like the zero-padded frames
    out[i] = (float)(sum / width);
  }
  return out;
}

std::optional<FrequencyBand> bandForInstrument(const std::string& instrument) {
  std::string name = instrument;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  if (name == "vocals") return FrequencyBand{200.f, 4000.f};
  if (name == "bass")   return FrequencyBand{40.f, 250.f};
  if (name == "drums")  return FrequencyBand{30.f, 5000.f};
  if (name == "lead")   return FrequencyBand{400.f, 8000.f};
  return std::nullopt;
}

std::vector<FrequencyBand> laneBands(const FrequencyBand& range, int lanes, unsigned sampleRate) {
  if (lanes <= 0) {
    throw CharterError(ErrorKind::InvalidLaneCount,
                       "lane count must be positive, got " + std::to_string(lanes));
  }
  const double nyquist = sampleRate / 2.0;
  double lo = std::max(1.0, (double)range.lowHz);
  double hi = std::min(nyquist, (double)range.highHz);
  if (hi <= lo) { lo = 1.0; hi = std::max(2.0, nyquist); }

  std::vector<FrequencyBand> out;
  const double ratio = hi / lo;
  for (int i = 0; i < lanes; ++i) {
    double a = lo * std::pow(ratio, (double)i / lanes);
    double b = lo * std::pow(ratio, (double)(i + 1) / lanes);
    out.push_back(FrequencyBand{(float)a, (float)b});
  }
  return out;
}
