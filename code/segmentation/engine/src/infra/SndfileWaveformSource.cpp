// SndfileWaveformSource decodes audio files through libsndfile.

#include "SndfileWaveformSource.hpp"

#include "debug/log.hpp"
#include <cmath>
#include <filesystem>
#include <memory>
#include <sndfile.h>
#include <vector>

namespace gate {

namespace {
struct SndfileCloser {
  void operator()(SNDFILE *f) const {
    if (f)
      sf_close(f);
  }
};
using SfFilePtr = std::unique_ptr<SNDFILE, SndfileCloser>;
} // namespace

bool SndfileWaveformSource::exists(const std::string &path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

Waveform SndfileWaveformSource::load(const std::string &path) const {
  if (!exists(path))
    throw SourceError("audio file does not exist: " + path);

  SF_INFO info{};
  SfFilePtr file(sf_open(path.c_str(), SFM_READ, &info));
  if (!file)
    throw SourceError("cannot open '" + path + "': " + sf_strerror(nullptr));
  if (info.channels <= 0 || info.samplerate <= 0)
    throw SourceError("'" + path + "' has no audio channels");

  const std::size_t channels = static_cast<std::size_t>(info.channels);
  Waveform w;
  w.source = path;
  w.sample_rate = info.samplerate;
  if (info.frames > 0)
    w.samples.reserve(static_cast<std::size_t>(info.frames));

  std::vector<float> block(block_frames_ * channels);
  for (;;) {
    const sf_count_t got = sf_readf_float(
        file.get(), block.data(), static_cast<sf_count_t>(block_frames_));
    if (got < 0)
      throw SourceError("read error in '" + path +
                        "': " + sf_strerror(file.get()));
    if (got == 0)
      break;
    for (sf_count_t f = 0; f < got; ++f) {
      const float *frame = block.data() + static_cast<std::size_t>(f) * channels;
      if (channels == 1) {
        w.samples.push_back(frame[0]);
        continue;
      }
      double sum2 = 0.0;
      for (std::size_t c = 0; c < channels; ++c)
        sum2 += static_cast<double>(frame[c]) * frame[c];
      w.samples.push_back(static_cast<float>(std::sqrt(sum2 / channels)));
    }
  }

  const int err = sf_error(file.get());
  if (err != SF_ERR_NO_ERROR)
    throw SourceError("decode error in '" + path + "': " + sf_error_number(err));

  w.duration_ms = duration_ms_for(w.samples.size(), w.sample_rate);
  log::debug("sndfile", path + ": " + std::to_string(w.samples.size()) +
                            " frames @ " + std::to_string(w.sample_rate) +
                            " Hz, " + std::to_string(info.channels) + " ch");
  return w;
}

} // namespace gate
