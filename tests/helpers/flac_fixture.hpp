#pragma once

#include <FLAC++/encoder.h>
#include <FLAC++/metadata.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cadence::test
{

struct FlacParams
{
  unsigned                                         channels    = 2;
  unsigned                                         bit_depth   = 16;
  unsigned                                         sample_rate = 44100;
  unsigned                                         samples     = 22050; // per channel
  std::vector<std::pair<std::string, std::string>> tags        = {
    {"ARTIST", "Artist"}, {"ALBUM", "Album"}, {"TITLE", "Title"}, {"TRACKNUMBER", "1"}};
};

/**
 * Encodes low level noise with libFLAC++. Noise keeps the encoder from
 * collapsing frames into constant subframes, so corruption always lands in
 * real residual data.
 */
inline void write_flac(const std::filesystem::path& file, const FlacParams& params = {})
{
  FLAC::Encoder::File encoder;
  encoder.set_verify(false);
  encoder.set_compression_level(5);
  encoder.set_channels(params.channels);
  encoder.set_bits_per_sample(params.bit_depth);
  encoder.set_sample_rate(params.sample_rate);
  encoder.set_total_samples_estimate(params.samples);

  FLAC::Metadata::VorbisComment comments;
  for (const auto& [key, value] : params.tags)
  {
    FLAC::Metadata::VorbisComment::Entry entry(key.c_str(), value.c_str());
    if (!entry.is_valid() || !comments.append_comment(entry))
      throw std::runtime_error("invalid Vorbis comment in fixture: " + key);
  }

  FLAC::Metadata::Prototype* blocks[] = {&comments};
  if (!params.tags.empty() && !encoder.set_metadata(blocks, 1))
    throw std::runtime_error("unable to attach fixture metadata");

  if (encoder.init(file.string()) != FLAC__STREAM_ENCODER_INIT_STATUS_OK)
    throw std::runtime_error("unable to initialise FLAC encoder for " + file.string());

  const FLAC__int32 amplitude = 1 << (params.bit_depth - 4);
  std::uint32_t     state     = 0x12345678u;

  constexpr unsigned       Block = 1024;
  std::vector<FLAC__int32> buffer(static_cast<std::size_t>(Block) * params.channels);

  for (unsigned done = 0; done < params.samples;)
  {
    const unsigned count = std::min(Block, params.samples - done);
    for (std::size_t i = 0; i < static_cast<std::size_t>(count) * params.channels; ++i)
    {
      state     = state * 1664525u + 1013904223u;
      buffer[i] = static_cast<FLAC__int32>(state >> 8) % amplitude;
    }
    if (!encoder.process_interleaved(buffer.data(), count))
      throw std::runtime_error("FLAC encoding failed for " + file.string());
    done += count;
  }

  if (!encoder.finish())
    throw std::runtime_error("unable to finish FLAC stream " + file.string());
}

} // namespace cadence::test
