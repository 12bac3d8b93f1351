#pragma once
/********************************************************************************
 *                               Cadence Project                                *
 *                         Lossless Source Verification                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <array>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/types.hpp>
#include <libcadence/ffmpeg/stream/interface.hpp>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

namespace libcadence::ffmpeg
{

inline constexpr std::array<BitDepth, 2>   SupportedBitDepths  = {16, 24};
inline constexpr std::array<SampleRate, 6> SupportedSampleRates = {44100, 48000,  88200,
                                                                   96000, 176400, 192000};
inline constexpr ChannelCount              MaxChannels          = 2;

// What a full decode pass found out about one audio stream
struct StreamReport
{
  BitDepth     bit_depth        = 0;
  SampleRate   sample_rate      = 0;
  ChannelCount channels         = 0;
  SampleCount  decoded_samples  = 0;
  SampleCount  expected_samples = 0; // 0 when the container does not declare a duration
  int          decode_errors    = 0;
};

/**
 * @class StreamVerifier
 * @brief Decodes every packet of a file with CRC checking enabled.
 *
 * Unsupported bit depth, sample rate or channel count, decode errors and a
 * stream shorter than the container declares are reported as rules.
 *
 * Failing to open the container, probe it, find an audio stream or open its
 * decoder throws libcadence::Error (Decode).
 */
class CADENCE_API StreamVerifier : public IStreamVerifier
{
public:
  auto check(const fs::path& file) -> rules::Rules override;

  // Full decode pass without judging the result
  static auto analyze(const fs::path& file) -> StreamReport;

  static auto evaluate(const StreamReport& report, const AbsPath& path) -> rules::Rules;

private:
  struct DecodeSession
  {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext*  codec_ctx  = nullptr;
    AVPacket*        packet     = nullptr;
    AVFrame*         frame      = nullptr;

    DecodeSession() = default;
    ~DecodeSession();

    DecodeSession(const DecodeSession&)                    = delete;
    auto operator=(const DecodeSession&) -> DecodeSession& = delete;
  };

  static void open_input(const fs::path& file, DecodeSession& session);
  static auto find_audio_stream(const fs::path& file, AVFormatContext* ctx) -> AudioStreamIdx;
  static void setup_codec(const fs::path& file, AVCodecParameters* codec_params,
                          DecodeSession& session);
  static void process_packets(DecodeSession& session, AudioStreamIdx stream_idx,
                              StreamReport& report);
  static void drain_frames(DecodeSession& session, StreamReport& report);
};

} // namespace libcadence::ffmpeg
