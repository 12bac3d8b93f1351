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

#include <algorithm>
#include <libcadence/common/error.hpp>
#include <libcadence/ffmpeg/stream/entry.hpp>
#include <libcadence/log-macros.hpp>

using Stream = libcadence::log::STREAM;

namespace libcadence::ffmpeg
{

namespace
{

auto av_error_string(int err) -> std::string
{
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

} // namespace

StreamVerifier::DecodeSession::~DecodeSession()
{
  if (frame)
    av_frame_free(&frame);
  if (packet)
    av_packet_free(&packet);
  if (codec_ctx)
    avcodec_free_context(&codec_ctx);
  if (format_ctx)
    avformat_close_input(&format_ctx);
}

void StreamVerifier::open_input(const fs::path& file, DecodeSession& session)
{
  int ret = avformat_open_input(&session.format_ctx, file.c_str(), nullptr, nullptr);
  if (ret < 0)
    throw Error(ErrorKind::Decode,
                std::format("Unable to open {}: {}", file.string(), av_error_string(ret)));

  ret = avformat_find_stream_info(session.format_ctx, nullptr);
  if (ret < 0)
    throw Error(ErrorKind::Decode, std::format("Unable to find stream info of {}: {}",
                                               file.string(), av_error_string(ret)));
}

auto StreamVerifier::find_audio_stream(const fs::path& file, AVFormatContext* ctx)
  -> AudioStreamIdx
{
  for (AudioStreamIdxIter i = 0; i < ctx->nb_streams; i++)
  {
    if (ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO)
      return static_cast<AudioStreamIdx>(i);
  }
  throw Error(ErrorKind::Decode, std::format("No audio stream in {}", file.string()));
}

void StreamVerifier::setup_codec(const fs::path& file, AVCodecParameters* codec_params,
                                 DecodeSession& session)
{
  const AVCodec* codec = avcodec_find_decoder(codec_params->codec_id);
  if (!codec)
    throw Error(ErrorKind::Decode, std::format("No decoder for codec {} in {}",
                                               avcodec_get_name(codec_params->codec_id),
                                               file.string()));

  session.codec_ctx = avcodec_alloc_context3(codec);
  if (!session.codec_ctx)
    throw Error(ErrorKind::Decode, "Unable to allocate a decoder context");

  int ret = avcodec_parameters_to_context(session.codec_ctx, codec_params);
  if (ret < 0)
    throw Error(ErrorKind::Decode, std::format("Unable to configure decoder for {}: {}",
                                               file.string(), av_error_string(ret)));

  // Every frame CRC is checked and a mismatch surfaces as an error instead of being concealed
  session.codec_ctx->err_recognition = AV_EF_CRCCHECK | AV_EF_BITSTREAM | AV_EF_EXPLODE;

  ret = avcodec_open2(session.codec_ctx, codec, nullptr);
  if (ret < 0)
    throw Error(ErrorKind::Decode, std::format("Unable to open decoder for {}: {}",
                                               file.string(), av_error_string(ret)));
}

void StreamVerifier::drain_frames(DecodeSession& session, StreamReport& report)
{
  int ret = 0;
  while ((ret = avcodec_receive_frame(session.codec_ctx, session.frame)) == 0)
  {
    if (session.frame->decode_error_flags != 0 || (session.frame->flags & AV_FRAME_FLAG_CORRUPT))
      ++report.decode_errors;
    report.decoded_samples += session.frame->nb_samples;
    av_frame_unref(session.frame);
  }

  if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF)
  {
    log::TRACE<Stream>("Error receiving frame: {}", av_error_string(ret));
    ++report.decode_errors;
  }
}

void StreamVerifier::process_packets(DecodeSession& session, AudioStreamIdx stream_idx,
                                     StreamReport& report)
{
  session.packet = av_packet_alloc();
  session.frame  = av_frame_alloc();
  if (!session.packet || !session.frame)
    throw Error(ErrorKind::Decode, "Failed to allocate packet or frame");

  int ret = 0;
  while ((ret = av_read_frame(session.format_ctx, session.packet)) >= 0)
  {
    if (session.packet->stream_index != stream_idx)
    {
      av_packet_unref(session.packet);
      continue;
    }

    ret = avcodec_send_packet(session.codec_ctx, session.packet);
    if (ret == AVERROR(EAGAIN))
    {
      // decoder output is full: take its frames, then the same packet goes in again
      drain_frames(session, report);
      ret = avcodec_send_packet(session.codec_ctx, session.packet);
    }
    av_packet_unref(session.packet);
    if (ret < 0)
    {
      log::TRACE<Stream>("Error sending packet: {}", av_error_string(ret));
      ++report.decode_errors;
      continue;
    }

    drain_frames(session, report);
  }

  if (ret != AVERROR_EOF)
  {
    log::TRACE<Stream>("Error reading packet: {}", av_error_string(ret));
    ++report.decode_errors;
  }

  // flush
  ret = avcodec_send_packet(session.codec_ctx, nullptr);
  if (ret < 0)
  {
    log::TRACE<Stream>("Error flushing decoder: {}", av_error_string(ret));
    ++report.decode_errors;
    return;
  }
  drain_frames(session, report);
}

auto StreamVerifier::analyze(const fs::path& file) -> StreamReport
{
  DecodeSession session;
  open_input(file, session);

  const auto audio_stream_idx = find_audio_stream(file, session.format_ctx);
  AVStream*  stream           = session.format_ctx->streams[audio_stream_idx];

  setup_codec(file, stream->codecpar, session);

  // the decoder has parsed the stream header by now
  StreamReport report;
  report.sample_rate = session.codec_ctx->sample_rate;
  report.channels    = session.codec_ctx->ch_layout.nb_channels;
  report.bit_depth   = session.codec_ctx->bits_per_raw_sample;
  if (report.bit_depth == 0)
    report.bit_depth = stream->codecpar->bits_per_raw_sample;
  if (report.bit_depth == 0)
    report.bit_depth = av_get_bytes_per_sample(session.codec_ctx->sample_fmt) * 8;

  if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0 && report.sample_rate > 0)
    report.expected_samples =
      av_rescale_q(stream->duration, stream->time_base, AVRational{1, report.sample_rate});

  process_packets(session, audio_stream_idx, report);

  log::DBG<Stream>("{}: {} bit, {} Hz, {} channel(s), {}/{} samples, {} decode error(s)",
                   file.filename().string(), report.bit_depth, report.sample_rate,
                   report.channels, report.decoded_samples, report.expected_samples,
                   report.decode_errors);
  return report;
}

auto StreamVerifier::evaluate(const StreamReport& report, const AbsPath& path) -> rules::Rules
{
  rules::Rules found;

  if (std::ranges::find(SupportedBitDepths, report.bit_depth) == SupportedBitDepths.end())
    found.emplace_back(rules::UnsupportedBitDepth{path, report.bit_depth});

  if (std::ranges::find(SupportedSampleRates, report.sample_rate) == SupportedSampleRates.end())
    found.emplace_back(rules::UnsupportedSampleRate{path, report.sample_rate});

  if (report.channels > MaxChannels)
    found.emplace_back(rules::UnsupportedChannelCount{path, report.channels});

  if (report.decode_errors > 0)
    found.emplace_back(rules::CorruptStream{path, report.decode_errors});

  if (report.expected_samples > 0 && report.decoded_samples < report.expected_samples)
    found.emplace_back(
      rules::TruncatedStream{path, report.decoded_samples, report.expected_samples});

  return found;
}

auto StreamVerifier::check(const fs::path& file) -> rules::Rules
{
  return evaluate(analyze(file), file.string());
}

} // namespace libcadence::ffmpeg
