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

#include <libcadence/common/macros.hpp>
#include <libcadence/rules/entry.hpp>

namespace libcadence::rules
{

namespace
{

template <class... Ts> struct overloaded : Ts...
{
  using Ts::operator()...;
};

} // namespace

auto category(const Rule& rule) -> Category
{
  return std::visit(
    overloaded{
      [](const SceneNotSupported&) { return Category::Policy; },
      [](const LossyMasterNeedsApproval&) { return Category::Policy; },
      [](const LossyWebNeedsApproval&) { return Category::Policy; },
      [](const NoTranscodeFormats&) { return Category::Policy; },
      [](const SourceDirectoryNotFound&) { return Category::Filesystem; },
      [](const NoFlacFiles&) { return Category::Filesystem; },
      [](const PathTooLong&) { return Category::Filesystem; },
      [](const MissingArtistTag&) { return Category::Tag; },
      [](const MissingAlbumTag&) { return Category::Tag; },
      [](const MissingTitleTag&) { return Category::Tag; },
      [](const MissingTrackNumberTag&) { return Category::Tag; },
      [](const InvalidTrackNumberTag&) { return Category::Tag; },
      [](const UnsupportedBitDepth&) { return Category::Stream; },
      [](const UnsupportedSampleRate&) { return Category::Stream; },
      [](const UnsupportedChannelCount&) { return Category::Stream; },
      [](const CorruptStream&) { return Category::Stream; },
      [](const TruncatedStream&) { return Category::Stream; },
      [](const IncorrectHash&) { return Category::Hash; },
    },
    rule);
}

auto to_string(const Rule& rule) -> std::string
{
  return std::visit(
    overloaded{
      [](const SceneNotSupported&) -> std::string { return "Scene releases are not supported"; },
      [](const LossyMasterNeedsApproval&) -> std::string
      { return "Lossy master releases need approval"; },
      [](const LossyWebNeedsApproval&) -> std::string
      { return "Lossy web releases need approval"; },
      [](const NoTranscodeFormats&) -> std::string
      { return "No transcode formats are available for this source"; },
      [](const SourceDirectoryNotFound& r) -> std::string
      { return std::format("Source directory not found: {}", r.path); },
      [](const NoFlacFiles& r) -> std::string
      { return std::format("No FLAC files found in source directory: {}", r.path); },
      [](const PathTooLong& r) -> std::string
      {
        return std::format("Path is {} bytes, exceeding the {} limit: {}", r.path.size(),
                           static_cast<int>(MAX_PATH_LENGTH), r.path);
      },
      [](const MissingArtistTag& r) -> std::string
      { return std::format("Missing artist tag: {}", r.path); },
      [](const MissingAlbumTag& r) -> std::string
      { return std::format("Missing album tag: {}", r.path); },
      [](const MissingTitleTag& r) -> std::string
      { return std::format("Missing title tag: {}", r.path); },
      [](const MissingTrackNumberTag& r) -> std::string
      { return std::format("Missing track number tag: {}", r.path); },
      [](const InvalidTrackNumberTag& r) -> std::string
      { return std::format("Invalid track number tag `{}`: {}", r.value, r.path); },
      [](const UnsupportedBitDepth& r) -> std::string
      { return std::format("Unsupported bit depth {}: {}", r.bit_depth, r.path); },
      [](const UnsupportedSampleRate& r) -> std::string
      { return std::format("Unsupported sample rate {} Hz: {}", r.sample_rate, r.path); },
      [](const UnsupportedChannelCount& r) -> std::string
      { return std::format("Unsupported channel count {}: {}", r.channels, r.path); },
      [](const CorruptStream& r) -> std::string
      { return std::format("Stream has {} decode error(s): {}", r.decode_errors, r.path); },
      [](const TruncatedStream& r) -> std::string
      {
        return std::format("Stream is truncated, decoded {} of {} samples: {}", r.decoded,
                           r.expected, r.path);
      },
      [](const IncorrectHash& r) -> std::string
      { return std::format("Hash check failed for {}: {}", r.directory, r.summary); },
    },
    rule);
}

auto to_string(Category category) -> std::string
{
  switch (category)
  {
    case Category::Policy:
      return "policy";
    case Category::Filesystem:
      return "filesystem";
    case Category::Tag:
      return "tag";
    case Category::Stream:
      return "stream";
    case Category::Hash:
      return "hash";
  }
  return "unknown";
}

} // namespace libcadence::rules
