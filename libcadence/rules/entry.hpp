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

#include <compare>
#include <format>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/types.hpp>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

/*
 * Verification findings.
 *
 * A Rule is one soft finding about a source. The set of findings is closed:
 * a new kind of finding is a new alternative of the Rule variant, and every
 * std::visit over Rule (rendering, categorisation) fails to compile until it
 * handles the new alternative.
 */

namespace libcadence::rules
{

//[ Policy ]//
struct SceneNotSupported
{
  auto operator<=>(const SceneNotSupported&) const = default;
};

struct LossyMasterNeedsApproval
{
  auto operator<=>(const LossyMasterNeedsApproval&) const = default;
};

struct LossyWebNeedsApproval
{
  auto operator<=>(const LossyWebNeedsApproval&) const = default;
};

struct NoTranscodeFormats
{
  auto operator<=>(const NoTranscodeFormats&) const = default;
};

//[ Filesystem ]//
struct SourceDirectoryNotFound
{
  Directory path;
  auto      operator<=>(const SourceDirectoryNotFound&) const = default;
};

struct NoFlacFiles
{
  Directory path;
  auto      operator<=>(const NoFlacFiles&) const = default;
};

struct PathTooLong
{
  SubPath path;
  auto    operator<=>(const PathTooLong&) const = default;
};

//[ Tags ]//
struct MissingArtistTag
{
  AbsPath path;
  auto    operator<=>(const MissingArtistTag&) const = default;
};

struct MissingAlbumTag
{
  AbsPath path;
  auto    operator<=>(const MissingAlbumTag&) const = default;
};

struct MissingTitleTag
{
  AbsPath path;
  auto    operator<=>(const MissingTitleTag&) const = default;
};

struct MissingTrackNumberTag
{
  AbsPath path;
  auto    operator<=>(const MissingTrackNumberTag&) const = default;
};

struct InvalidTrackNumberTag
{
  AbsPath     path;
  std::string value;
  auto        operator<=>(const InvalidTrackNumberTag&) const = default;
};

//[ Stream ]//
struct UnsupportedBitDepth
{
  AbsPath  path;
  BitDepth bit_depth;
  auto     operator<=>(const UnsupportedBitDepth&) const = default;
};

struct UnsupportedSampleRate
{
  AbsPath    path;
  SampleRate sample_rate;
  auto       operator<=>(const UnsupportedSampleRate&) const = default;
};

struct UnsupportedChannelCount
{
  AbsPath      path;
  ChannelCount channels;
  auto         operator<=>(const UnsupportedChannelCount&) const = default;
};

struct CorruptStream
{
  AbsPath path;
  int     decode_errors;
  auto    operator<=>(const CorruptStream&) const = default;
};

struct TruncatedStream
{
  AbsPath     path;
  SampleCount decoded;
  SampleCount expected;
  auto        operator<=>(const TruncatedStream&) const = default;
};

//[ Hash ]//
struct IncorrectHash
{
  Directory   directory;
  std::string summary;
  auto        operator<=>(const IncorrectHash&) const = default;
};

using Rule = std::variant<SceneNotSupported, LossyMasterNeedsApproval, LossyWebNeedsApproval,
                          NoTranscodeFormats, SourceDirectoryNotFound, NoFlacFiles, PathTooLong,
                          MissingArtistTag, MissingAlbumTag, MissingTitleTag,
                          MissingTrackNumberTag, InvalidTrackNumberTag, UnsupportedBitDepth,
                          UnsupportedSampleRate, UnsupportedChannelCount, CorruptStream,
                          TruncatedStream, IncorrectHash>;

// Detection-ordered sequence of findings
using Rules = std::vector<Rule>;

enum class Category
{
  Policy,
  Filesystem,
  Tag,
  Stream,
  Hash
};

CADENCE_API auto category(const Rule& rule) -> Category;
CADENCE_API auto to_string(const Rule& rule) -> std::string;
CADENCE_API auto to_string(Category category) -> std::string;

template <typename T> auto is(const Rule& rule) -> bool { return std::holds_alternative<T>(rule); }

template <typename T> auto count(const Rules& rules) -> std::size_t
{
  std::size_t n = 0;
  for (const auto& rule : rules)
    if (is<T>(rule))
      ++n;
  return n;
}

template <typename T> auto contains(const Rules& rules) -> bool { return count<T>(rules) > 0; }

inline auto operator<<(std::ostream& os, const Rule& rule) -> std::ostream&
{
  return os << to_string(rule);
}

} // namespace libcadence::rules

template <> struct std::formatter<libcadence::rules::Rule> : std::formatter<std::string>
{
  auto format(const libcadence::rules::Rule& rule, std::format_context& ctx) const
  {
    return std::formatter<std::string>::format(libcadence::rules::to_string(rule), ctx);
  }
};
