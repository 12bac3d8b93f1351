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

#include <filesystem>
#include <format>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/types.hpp>
#include <libcadence/formats/entry.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace libcadence::source
{

enum class Media
{
  CD,
  WEB,
  Vinyl,
  DVD,
  BluRay,
  SACD,
  DAT,
  Cassette,
  Soundboard,
  Unknown
};

CADENCE_API auto parse_media(std::string_view value) -> std::optional<Media>;
CADENCE_API auto to_string(Media media) -> std::string;

// What the tracker knows about the torrent the source was downloaded from
struct TorrentInfo
{
  TorrentID           id = 0;
  bool                scene = false;
  std::optional<bool> lossy_master_approved;
  std::optional<bool> lossy_web_approved;
  std::string         remaster_title;
};

// Release level expectations every track is checked against
struct ReleaseMetadata
{
  std::string        artist;
  std::string        album;
  std::optional<int> year;
  Media              media = Media::Unknown;
};

/**
 * @struct Source
 * @brief One lossless release under evaluation.
 *
 * Owned by the caller for the duration of a verification run. The verifier
 * only ever reads it.
 */
struct Source
{
  fs::path                 directory;
  formats::SourceFormat    format = formats::SourceFormat::Flac;
  formats::ExistingFormats existing;
  TorrentInfo              torrent;
  ReleaseMetadata          metadata;
};

// "Artist - Album [2020] [WEB FLAC]"
CADENCE_API auto to_string(const Source& source) -> std::string;

/**
 * @class SourceLoader
 * @brief Builds a Source from a TOML source manifest.
 *
 * A relative `source.directory` is resolved against the manifest's own
 * directory. Throws libcadence::Error (Config) on missing keys or unknown
 * values, (Io) when the manifest cannot be read.
 */
class CADENCE_API SourceLoader
{
public:
  static auto from_file(const fs::path& manifest) -> Source;
  static auto from_string(const std::string& content, const fs::path& base_dir) -> Source;
};

} // namespace libcadence::source

template <> struct std::formatter<libcadence::source::Source> : std::formatter<std::string>
{
  auto format(const libcadence::source::Source& source, std::format_context& ctx) const
  {
    return std::formatter<std::string>::format(libcadence::source::to_string(source), ctx);
  }
};
