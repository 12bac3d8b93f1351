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
#include <cctype>
#include <libcadence/common/error.hpp>
#include <libcadence/log-macros.hpp>
#include <libcadence/source/entry.hpp>
#include <toml++/toml.hpp>

using Src = libcadence::log::SOURCE;

namespace ManifestKeys
{
namespace SourceTable
{
inline constexpr auto Root      = "source";
inline constexpr auto Directory = "directory";
inline constexpr auto Format    = "format";
inline constexpr auto Existing  = "existing";
} // namespace SourceTable

namespace TorrentTable
{
inline constexpr auto Root                = "torrent";
inline constexpr auto Id                  = "id";
inline constexpr auto Scene               = "scene";
inline constexpr auto LossyMasterApproved = "lossy_master_approved";
inline constexpr auto LossyWebApproved    = "lossy_web_approved";
inline constexpr auto RemasterTitle       = "remaster_title";
} // namespace TorrentTable

namespace MetadataTable
{
inline constexpr auto Root   = "metadata";
inline constexpr auto Artist = "artist";
inline constexpr auto Album  = "album";
inline constexpr auto Year   = "year";
inline constexpr auto Media  = "media";
} // namespace MetadataTable
} // namespace ManifestKeys

namespace libcadence::source
{

namespace
{

auto lowercase(std::string_view value) -> std::string
{
  std::string out(value);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

auto require_string(const toml::table& manifest, const char* table, const char* key)
  -> std::string
{
  auto value = manifest[table][key].value<std::string>();
  if (!value)
    throw Error(ErrorKind::Config, std::format("Source manifest is missing `{}.{}`", table, key));
  return *value;
}

auto parse_manifest(const toml::table& manifest, const fs::path& base_dir) -> Source
{
  using namespace ManifestKeys;

  Source result;

  fs::path directory = require_string(manifest, SourceTable::Root, SourceTable::Directory);
  result.directory   = directory.is_relative() ? base_dir / directory : directory;

  const auto format_str = require_string(manifest, SourceTable::Root, SourceTable::Format);
  const auto format     = formats::parse_source_format(format_str);
  if (!format)
    throw Error(ErrorKind::Config, std::format("Unknown source format `{}`", format_str));
  result.format = *format;

  if (auto existing = manifest[SourceTable::Root][SourceTable::Existing].as_array())
  {
    for (const auto& node : *existing)
    {
      auto name = node.value<std::string>();
      if (!name)
        throw Error(ErrorKind::Config, "`source.existing` must be an array of strings");
      auto target = formats::parse_target_format(*name);
      if (!target)
        throw Error(ErrorKind::Config, std::format("Unknown existing format `{}`", *name));
      result.existing.insert(*target);
    }
  }

  auto id = manifest[TorrentTable::Root][TorrentTable::Id].value<int64_t>();
  if (!id)
    throw Error(ErrorKind::Config, "Source manifest is missing `torrent.id`");
  result.torrent.id    = *id;
  result.torrent.scene = manifest[TorrentTable::Root][TorrentTable::Scene].value_or(false);
  result.torrent.lossy_master_approved =
    manifest[TorrentTable::Root][TorrentTable::LossyMasterApproved].value<bool>();
  result.torrent.lossy_web_approved =
    manifest[TorrentTable::Root][TorrentTable::LossyWebApproved].value<bool>();
  result.torrent.remaster_title =
    manifest[TorrentTable::Root][TorrentTable::RemasterTitle].value_or(std::string{});

  result.metadata.artist = require_string(manifest, MetadataTable::Root, MetadataTable::Artist);
  result.metadata.album  = require_string(manifest, MetadataTable::Root, MetadataTable::Album);
  if (auto year = manifest[MetadataTable::Root][MetadataTable::Year].value<int64_t>())
    result.metadata.year = static_cast<int>(*year);

  const auto media_str =
    manifest[MetadataTable::Root][MetadataTable::Media].value_or(std::string{});
  if (!media_str.empty())
  {
    auto media = parse_media(media_str);
    if (!media)
      throw Error(ErrorKind::Config, std::format("Unknown media `{}`", media_str));
    result.metadata.media = *media;
  }

  return result;
}

} // namespace

auto parse_media(std::string_view value) -> std::optional<Media>
{
  const auto v = lowercase(value);
  if (v == "cd")
    return Media::CD;
  if (v == "web")
    return Media::WEB;
  if (v == "vinyl")
    return Media::Vinyl;
  if (v == "dvd")
    return Media::DVD;
  if (v == "blu-ray" || v == "bluray")
    return Media::BluRay;
  if (v == "sacd")
    return Media::SACD;
  if (v == "dat")
    return Media::DAT;
  if (v == "cassette")
    return Media::Cassette;
  if (v == "soundboard")
    return Media::Soundboard;
  return std::nullopt;
}

auto to_string(Media media) -> std::string
{
  switch (media)
  {
    case Media::CD:
      return "CD";
    case Media::WEB:
      return "WEB";
    case Media::Vinyl:
      return "Vinyl";
    case Media::DVD:
      return "DVD";
    case Media::BluRay:
      return "Blu-Ray";
    case Media::SACD:
      return "SACD";
    case Media::DAT:
      return "DAT";
    case Media::Cassette:
      return "Cassette";
    case Media::Soundboard:
      return "Soundboard";
    case Media::Unknown:
      break;
  }
  return "Unknown";
}

auto to_string(const Source& source) -> std::string
{
  std::string name = std::format("{} - {}", source.metadata.artist, source.metadata.album);
  if (source.metadata.year)
    name += std::format(" [{}]", *source.metadata.year);
  name += std::format(" [{} {}]", to_string(source.metadata.media),
                      formats::to_string(source.format));
  return name;
}

auto SourceLoader::from_file(const fs::path& manifest) -> Source
{
  std::error_code ec;
  if (!fs::is_regular_file(manifest, ec))
    throw Error(ErrorKind::Io, std::format("Source manifest not found: {}", manifest.string()));

  try
  {
    auto table = toml::parse_file(manifest.string());
    auto base  = fs::absolute(manifest, ec).parent_path();
    auto src   = parse_manifest(table, base);
    log::DBG<Src>("Loaded source manifest '{}' -> {}", manifest.string(), src);
    return src;
  }
  catch (const toml::parse_error& e)
  {
    throw Error(ErrorKind::Config,
                std::format("Invalid source manifest {} (line {}): {}", manifest.string(),
                            e.source().begin.line, std::string(e.description())));
  }
}

auto SourceLoader::from_string(const std::string& content, const fs::path& base_dir) -> Source
{
  try
  {
    auto table = toml::parse(content);
    return parse_manifest(table, base_dir);
  }
  catch (const toml::parse_error& e)
  {
    throw Error(ErrorKind::Config, std::format("Invalid source manifest (line {}): {}",
                                               e.source().begin.line,
                                               std::string(e.description())));
  }
}

} // namespace libcadence::source
