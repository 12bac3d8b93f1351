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

#include <FLAC++/metadata.h>
#include <algorithm>
#include <cctype>
#include <libcadence/common/error.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/flac/tags.hpp>
#include <libcadence/log-macros.hpp>
#include <memory>

using Tags = libcadence::log::TAGS;

namespace libcadence::flac
{

namespace
{

auto uppercase(std::string value) -> std::string
{
  std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::toupper(c); });
  return value;
}

auto is_blank(std::string_view value) -> bool
{
  return std::ranges::all_of(value, [](unsigned char c) { return std::isspace(c); });
}

auto all_digits(std::string_view value) -> bool
{
  return !value.empty() &&
         std::ranges::all_of(value, [](unsigned char c) { return std::isdigit(c); });
}

// First non blank value of a field
auto find_tag(const VorbisComments& comments, std::string_view key) -> std::optional<std::string>
{
  auto [begin, end] = comments.equal_range(std::string(key));
  for (auto it = begin; it != end; ++it)
  {
    if (!is_blank(it->second))
      return it->second;
  }
  return std::nullopt;
}

} // namespace

auto is_track_number(std::string_view value) -> bool
{
  const auto slash = value.find('/');
  if (slash == std::string_view::npos)
    return all_digits(value);
  return all_digits(value.substr(0, slash)) && all_digits(value.substr(slash + 1));
}

auto is_vinyl_track_number(std::string_view value) -> bool
{
  return value.size() >= 2 && std::isalpha(static_cast<unsigned char>(value.front())) &&
         all_digits(value.substr(1));
}

auto read_vorbis_comments(const fs::path& file) -> VorbisComments
{
  FLAC::Metadata::Chain chain;
  if (!chain.is_valid() || !chain.read(file.c_str()))
    throw Error(ErrorKind::Decode, std::format("Unable to read FLAC metadata of {}: {}",
                                               file.string(), chain.status().as_cstring()));

  VorbisComments           comments;
  FLAC::Metadata::Iterator iter;
  iter.init(chain);
  do
  {
    if (iter.get_block_type() != FLAC__METADATA_TYPE_VORBIS_COMMENT)
      continue;

    std::unique_ptr<FLAC::Metadata::Prototype> block(iter.get_block());
    auto* vorbis = dynamic_cast<FLAC::Metadata::VorbisComment*>(block.get());
    if (!vorbis)
      throw Error(ErrorKind::Decode,
                  std::format("Malformed Vorbis comment block in {}", file.string()));

    for (unsigned i = 0; i < vorbis->get_num_comments(); ++i)
    {
      const auto entry = vorbis->get_comment(i);
      if (!entry.is_valid())
        continue;

      std::string key(entry.get_field_name(), entry.get_field_name_length());
      std::string value(entry.get_field_value(), entry.get_field_value_length());
      comments.emplace(uppercase(std::move(key)), std::move(value));
    }
  } while (iter.next());

  log::TRACE<Tags>("Read {} Vorbis comment(s) from {}", comments.size(), file.string());
  return comments;
}

auto TagVerifier::check_comments(const VorbisComments& comments, const AbsPath& path,
                                 const source::ReleaseMetadata& expected) -> rules::Rules
{
  rules::Rules found;

  auto artist = find_tag(comments, macros::TAG_ARTIST);
  if (!artist)
    found.emplace_back(rules::MissingArtistTag{path});

  auto album = find_tag(comments, macros::TAG_ALBUM);
  if (!album)
    found.emplace_back(rules::MissingAlbumTag{path});
  else if (!expected.album.empty() && *album != expected.album)
    log::DBG<Tags>("Album tag '{}' differs from release album '{}': {}", *album, expected.album,
                   path);

  if (!find_tag(comments, macros::TAG_TITLE))
    found.emplace_back(rules::MissingTitleTag{path});

  auto track = find_tag(comments, macros::TAG_TRACK_NUMBER);
  if (!track)
  {
    found.emplace_back(rules::MissingTrackNumberTag{path});
  }
  else if (!is_track_number(*track))
  {
    const bool vinyl = expected.media == source::Media::Vinyl && is_vinyl_track_number(*track);
    if (!vinyl)
      found.emplace_back(rules::InvalidTrackNumberTag{path, *track});
  }

  return found;
}

auto TagVerifier::check(const fs::path& file, const source::ReleaseMetadata& expected)
  -> rules::Rules
{
  return check_comments(read_vorbis_comments(file), file.string(), expected);
}

} // namespace libcadence::flac
