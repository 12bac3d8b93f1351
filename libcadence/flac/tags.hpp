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

#include <libcadence/common/api/entry.hpp>
#include <libcadence/flac/interface.hpp>
#include <map>
#include <string>
#include <string_view>

namespace libcadence::flac
{

// Vorbis comment field names are case-insensitive, keys are stored upper-cased
using VorbisComments = std::multimap<std::string, std::string>;

/**
 * Reads every Vorbis comment of a FLAC file through its metadata chain.
 *
 * Throws libcadence::Error (Decode) when the chain cannot be read.
 */
CADENCE_API auto read_vorbis_comments(const fs::path& file) -> VorbisComments;

// "7" or "7/12"
CADENCE_API auto is_track_number(std::string_view value) -> bool;

// Vinyl side notation: "A1", "B12"
CADENCE_API auto is_vinyl_track_number(std::string_view value) -> bool;

/**
 * @class TagVerifier
 * @brief Checks the Vorbis comments every track must carry.
 *
 * ARTIST, ALBUM, TITLE and TRACKNUMBER must be present and non blank.
 * TRACKNUMBER must be `N` or `N/M`, vinyl side notation is accepted when the
 * release media is Vinyl.
 */
class CADENCE_API TagVerifier : public ITagVerifier
{
public:
  auto check(const fs::path& file, const source::ReleaseMetadata& expected)
    -> rules::Rules override;

  static auto check_comments(const VorbisComments& comments, const AbsPath& path,
                             const source::ReleaseMetadata& expected) -> rules::Rules;
};

} // namespace libcadence::flac
