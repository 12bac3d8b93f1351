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

#include <string>
#include <string_view>

enum Macros
{
  MAX_PATH_LENGTH          = 180, // longest transcode sub-path the tracker accepts
  CADENCE_API_TIMEOUT_SECS = 30,
  CADENCE_HTTPS_PORT_NO    = 443,
  CADENCE_IO_CHUNK_SIZE    = 65536 // read size used when hashing pieces
};

#define CADENCE_HTTPS_PORT_NO_STR "443"

#define CADENCE_RET_SUC      0
#define CADENCE_RET_FAIL     1
#define CADENCE_RET_REJECTED 2

#define STRING_CONSTANTS(X)                                    \
  /* File Extensions */                                        \
  X(FLAC_FILE_EXT, ".flac")                                    \
  X(MP3_FILE_EXT, ".mp3")                                      \
  X(TOML_FILE_EXT, ".toml")                                    \
                                                               \
  /* Configuration */                                          \
  X(CONFIG_FILE, "config.toml")                                \
  X(CONFIG_REL_DIR, ".config/cadence")                         \
  X(CONFIG_XDG_SUBDIR, "cadence")                              \
  X(LOG_LEVEL_ENV, "CADENCE_LOG_LEVEL")                        \
                                                               \
  /* Tracker API */                                            \
  X(DEFAULT_API_URL, "https://redacted.sh")                    \
  X(API_DOWNLOAD_TARGET, "/ajax.php?action=download&id=")      \
  X(API_USER_AGENT, "Cadence")                                 \
                                                               \
  /* Content Types */                                          \
  X(CONTENT_TYPE_JSON, "application/json")                     \
  X(CONTENT_TYPE_BITTORRENT, "application/x-bittorrent")       \
                                                               \
  /* Vorbis comment fields */                                  \
  X(TAG_ARTIST, "ARTIST")                                      \
  X(TAG_ALBUM, "ALBUM")                                        \
  X(TAG_TITLE, "TITLE")                                        \
  X(TAG_TRACK_NUMBER, "TRACKNUMBER")

namespace macros
{

#define DECLARE_STRING_VIEW(name, value) constexpr std::string_view name = value;
STRING_CONSTANTS(DECLARE_STRING_VIEW)
#undef DECLARE_STRING_VIEW

// Convert string_view to string using a function (avoiding constexpr std::string)
inline auto to_string(std::string_view sv) -> std::string { return std::string(sv); }

} // namespace macros
