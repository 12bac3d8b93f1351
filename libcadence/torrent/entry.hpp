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
#include <libcadence/torrent/interface.hpp>
#include <span>
#include <string>
#include <vector>

namespace libcadence::torrent
{

struct TorrentFileEntry
{
  fs::path  path; // relative to the content root
  ByteCount length = 0;
};

/**
 * @struct TorrentDescriptor
 * @brief The parts of a .torrent `info` dictionary needed to check content.
 *
 * Single file torrents are stored as one entry named after `info.name`, with
 * multi_file unset.
 */
struct TorrentDescriptor
{
  std::string                   name;
  ByteCount                     piece_length = 0;
  std::vector<Sha1Digest>       pieces;
  std::vector<TorrentFileEntry> files;
  bool                          multi_file = false;
  Sha1Digest                    info_hash{};

  [[nodiscard]] auto total_size() const -> ByteCount;

  // Where a file's content is expected for a given source directory
  [[nodiscard]] auto content_path(const fs::path& directory, const TorrentFileEntry& file) const
    -> fs::path;
};

/**
 * Parses a .torrent file. Missing or mistyped info keys, a `pieces` string
 * that is not a multiple of 20 bytes, unsafe file paths or a piece count that
 * does not cover the content throw libcadence::Error (Torrent).
 */
CADENCE_API auto parse_descriptor(std::span<const TorrentByte> data) -> TorrentDescriptor;

// Outcome of hashing content against a descriptor
struct ContentCheck
{
  std::size_t              total_pieces  = 0;
  std::size_t              failed_pieces = 0;
  std::vector<std::string> missing_files;
  std::vector<std::string> size_mismatches;

  [[nodiscard]] auto ok() const -> bool
  {
    return failed_pieces == 0 && missing_files.empty() && size_mismatches.empty();
  }

  [[nodiscard]] auto summary() const -> std::string;
};

CADENCE_API auto check_content(const TorrentDescriptor& descriptor, const fs::path& directory)
  -> ContentCheck;

/**
 * @class TorrentVerifier
 * @brief Piece-by-piece SHA-1 verification of a source directory.
 *
 * Runs on its own thread; a failed check resolves to a single IncorrectHash
 * rule. Malformed descriptors and unreadable files surface as exceptions from
 * the future.
 */
class CADENCE_API TorrentVerifier : public ITorrentVerifier
{
public:
  auto verify(const TorrentBuffer& descriptor, const fs::path& directory)
    -> std::future<rules::Rules> override;

  static auto verify_now(const TorrentBuffer& descriptor, const fs::path& directory)
    -> rules::Rules;
};

} // namespace libcadence::torrent
