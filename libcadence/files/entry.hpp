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
#include <libcadence/files/interface.hpp>
#include <string>
#include <string_view>

namespace libcadence::files
{

/**
 * @class FlacCollector
 * @brief Recursive scan for `.flac` files (extension matched case-insensitively).
 *
 * Results are sorted by full path. An unreadable directory anywhere in the
 * tree is an Io error.
 */
class CADENCE_API FlacCollector : public IFileCollector
{
public:
  auto find_audio_files(const fs::path& directory) -> std::vector<fs::path> override;
};

/**
 * @class TranscodePathEvaluator
 * @brief Computes where a transcode of a source file would be written.
 *
 * For target T the sub-path is
 *
 *   "<Artist> - <Album> [<Year>] [<Media> <T label>]/<sub dir>/<stem><T ext>"
 *
 * with characters that are invalid on common filesystems removed from the
 * release directory name. Lengths are counted in bytes.
 */
class CADENCE_API TranscodePathEvaluator : public IPathEvaluator
{
public:
  auto max_output_path(const source::Source& source, const formats::TargetFormats& targets,
                       const fs::path& file) -> SubPath override;

  static auto release_dir_name(const source::Source& source, formats::TargetFormat target)
    -> std::string;
  static auto transcode_sub_path(const source::Source& source, formats::TargetFormat target,
                                 const fs::path& file) -> SubPath;
};

// Drops the characters `/ \ : * ? " < > |`
CADENCE_API auto sanitize_file_name(std::string_view name) -> std::string;

} // namespace libcadence::files
