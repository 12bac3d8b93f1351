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
#include <libcadence/common/macros.hpp>
#include <libcadence/files/entry.hpp>
#include <libcadence/log-macros.hpp>

using Files = libcadence::log::FILES;

namespace libcadence::files
{

namespace
{

auto has_flac_extension(const fs::path& path) -> bool
{
  std::string ext = path.extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == macros::FLAC_FILE_EXT;
}

} // namespace

auto FlacCollector::find_audio_files(const fs::path& directory) -> std::vector<fs::path>
{
  std::vector<fs::path> found;
  std::error_code       ec;

  fs::recursive_directory_iterator it(directory, ec);
  if (ec)
    throw Error(ErrorKind::Io,
                std::format("Unable to read directory {}: {}", directory.string(), ec.message()));

  const auto end = fs::recursive_directory_iterator{};
  for (; it != end; it.increment(ec))
  {
    if (ec)
      throw Error(ErrorKind::Io, std::format("Unable to scan {}: {}", directory.string(),
                                             ec.message()));

    // dangling links are skipped, not reported
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && has_flac_extension(it->path()))
      found.push_back(it->path());
  }

  if (ec)
    throw Error(ErrorKind::Io,
                std::format("Unable to scan {}: {}", directory.string(), ec.message()));

  std::ranges::sort(found);
  log::DBG<Files>("Found {} FLAC file(s) in {}", found.size(), directory.string());
  return found;
}

} // namespace libcadence::files
