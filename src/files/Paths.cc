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

#include <libcadence/files/entry.hpp>
#include <libcadence/log-macros.hpp>

using Paths = libcadence::log::PATHS;

namespace libcadence::files
{

namespace
{

constexpr std::string_view INVALID_FILE_NAME_CHARS = R"(/\:*?"<>|)";

} // namespace

auto sanitize_file_name(std::string_view name) -> std::string
{
  std::string out;
  out.reserve(name.size());
  for (char c : name)
  {
    if (INVALID_FILE_NAME_CHARS.find(c) == std::string_view::npos)
      out.push_back(c);
  }
  return out;
}

auto TranscodePathEvaluator::release_dir_name(const source::Source&  source,
                                              formats::TargetFormat target) -> std::string
{
  const auto& meta = source.metadata;

  std::string name = std::format("{} - {}", meta.artist, meta.album);
  if (meta.year)
    name += std::format(" [{}]", *meta.year);
  name += std::format(" [{} {}]", source::to_string(meta.media), formats::label(target));

  return sanitize_file_name(name);
}

auto TranscodePathEvaluator::transcode_sub_path(const source::Source&  source,
                                                formats::TargetFormat target,
                                                const fs::path&       file) -> SubPath
{
  SubPath sub_path = release_dir_name(source, target);

  const auto sub_dir = file.parent_path().lexically_relative(source.directory);
  if (!sub_dir.empty() && sub_dir != ".")
    sub_path += "/" + sub_dir.generic_string();

  sub_path += "/" + file.stem().string() + formats::extension(target);
  return sub_path;
}

auto TranscodePathEvaluator::max_output_path(const source::Source&         source,
                                             const formats::TargetFormats& targets,
                                             const fs::path&               file) -> SubPath
{
  SubPath longest;
  for (const auto target : targets)
  {
    auto candidate = transcode_sub_path(source, target, file);
    if (candidate.size() > longest.size())
      longest = std::move(candidate);
  }

  log::TRACE<Paths>("Longest transcode path for {} is {} bytes", file.filename().string(),
                    longest.size());
  return longest;
}

} // namespace libcadence::files
