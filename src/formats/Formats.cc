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
#include <libcadence/common/macros.hpp>
#include <libcadence/formats/entry.hpp>

namespace libcadence::formats
{

namespace
{

auto lowercase(std::string_view value) -> std::string
{
  std::string out(value);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

auto parse_source_format(std::string_view value) -> std::optional<SourceFormat>
{
  const auto v = lowercase(value);
  if (v == "flac" || v == "flac16")
    return SourceFormat::Flac;
  if (v == "flac24" || v == "flac 24bit" || v == "24bit flac")
    return SourceFormat::Flac24;
  return std::nullopt;
}

auto parse_target_format(std::string_view value) -> std::optional<TargetFormat>
{
  const auto v = lowercase(value);
  if (v == "flac")
    return TargetFormat::Flac;
  if (v == "320" || v == "mp3_320")
    return TargetFormat::Mp3_320;
  if (v == "v0" || v == "mp3_v0")
    return TargetFormat::Mp3_V0;
  return std::nullopt;
}

auto to_string(SourceFormat format) -> std::string
{
  switch (format)
  {
    case SourceFormat::Flac:
      return "FLAC";
    case SourceFormat::Flac24:
      return "FLAC 24bit";
  }
  return "unknown";
}

auto label(TargetFormat format) -> std::string
{
  switch (format)
  {
    case TargetFormat::Flac:
      return "FLAC";
    case TargetFormat::Mp3_320:
      return "320";
    case TargetFormat::Mp3_V0:
      return "V0";
  }
  return "unknown";
}

auto extension(TargetFormat format) -> std::string
{
  if (format == TargetFormat::Flac)
    return macros::to_string(macros::FLAC_FILE_EXT);
  return macros::to_string(macros::MP3_FILE_EXT);
}

auto TargetFormatProvider::get(SourceFormat source, const ExistingFormats& existing) const
  -> TargetFormats
{
  TargetFormats targets = m_targets;

  // A 16 bit FLAC cannot be transcoded into another 16 bit FLAC
  if (source == SourceFormat::Flac)
    targets.erase(TargetFormat::Flac);

  if (!m_allowExisting)
  {
    for (const auto& format : existing)
      targets.erase(format);
  }

  return targets;
}

} // namespace libcadence::formats
