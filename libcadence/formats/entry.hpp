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
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace libcadence::formats
{

// Lossless master the source is encoded as
enum class SourceFormat
{
  Flac,  // 16 bit
  Flac24 // 24 bit
};

// Formats a source can be transcoded to (and formats that may already exist on the tracker)
enum class TargetFormat
{
  Flac,
  Mp3_320,
  Mp3_V0
};

using TargetFormats   = std::set<TargetFormat>;
using ExistingFormats = std::set<TargetFormat>;

CADENCE_API auto parse_source_format(std::string_view value) -> std::optional<SourceFormat>;
CADENCE_API auto parse_target_format(std::string_view value) -> std::optional<TargetFormat>;

CADENCE_API auto to_string(SourceFormat format) -> std::string;

// Label used in directory names: "FLAC", "320", "V0"
CADENCE_API auto label(TargetFormat format) -> std::string;

// File extension of the transcoded files, with the leading dot
CADENCE_API auto extension(TargetFormat format) -> std::string;

inline auto all_targets() -> TargetFormats
{
  return {TargetFormat::Flac, TargetFormat::Mp3_320, TargetFormat::Mp3_V0};
}

/**
 * @class TargetFormatProvider
 * @brief Decides which transcodes can be produced for a source.
 *
 * Starts from the configured targets, drops FLAC for a 16 bit source and,
 * unless allow_existing is set, drops every format the tracker already has.
 */
class CADENCE_API TargetFormatProvider
{
public:
  explicit TargetFormatProvider(TargetFormats targets = all_targets(), bool allow_existing = false)
      : m_targets(std::move(targets)), m_allowExisting(allow_existing)
  {
  }

  [[nodiscard]] auto get(SourceFormat source, const ExistingFormats& existing) const
    -> TargetFormats;

  [[nodiscard]] auto configured() const -> const TargetFormats& { return m_targets; }

private:
  TargetFormats m_targets;
  bool          m_allowExisting;
};

} // namespace libcadence::formats
