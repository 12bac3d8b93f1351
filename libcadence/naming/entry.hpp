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
#include <libcadence/naming/interface.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace libcadence::naming
{

// Drops bracketed groups and featured artist credits: "Song (Live) [feat. X]" -> "Song".
// Empty when nothing shorter can be proposed.
CADENCE_API auto shorten_title(std::string_view title) -> std::optional<std::string>;

// shorten_title() that also drops a subtitle after ": "
CADENCE_API auto shorten_album(std::string_view album) -> std::optional<std::string>;

class CADENCE_API LogShortener : public IShortener
{
public:
  void suggest_track(const fs::path& file) override;
  void suggest_album(const source::Source& source) override;
};

} // namespace libcadence::naming
