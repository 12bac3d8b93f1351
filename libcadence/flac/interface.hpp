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

#include <filesystem>
#include <libcadence/rules/entry.hpp>
#include <libcadence/source/entry.hpp>
#include <memory>

namespace libcadence::flac
{

class ITagVerifier
{
public:
  virtual ~ITagVerifier() = default;

  // Embedded metadata of one file against what the release expects
  virtual auto check(const fs::path& file, const source::ReleaseMetadata& expected)
    -> rules::Rules = 0;
};

using TagVerifierPtr = std::shared_ptr<ITagVerifier>;

} // namespace libcadence::flac
