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
#include <future>
#include <libcadence/common/types.hpp>
#include <libcadence/rules/entry.hpp>
#include <libcadence/source/entry.hpp>
#include <memory>

namespace libcadence::torrent
{

class ITorrentVerifier
{
public:
  virtual ~ITorrentVerifier() = default;

  // Checks the content under `directory` against a torrent descriptor
  virtual auto verify(const TorrentBuffer& descriptor, const fs::path& directory)
    -> std::future<rules::Rules> = 0;
};

using TorrentVerifierPtr = std::shared_ptr<ITorrentVerifier>;

} // namespace libcadence::torrent
