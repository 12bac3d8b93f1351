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

#include <future>
#include <libcadence/common/types.hpp>
#include <memory>

namespace libcadence::api
{

class ITrackerApi
{
public:
  virtual ~ITrackerApi() = default;

  // Raw .torrent descriptor of a tracker torrent
  virtual auto fetch_torrent(TorrentID id) -> std::future<TorrentBuffer> = 0;
};

using TrackerApiPtr = std::shared_ptr<ITrackerApi>;

} // namespace libcadence::api
