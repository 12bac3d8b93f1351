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

#include <chrono>
#include <libcadence/api/interface.hpp>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/network/entry.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace libcadence::api
{

struct ApiOptions
{
  std::string          url = macros::to_string(macros::DEFAULT_API_URL);
  ApiKey               key;
  std::chrono::seconds timeout{CADENCE_API_TIMEOUT_SECS};
  bool                 verify_tls = true;
};

/**
 * @class GazelleApi
 * @brief Gazelle-style tracker API over HTTPS.
 *
 * Torrents are downloaded from `/ajax.php?action=download&id=<id>` with the
 * API key as the Authorization header. Instances are shared handles (create
 * them with std::make_shared); the connection is guarded by a mutex that is
 * held for exactly one fetch.
 *
 * Transport failures and non-200 statuses resolve the future with
 * libcadence::Error (Network), error envelopes and non-torrent bodies with
 * libcadence::Error (Api).
 */
class CADENCE_API GazelleApi : public ITrackerApi, public std::enable_shared_from_this<GazelleApi>
{
public:
  explicit GazelleApi(const ApiOptions& options);

  auto fetch_torrent(TorrentID id) -> std::future<TorrentBuffer> override;

  // Validates a download response and returns its body as bytes
  static auto torrent_from_response(TorrentID id, const network::HttpResponse& response)
    -> TorrentBuffer;

private:
  ApiKey                m_key;
  std::mutex            m_mutex;
  network::HttpsClient  m_client;

  auto fetch_locked(TorrentID id) -> TorrentBuffer;
};

} // namespace libcadence::api
