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

#include <libcadence/api/entry.hpp>
#include <libcadence/common/error.hpp>
#include <libcadence/log-macros.hpp>

using Api = libcadence::log::API;

namespace libcadence::api
{

namespace
{

constexpr std::size_t MaxErrorSnippet = 200;

auto snippet(const std::string& body) -> std::string
{
  if (body.size() <= MaxErrorSnippet)
    return body;
  return body.substr(0, MaxErrorSnippet) + "...";
}

auto looks_like_json(const network::HttpResponse& response) -> bool
{
  if (response.content_type.find(macros::CONTENT_TYPE_JSON) != std::string::npos)
    return true;
  const auto first = response.body.find_first_not_of(" \t\r\n");
  return first != std::string::npos && response.body[first] == '{';
}

} // namespace

GazelleApi::GazelleApi(const ApiOptions& options)
    : m_key(options.key),
      m_client(network::parse_base_url(options.url), options.timeout, options.verify_tls)
{
}

auto GazelleApi::torrent_from_response(TorrentID id, const network::HttpResponse& response)
  -> TorrentBuffer
{
  if (response.status != 200)
  {
    if (looks_like_json(response))
      throw Error(ErrorKind::Api, std::format("Download of torrent {} failed (HTTP {}): {}", id,
                                              response.status, snippet(response.body)));
    throw Error(ErrorKind::Network,
                std::format("Download of torrent {} failed with HTTP {}", id, response.status));
  }

  // Gazelle answers failures with a JSON envelope and status 200
  if (looks_like_json(response))
    throw Error(ErrorKind::Api, std::format("Tracker refused torrent {}: {}", id,
                                            snippet(response.body)));

  if (response.body.empty() || response.body.front() != 'd')
    throw Error(ErrorKind::Api,
                std::format("Tracker response for torrent {} is not a torrent file", id));

  return {response.body.begin(), response.body.end()};
}

auto GazelleApi::fetch_locked(TorrentID id) -> TorrentBuffer
{
  std::lock_guard<std::mutex> lock(m_mutex);

  NetTarget target = macros::to_string(macros::API_DOWNLOAD_TARGET) + std::to_string(id);
  log::DBG<Api>("Downloading torrent {}", id);

  const auto response = m_client.get(target, {{"Authorization", m_key}});
  auto       torrent  = torrent_from_response(id, response);

  log::DBG<Api>("Downloaded torrent {} ({} bytes)", id, torrent.size());
  return torrent;
}

auto GazelleApi::fetch_torrent(TorrentID id) -> std::future<TorrentBuffer>
{
  return std::async(std::launch::async,
                    [self = shared_from_this(), id] { return self->fetch_locked(id); });
}

} // namespace libcadence::api
