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

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/common/types.hpp>
#include <map>
#include <string>

namespace ssl   = boost::asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

namespace libcadence::network
{

// "https://host[:port][/prefix]"
struct BaseUrl
{
  HostName    host;
  PortStr     port = CADENCE_HTTPS_PORT_NO_STR;
  std::string path_prefix; // without trailing slash
};

/**
 * Splits an https URL into host, port and path prefix.
 *
 * Throws libcadence::Error (Config) for anything that is not an https URL
 * with a host.
 */
CADENCE_API auto parse_base_url(const std::string& url) -> BaseUrl;

struct HttpResponse
{
  unsigned    status = 0;
  std::string content_type;
  NetResponse body;
};

using HttpHeaders = std::map<std::string, std::string>;

/**
 * @class HttpsClient
 * @brief One-shot HTTPS requests over Beast with TLS.
 *
 * Each request resolves, connects, handshakes and reads on a private
 * io_context; every step is bounded by the configured timeout. Transport
 * failures throw libcadence::Error (Network). HTTP error statuses are
 * returned to the caller.
 */
class CADENCE_API HttpsClient
{
public:
  HttpsClient(BaseUrl server, std::chrono::seconds timeout, bool verify_peer = true)
      : m_server(std::move(server)), m_timeout(timeout), m_verifyPeer(verify_peer)
  {
  }

  void setTimeout(std::chrono::seconds timeout) { m_timeout = timeout; }

  [[nodiscard]] auto server() const -> const BaseUrl& { return m_server; }

  auto get(const NetTarget& target, const HttpHeaders& headers = {}) -> HttpResponse;

private:
  BaseUrl              m_server;
  std::chrono::seconds m_timeout{CADENCE_API_TIMEOUT_SECS};
  bool                 m_verifyPeer;

  [[nodiscard]] auto make_ssl_context() const -> ssl::context;
};

} // namespace libcadence::network
