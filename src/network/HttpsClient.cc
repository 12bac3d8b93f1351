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
#include <libcadence/common/error.hpp>
#include <libcadence/log-macros.hpp>
#include <libcadence/network/entry.hpp>
#include <openssl/err.h>

using Network = libcadence::log::NET;

namespace libcadence::network
{

namespace
{

// Response bodies above this are refused
constexpr std::uint64_t MaxBodySize = 32ull * 1024 * 1024;

} // namespace

auto parse_base_url(const std::string& url) -> BaseUrl
{
  constexpr std::string_view scheme = "https://";
  if (!url.starts_with(scheme))
    throw Error(ErrorKind::Config, std::format("Tracker URL must start with https://: {}", url));

  std::string rest = url.substr(scheme.size());
  BaseUrl     result;

  if (auto slash = rest.find('/'); slash != std::string::npos)
  {
    result.path_prefix = rest.substr(slash);
    rest.erase(slash);
    while (!result.path_prefix.empty() && result.path_prefix.back() == '/')
      result.path_prefix.pop_back();
  }

  if (auto colon = rest.rfind(':'); colon != std::string::npos)
  {
    result.port = rest.substr(colon + 1);
    rest.erase(colon);
    if (result.port.empty() ||
        !std::ranges::all_of(result.port, [](unsigned char c) { return std::isdigit(c); }))
      throw Error(ErrorKind::Config, std::format("Invalid port in tracker URL: {}", url));
  }

  if (rest.empty())
    throw Error(ErrorKind::Config, std::format("Tracker URL has no host: {}", url));

  result.host = std::move(rest);
  return result;
}

auto HttpsClient::make_ssl_context() const -> ssl::context
{
  ssl::context ctx(ssl::context::tls_client);
  if (m_verifyPeer)
  {
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
  }
  else
  {
    ctx.set_verify_mode(ssl::verify_none);
  }
  return ctx;
}

auto HttpsClient::get(const NetTarget& target, const HttpHeaders& headers) -> HttpResponse
{
  asio::io_context                     ioc;
  ssl::context                         ssl_ctx = make_ssl_context();
  tcp::resolver                        resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), m_server.host.c_str()))
  {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
    throw Error(ErrorKind::Network, std::format("Unable to set SNI host name: {}", ec.message()));
  }
  if (m_verifyPeer)
    stream.set_verify_callback(ssl::host_name_verification(m_server.host));

  http::request<http::empty_body> req{http::verb::get, m_server.path_prefix + target, 11};
  req.set(http::field::host, m_server.host);
  req.set(http::field::user_agent, macros::to_string(macros::API_USER_AGENT));
  for (const auto& [name, value] : headers)
    req.set(name, value);

  beast::flat_buffer                       buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(MaxBodySize);

  beast::error_code failure;
  std::string       stage;
  auto              fail = [&](beast::error_code ec, const char* what)
  {
    failure = ec;
    stage   = what;
  };

  auto arm_timer = [&] { beast::get_lowest_layer(stream).expires_after(m_timeout); };

  log::DBG<Network>("GET https://{}:{}{}{}", m_server.host, m_server.port, m_server.path_prefix,
                    target);

  // tcp_stream only times socket operations, the lookup gets its own timer
  asio::steady_timer resolve_timer(ioc, m_timeout);
  bool               resolve_expired = false;
  resolve_timer.async_wait(
    [&](beast::error_code ec)
    {
      if (ec)
        return;
      resolve_expired = true;
      resolver.cancel();
    });

  resolver.async_resolve(
    m_server.host, m_server.port,
    [&](beast::error_code ec, const tcp::resolver::results_type& results)
    {
      resolve_timer.cancel();
      if (resolve_expired)
        return fail(beast::error::timeout, "resolve");
      if (ec)
        return fail(ec, "resolve");

      arm_timer();
      beast::get_lowest_layer(stream).async_connect(
        results,
        [&](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&)
        {
          if (ec)
            return fail(ec, "connect");

          arm_timer();
          stream.async_handshake(
            ssl::stream_base::client,
            [&](beast::error_code ec)
            {
              if (ec)
                return fail(ec, "TLS handshake");

              arm_timer();
              http::async_write(
                stream, req,
                [&](beast::error_code ec, std::size_t)
                {
                  if (ec)
                    return fail(ec, "write");

                  arm_timer();
                  http::async_read(
                    stream, buffer, parser,
                    [&](beast::error_code ec, std::size_t)
                    {
                      if (ec)
                        return fail(ec, "read");

                      arm_timer();
                      stream.async_shutdown(
                        [&](beast::error_code ec)
                        {
                          // peers routinely drop the connection without close_notify
                          if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
                            log::DBG<Network>("TLS shutdown: {}", ec.message());
                        });
                    });
                });
            });
        });
    });

  ioc.run();

  if (failure)
  {
    if (failure == beast::error::timeout)
      throw Error(ErrorKind::Network, std::format("Request to {} timed out during {} after {}s",
                                                  m_server.host, stage, m_timeout.count()));
    throw Error(ErrorKind::Network, std::format("Request to {} failed during {}: {}",
                                                m_server.host, stage, failure.message()));
  }

  auto         res          = parser.release();
  const auto   content_type = res[http::field::content_type];
  HttpResponse response;
  response.status       = res.result_int();
  response.content_type = std::string(content_type.data(), content_type.size());
  response.body         = std::move(res.body());

  log::DBG<Network>("HTTP {} ({} bytes, {})", response.status, response.body.size(),
                    response.content_type);
  return response;
}

} // namespace libcadence::network
