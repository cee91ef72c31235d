#include "arena/HttpClient.hpp"

#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>

#include <utility>

namespace arena {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using request_t = http::request<http::string_body>;
using response_t = http::response<http::string_body>;

using duration_t = HttpClient::duration_t;

/*
 * Runs one asynchronous step to completion on ioc and throws if it failed. Beast only enforces a
 * stream's expiry on asynchronous operations, so every blocking step goes through here; a step
 * that outlives its deadline fails with beast::error::timeout.
 */
template <typename Initiate>
void run_step(net::io_context& ioc, const char* what, Initiate&& initiate) {
  beast::error_code result;
  initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  if (result) {
    throw beast::system_error(result, what);
  }
}

template <typename Stream>
response_t exchange(net::io_context& ioc, Stream& stream, const request_t& req,
                    duration_t timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step(ioc, "http write", [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });

  beast::flat_buffer buffer;
  response_t res;
  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step(ioc, "http read", [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  });
  return res;
}

response_t post_plain(net::io_context& ioc, const tcp::resolver::results_type& endpoints,
                      const request_t& req, duration_t timeout) {
  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout);
  run_step(ioc, "connect", [&](auto handler) {
    stream.async_connect(endpoints, std::move(handler));
  });
  response_t res = exchange(ioc, stream, req, timeout);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    LOG_DEBUG("http shutdown: {}", ec.message());
  }
  return res;
}

response_t post_tls(net::io_context& ioc, const tcp::resolver::results_type& endpoints,
                    const request_t& req, const std::string& host, duration_t timeout) {
  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
    throw beast::system_error{ec};
  }
  stream.set_verify_callback(ssl::host_name_verification(host));

  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step(ioc, "connect", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });
  beast::get_lowest_layer(stream).expires_after(timeout);
  run_step(ioc, "tls handshake", [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, std::move(handler));
  });
  response_t res = exchange(ioc, stream, req, timeout);

  // Many servers close the connection without a close_notify
  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(timeout);
  stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
  ioc.restart();
  ioc.run();
  if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
    LOG_DEBUG("https shutdown: {}", ec.message());
  }
  return res;
}

}  // namespace

Url Url::parse(const std::string& url) {
  Url out;
  std::string rest;
  if (url.starts_with("https://")) {
    out.tls = true;
    rest = url.substr(8);
  } else if (url.starts_with("http://")) {
    out.tls = false;
    rest = url.substr(7);
  } else {
    throw util::CleanException("Unsupported url (expected http:// or https://): {}", url);
  }

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  out.path = slash == std::string::npos ? "" : rest.substr(slash);
  while (!out.path.empty() && out.path.back() == '/') out.path.pop_back();

  size_t colon = authority.find(':');
  out.host = authority.substr(0, colon);
  out.port = colon == std::string::npos ? (out.tls ? "443" : "80") : authority.substr(colon + 1);
  if (out.host.empty() || out.port.empty()) {
    throw util::CleanException("Malformed url: {}", url);
  }
  return out;
}

std::string Url::to_str() const {
  return fmt::format("{}://{}:{}{}", tls ? "https" : "http", host, port, path);
}

HttpResponse HttpClient::post_json(const Url& url, const std::string& suffix,
                                   const header_list_t& headers, const std::string& body,
                                   duration_t timeout) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  auto const endpoints = resolver.resolve(url.host, url.port);

  request_t req{http::verb::post, url.join(suffix), 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  for (const auto& [name, value] : headers) {
    req.set(name, value);
  }
  req.body() = body;
  req.prepare_payload();

  LOG_TRACE("POST {}{}", url.to_str(), suffix);
  response_t res = url.tls ? post_tls(ioc, endpoints, req, url.host, timeout)
                           : post_plain(ioc, endpoints, req, timeout);

  HttpResponse out;
  out.status = res.result_int();
  out.body = std::move(res.body());
  return out;
}

}  // namespace arena
