#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace arena {

/*
 * "https://api.openai.com/v1" -> {tls=true, host="api.openai.com", port="443", path="/v1"}
 * "http://localhost:11434/v1" -> {tls=false, host="localhost", port="11434", path="/v1"}
 *
 * path never ends with '/', so that join() can append "/chat/completions".
 */
struct Url {
  static Url parse(const std::string& url);  // throws util::CleanException on a malformed url

  std::string join(const std::string& suffix) const { return path + suffix; }
  std::string to_str() const;

  bool tls = true;
  std::string host;
  std::string port;
  std::string path;
};

struct HttpResponse {
  bool ok() const { return status >= 200 && status < 300; }

  int status = 0;
  std::string body;
};

/*
 * Minimal blocking HTTP/1.1 client over Boost.Beast, with TLS through Boost.Asio's OpenSSL
 * binding. One connection per request.
 */
class HttpClient {
 public:
  using header_list_t = std::vector<std::pair<std::string, std::string>>;
  using duration_t = std::chrono::steady_clock::duration;

  static constexpr std::chrono::seconds kDefaultTimeout{120};

  /*
   * POSTs a JSON body to url.join(suffix). Transport errors throw boost::system::system_error;
   * a non-2xx status is returned, not thrown.
   *
   * Connecting, the TLS handshake, writing the request and reading the response each get timeout.
   * A step that runs past it throws boost::system::system_error (beast::error::timeout).
   */
  static HttpResponse post_json(const Url& url, const std::string& suffix,
                                const header_list_t& headers, const std::string& body,
                                duration_t timeout = kDefaultTimeout);
};

}  // namespace arena
