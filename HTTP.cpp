#include "HTTP.hpp"

#include "iequal.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_int32(list_fetch_timeout_ms,
             30'000,
             "time allowed to fetch a domain list, redirects included");

using namespace std::literals::string_view_literals;

namespace {
namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using steady    = std::chrono::steady_clock;
using response  = http::response<http::string_body>;

constexpr int      max_redirects = 5;
constexpr uint64_t max_body      = 64 * 1024 * 1024;

struct url_parts {
  bool        tls{false};
  std::string host;
  std::string port;
  std::string target;
};

bool parse_url(std::string_view url, url_parts& parts, std::string& msg)
{
  auto const uri{url};

  if (istarts_with(url, "https://"sv)) {
    parts.tls  = true;
    parts.port = "443";
    url.remove_prefix("https://"sv.size());
  }
  else if (istarts_with(url, "http://"sv)) {
    parts.tls  = false;
    parts.port = "80";
    url.remove_prefix("http://"sv.size());
  }
  else {
    msg = fmt::format("unsupported URL scheme «{}»", uri);
    return false;
  }

  auto const slash     = url.find_first_of("/?#");
  auto       authority = url.substr(0, slash);

  parts.target = (slash == std::string_view::npos) ? "/" : url.substr(slash);
  if (auto const hash = parts.target.find('#'); hash != std::string::npos)
    parts.target.erase(hash);
  if (parts.target.empty() || parts.target.front() != '/')
    parts.target.insert(0, "/");

  if (authority.find('@') != std::string_view::npos) {
    msg = fmt::format("user info not supported in URL «{}»", uri);
    return false;
  }

  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    auto const close = authority.find(']');
    if (close == std::string_view::npos) {
      msg = fmt::format("bad IPv6 host in URL «{}»", uri);
      return false;
    }
    parts.host = authority.substr(1, close - 1);
    auto rest  = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        msg = fmt::format("bad host in URL «{}»", uri);
        return false;
      }
      port = rest.substr(1);
    }
  }
  else {
    auto const colon = authority.rfind(':');
    parts.host       = authority.substr(0, colon);
    if (colon != std::string_view::npos)
      port = authority.substr(colon + 1);
  }
  if (!port.empty())
    parts.port = port;

  if (parts.host.empty()) {
    msg = fmt::format("no host in URL «{}»", uri);
    return false;
  }
  return true;
}

// Connect, send the request and read the response on an already configured
// stream.  The tcp_stream expiry bounds each step.
template <typename Stream>
bool exchange(net::io_context&                   ioc,
              Stream&                            stream,
              tcp::resolver::results_type const& endpoints,
              url_parts const&                   url,
              steady::time_point                 deadline,
              response&                          res,
              std::string&                       msg)
{
  constexpr auto is_tls =
      std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>;

  auto& sock = beast::get_lowest_layer(stream);
  sock.expires_at(deadline);

  beast::error_code ec;
  auto const        handler = [&ec](beast::error_code e, auto&&...) { ec = e; };
  auto const        run     = [&ioc, &ec] {
    ioc.restart();
    ioc.run();
    return !ec;
  };

  sock.async_connect(endpoints, handler);
  if (!run()) {
    msg = fmt::format("connect to {}:{} failed: {}", url.host, url.port,
                      ec.message());
    return false;
  }

  if constexpr (is_tls) {
    stream.async_handshake(ssl::stream_base::client, handler);
    if (!run()) {
      msg = fmt::format("TLS handshake with {} failed: {}", url.host,
                        ec.message());
      return false;
    }
  }

  http::request<http::empty_body> req{http::verb::get, url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, "mailcop");
  req.set(http::field::accept, "application/json");

  http::async_write(stream, req, handler);
  if (!run()) {
    msg = fmt::format("write to {} failed: {}", url.host, ec.message());
    return false;
  }

  beast::flat_buffer                       buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(max_body);

  http::async_read(stream, buffer, parser, handler);
  if (!run()) {
    msg = fmt::format("read from {} failed: {}", url.host, ec.message());
    return false;
  }

  res = parser.release();
  return true;
}

bool get_once(url_parts const&   url,
              steady::time_point deadline,
              response&          res,
              std::string&       msg)
{
  net::io_context ioc;

  beast::error_code ec;
  tcp::resolver     resolver(ioc);
  auto const        endpoints = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    msg = fmt::format("can't resolve «{}»: {}", url.host, ec.message());
    return false;
  }

  if (!url.tls) {
    beast::tcp_stream stream(ioc);
    return exchange(ioc, stream, endpoints, url, deadline, res, msg);
  }

  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths(ec);
  if (ec) {
    msg = fmt::format("can't load CA certificates: {}", ec.message());
    return false;
  }
  ctx.set_verify_mode(ssl::verify_peer);

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    msg = fmt::format("can't set SNI host name «{}»", url.host);
    return false;
  }
  stream.set_verify_callback(ssl::host_name_verification(url.host));

  return exchange(ioc, stream, endpoints, url, deadline, res, msg);
}

// RFC 3986 section 3.1: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool has_scheme(std::string_view ref)
{
  auto const colon = ref.find(':');
  if ((colon == std::string_view::npos) || (colon == 0) ||
      !std::isalpha(static_cast<unsigned char>(ref.front())))
    return false;
  return std::all_of(begin(ref), begin(ref) + colon, [](unsigned char c) {
    return std::isalnum(c) || (c == '+') || (c == '-') || (c == '.');
  });
}

bool is_redirect(http::status status)
{
  switch (status) {
  case http::status::moved_permanently:
  case http::status::found:
  case http::status::see_other:
  case http::status::temporary_redirect:
  case http::status::permanent_redirect: return true;
  default: return false;
  }
}
} // namespace

namespace HTTP {

bool get(std::string_view url, std::string& body, std::string& msg)
{
  auto const deadline =
      steady::now() + std::chrono::milliseconds(FLAGS_list_fetch_timeout_ms);

  url_parts parts;
  if (!parse_url(url, parts, msg))
    return false;

  try {
    for (auto redirects = 0; redirects <= max_redirects; ++redirects) {
      response res;
      if (!get_once(parts, deadline, res, msg))
        return false;

      if (is_redirect(res.result())) {
        auto const loc = res[http::field::location];
        if (loc.empty()) {
          msg = fmt::format("redirect from {}{} without a location",
                            parts.host, parts.target);
          return false;
        }
        VLOG(1) << "redirect " << parts.host << parts.target << " -> "
                << loc;
        auto const location = std::string_view(loc.data(), loc.size());
        if (has_scheme(location)) {
          if (!parse_url(location, parts, msg))
            return false;
        }
        else if (location.starts_with("//"sv)) {
          auto const scheme = parts.tls ? "https:"sv : "http:"sv;
          if (!parse_url(fmt::format("{}{}", scheme, location), parts, msg))
            return false;
        }
        else {
          parts.target = relative_target(parts.target, location);
        }
        continue;
      }

      if (res.result() != http::status::ok) {
        msg = fmt::format("GET {}{} returned {}", parts.host, parts.target,
                          res.result_int());
        return false;
      }

      body = std::move(res.body());
      return true;
    }
  }
  catch (std::exception const& e) {
    msg = fmt::format("GET «{}» failed: {}", url, e.what());
    return false;
  }

  msg = fmt::format("too many redirects fetching «{}»", url);
  return false;
}

std::string relative_target(std::string_view target, std::string_view location)
{
  if (location.starts_with('/'))
    return std::string(location);

  auto const path = target.substr(0, target.find('?'));
  if (location.empty())
    return std::string(target);
  if (location.front() == '?')
    return fmt::format("{}{}", path, location);

  auto const slash = path.rfind('/');
  auto const dir =
      (slash == std::string_view::npos) ? "/"sv : path.substr(0, slash + 1);
  return fmt::format("{}{}", dir, location);
}

} // namespace HTTP
