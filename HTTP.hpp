#ifndef HTTP_DOT_HPP
#define HTTP_DOT_HPP

#include <string>
#include <string_view>

namespace HTTP {

// HTTP/1.1 GET of an http:// or https:// URL.  Redirects are followed, TLS
// peers must present a certificate valid for the host name, and the whole
// exchange is bounded by --list_fetch_timeout_ms.  Only a 200 response is
// success; anything else leaves a reason in msg.
bool get(std::string_view url, std::string& body, std::string& msg);

// The request target a relative Location header points to from target:
// "/abs/path", "sibling.json", "../up.json" or "?query".  Dot segments are
// left for the server.
std::string relative_target(std::string_view target, std::string_view location);

} // namespace HTTP

#endif // HTTP_DOT_HPP
