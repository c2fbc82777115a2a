#ifndef LUTUBE_WEB_URL_HPP
#define LUTUBE_WEB_URL_HPP

#include <map>
#include <string>

namespace lutube {
namespace web {

// Decodes %XX escapes. In query strings '+' also stands for a space.
// Malformed escapes are kept literally.
std::string url_decode(const std::string& text, bool plus_as_space = false);

// Percent-encodes everything except the RFC 3986 unreserved characters
std::string url_encode(const std::string& text);

// Splits "a=1&b=two" into decoded pairs; a repeated key keeps its first value
std::map<std::string, std::string> parse_query(const std::string& query);

// Splits a request target into its path and query components
void split_target(const std::string& target, std::string& path, std::string& query);

} // namespace web
} // namespace lutube

#endif // LUTUBE_WEB_URL_HPP
