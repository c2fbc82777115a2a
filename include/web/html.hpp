#ifndef LUTUBE_WEB_HTML_HPP
#define LUTUBE_WEB_HTML_HPP

#include <map>
#include <string>
#include <vector>
#include "store/video.hpp"

namespace lutube {
namespace web {

std::string escape_html(const std::string& text);

// Banner text for the home page, decoded from its error query parameters
std::string error_message(const std::map<std::string, std::string>& query);

// Catalog, upload form and optional error banner
std::string render_home(const std::vector<store::Video>& videos, const std::string& error_message);

// Player page for one video
std::string render_watch(const store::Video& video);

} // namespace web
} // namespace lutube

#endif // LUTUBE_WEB_HTML_HPP
