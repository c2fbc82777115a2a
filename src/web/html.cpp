#include "web/html.hpp"
#include "web/url.hpp"
#include <sstream>

namespace lutube {
namespace web {

namespace {

const char* PAGE_HEAD =
  "<!DOCTYPE html>\n"
  "<html>\n"
  "<head>\n"
  "<meta charset=\"utf-8\">\n";

std::string lookup(const std::map<std::string, std::string>& query, const std::string& key) {
  auto it = query.find(key);
  return it == query.end() ? "" : it->second;
}

} // namespace

std::string escape_html(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());

  for (char c : text) {
    switch (c) {
      case '&': escaped += "&amp;"; break;
      case '<': escaped += "&lt;"; break;
      case '>': escaped += "&gt;"; break;
      case '"': escaped += "&quot;"; break;
      case '\'': escaped += "&#39;"; break;
      default: escaped += c;
    }
  }
  return escaped;
}

std::string error_message(const std::map<std::string, std::string>& query) {
  const std::string error_type = lookup(query, "error");
  if (error_type == "notfound") {
    return "ID " + lookup(query, "id") + " not found.";
  }
  if (error_type == "misc") {
    return "Error: " + lookup(query, "msg");
  }
  if (error_type == "fu") {
    return "Upload failed.";
  }
  return "";
}

std::string render_home(const std::vector<store::Video>& videos, const std::string& error_message) {
  std::ostringstream page;
  page << PAGE_HEAD
       << "<title>LuTube</title>\n"
       << "</head>\n"
       << "<body>\n"
       << "<h1>LuTube</h1>\n";

  if (!error_message.empty()) {
    page << "<p class=\"error\">" << escape_html(error_message) << "</p>\n";
  }

  page << "<h2>Upload a video</h2>\n"
       << "<form action=\"/upload/\" method=\"post\" enctype=\"multipart/form-data\">\n"
       << "<input type=\"text\" name=\"title\" placeholder=\"Title\">\n"
       << "<input type=\"file\" name=\"video-file\" accept=\"video/mp4\">\n"
       << "<input type=\"submit\" value=\"Upload\">\n"
       << "</form>\n"
       << "<h2>Videos</h2>\n";

  if (videos.empty()) {
    page << "<p>No videos yet.</p>\n";
  } else {
    page << "<ul>\n";
    for (const auto& video : videos) {
      page << "<li><a href=\"/watch/" << url_encode(video.id) << "\">"
           << escape_html(video.title) << "</a></li>\n";
    }
    page << "</ul>\n";
  }

  page << "</body>\n"
       << "</html>\n";
  return page.str();
}

std::string render_watch(const store::Video& video) {
  const std::string id = url_encode(video.id);

  std::ostringstream page;
  page << PAGE_HEAD
       << "<title>" << escape_html(video.title) << " - LuTube</title>\n"
       << "</head>\n"
       << "<body>\n"
       << "<p><a href=\"/\">LuTube</a></p>\n"
       << "<h1>" << escape_html(video.title) << "</h1>\n"
       << "<video controls width=\"720\">\n"
       << "<source src=\"/videos/" << id << "/video.mp4\" type=\"video/mp4\">\n"
       << "</video>\n"
       << "</body>\n"
       << "</html>\n";
  return page.str();
}

} // namespace web
} // namespace lutube
