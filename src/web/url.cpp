#include "web/url.hpp"
#include <cctype>

namespace lutube {
namespace web {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string url_decode(const std::string& text, bool plus_as_space) {
  std::string decoded;
  decoded.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
      decoded += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
      i += 2;
    } else if (c == '+' && plus_as_space) {
      decoded += ' ';
    } else {
      decoded += c;
    }
  }
  return decoded;
}

std::string url_encode(const std::string& text) {
  static const char* digits = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(text.size());

  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += digits[c >> 4];
      encoded += digits[c & 0x0F];
    }
  }
  return encoded;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> values;
  std::size_t pos = 0;

  while (pos <= query.size()) {
    std::size_t end = query.find('&', pos);
    if (end == std::string::npos) {
      end = query.size();
    }

    std::string pair = query.substr(pos, end - pos);
    if (!pair.empty()) {
      std::size_t equals = pair.find('=');
      std::string key = url_decode(pair.substr(0, equals), true);
      std::string value = equals == std::string::npos ? "" : url_decode(pair.substr(equals + 1), true);
      values.emplace(key, value);
    }
    pos = end + 1;
  }
  return values;
}

void split_target(const std::string& target, std::string& path, std::string& query) {
  std::size_t mark = target.find('?');
  path = target.substr(0, mark);
  query = mark == std::string::npos ? "" : target.substr(mark + 1);
}

} // namespace web
} // namespace lutube
