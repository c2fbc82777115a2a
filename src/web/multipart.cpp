#include "web/multipart.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace lutube {
namespace web {

namespace {

constexpr std::size_t SCAN_CHUNK_SIZE = 64 * 1024;
constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;
constexpr std::size_t MAX_BOUNDARY_LENGTH = 70;

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string trim(const std::string& text) {
  const char* whitespace = " \t";
  std::size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  std::size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

// Reads up to length bytes at offset, fewer near the end of the file
std::string read_at(std::ifstream& in, std::uint64_t offset, std::size_t length) {
  std::string data(length, '\0');
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  in.read(&data[0], static_cast<std::streamsize>(length));
  data.resize(static_cast<std::size_t>(in.gcount()));
  if (in.bad()) {
    throw MultipartError("Failed to read multipart body");
  }
  return data;
}

// Offsets of every occurrence of needle, scanning the stream chunk by chunk
std::vector<std::uint64_t> find_occurrences(std::ifstream& in, const std::string& needle) {
  std::vector<std::uint64_t> positions;
  std::vector<char> window;
  std::vector<char> chunk(SCAN_CHUNK_SIZE);
  std::uint64_t window_start = 0;
  std::uint64_t next_allowed = 0;

  in.clear();
  in.seekg(0);
  while (in.read(chunk.data(), chunk.size()) || in.gcount() > 0) {
    window.insert(window.end(), chunk.data(), chunk.data() + in.gcount());

    auto it = window.begin();
    while ((it = std::search(it, window.end(), needle.begin(), needle.end())) != window.end()) {
      std::uint64_t position = window_start + static_cast<std::uint64_t>(it - window.begin());
      if (position >= next_allowed) {
        positions.push_back(position);
        next_allowed = position + needle.size();
      }
      ++it;
    }

    // Carry the tail so a needle split across chunks is still found
    std::size_t keep = std::min(window.size(), needle.size() - 1);
    window_start += window.size() - keep;
    window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(keep));
  }

  if (in.bad()) {
    throw MultipartError("Failed to read multipart body");
  }
  return positions;
}

// Parses the parameters of: form-data; name="field"; filename="file.mp4"
void parse_disposition(const std::string& value, MultipartPart& part) {
  std::size_t pos = value.find(';');
  while (pos != std::string::npos && pos < value.size()) {
    ++pos;
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
      ++pos;
    }

    std::size_t key_end = value.find_first_of("=;", pos);
    std::string key = to_lower(trim(value.substr(pos, key_end - pos)));
    if (key_end == std::string::npos || value[key_end] == ';') {
      pos = key_end;
      continue;
    }

    std::string param;
    pos = key_end + 1;
    if (pos < value.size() && value[pos] == '"') {
      // Quoted string, backslash escapes the next character
      ++pos;
      while (pos < value.size() && value[pos] != '"') {
        if (value[pos] == '\\' && pos + 1 < value.size()) {
          ++pos;
        }
        param += value[pos++];
      }
      pos = value.find(';', pos);
    } else {
      std::size_t end = value.find(';', pos);
      param = trim(value.substr(pos, end - pos));
      pos = end;
    }

    if (key == "name") {
      part.name = param;
    } else if (key == "filename") {
      part.filename = param;
    }
  }
}

void parse_headers(const std::string& block, MultipartPart& part) {
  std::size_t pos = 0;
  while (pos < block.size()) {
    std::size_t line_end = block.find("\r\n", pos);
    if (line_end == std::string::npos) {
      line_end = block.size();
    }
    std::string line = block.substr(pos, line_end - pos);
    pos = line_end + 2;

    std::size_t colon = line.find(':');
    if (colon == std::string::npos) {
      throw MultipartError("Malformed part header: " + line);
    }
    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));

    if (name == "content-disposition") {
      parse_disposition(value, part);
    } else if (name == "content-type") {
      part.content_type = value;
    }
  }
}

struct Delimiter {
  std::uint64_t start;  // where the preceding part body ends
  std::uint64_t end;    // first byte after the boundary text
};

} // namespace


//==============================================
// BOUNDARY
//==============================================

std::string boundary_from_content_type(const std::string& content_type) {
  std::size_t semicolon = content_type.find(';');
  if (to_lower(trim(content_type.substr(0, semicolon))) != "multipart/form-data") {
    throw MultipartError("Request is not multipart/form-data");
  }

  // Walk the parameters, the name must match exactly
  std::string boundary;
  bool found = false;
  std::size_t pos = semicolon;
  while (!found && pos != std::string::npos) {
    std::size_t start = pos + 1;
    std::size_t equals = content_type.find('=', start);
    std::size_t next = content_type.find(';', start);
    if (equals == std::string::npos || (next != std::string::npos && next < equals)) {
      pos = next;
      continue;
    }

    if (to_lower(trim(content_type.substr(start, equals - start))) != "boundary") {
      // Skip a quoted value, it may contain ';'
      std::size_t value_start = equals + 1;
      if (value_start < content_type.size() && content_type[value_start] == '"') {
        std::size_t close = content_type.find('"', value_start + 1);
        next = close == std::string::npos ? std::string::npos : content_type.find(';', close);
      }
      pos = next;
      continue;
    }

    // Take the value verbatim, the boundary is case sensitive
    boundary = content_type.substr(equals + 1);
    if (!boundary.empty() && boundary.front() == '"') {
      std::size_t close = boundary.find('"', 1);
      boundary = boundary.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
      boundary = trim(boundary.substr(0, boundary.find(';')));
    }
    found = true;
  }

  if (!found) {
    throw MultipartError("Missing multipart boundary");
  }
  if (boundary.empty() || boundary.size() > MAX_BOUNDARY_LENGTH) {
    throw MultipartError("Invalid multipart boundary");
  }
  return boundary;
}


//==============================================
// BODY SCANNING
//==============================================

std::vector<MultipartPart> scan_multipart(const std::filesystem::path& body_file,
                                          const std::string& boundary) {
  BOOST_LOG_TRIVIAL(debug) << "Multipart: Scanning " << body_file.string();

  std::ifstream in(body_file, std::ios::binary);
  if (!in) {
    throw MultipartError("Failed to open multipart body");
  }

  const std::string dash_boundary = "--" + boundary;
  const std::string delimiter = "\r\n" + dash_boundary;

  std::vector<Delimiter> delimiters;
  // The first boundary may open the body without a preceding CRLF
  if (read_at(in, 0, dash_boundary.size()) == dash_boundary) {
    delimiters.push_back({0, dash_boundary.size()});
  }
  for (std::uint64_t position : find_occurrences(in, delimiter)) {
    delimiters.push_back({position, position + delimiter.size()});
  }

  if (delimiters.empty()) {
    throw MultipartError("No multipart boundary found");
  }

  std::vector<MultipartPart> parts;
  for (std::size_t i = 0; i < delimiters.size(); ++i) {
    std::string block = read_at(in, delimiters[i].end, MAX_HEADER_BYTES);

    // Close delimiter: everything after it is epilogue
    if (block.compare(0, 2, "--") == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Multipart: Found " << parts.size() << " parts";
      return parts;
    }

    // Optional transport padding, then CRLF, then the header lines
    std::size_t line_end = block.find("\r\n");
    if (line_end == std::string::npos || !trim(block.substr(0, line_end)).empty()) {
      throw MultipartError("Malformed multipart boundary line");
    }

    std::size_t headers_start = line_end + 2;
    std::size_t body_start;
    MultipartPart part;
    if (block.compare(headers_start, 2, "\r\n") == 0) {
      body_start = headers_start + 2;
    } else {
      std::size_t headers_end = block.find("\r\n\r\n", headers_start);
      if (headers_end == std::string::npos) {
        throw MultipartError("Part headers unterminated or too long");
      }
      parse_headers(block.substr(headers_start, headers_end - headers_start), part);
      body_start = headers_end + 4;
    }

    if (i + 1 >= delimiters.size()) {
      throw MultipartError("Unterminated multipart body");
    }

    part.offset = delimiters[i].end + body_start;
    if (delimiters[i + 1].start < part.offset) {
      throw MultipartError("Malformed multipart part");
    }
    part.length = delimiters[i + 1].start - part.offset;
    parts.push_back(part);
  }

  throw MultipartError("Missing closing multipart boundary");
}

const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name) {
  auto it = std::find_if(parts.begin(), parts.end(),
                         [&name](const MultipartPart& part) { return part.name == name; });
  return it == parts.end() ? nullptr : &*it;
}

std::string read_part(const std::filesystem::path& body_file, const MultipartPart& part,
                      std::size_t max_size) {
  if (part.length > max_size) {
    throw MultipartError("Field " + part.name + " is too large");
  }

  PartStream stream(body_file, part.offset, part.length);
  std::string value(static_cast<std::size_t>(part.length), '\0');
  stream.read(&value[0], static_cast<std::streamsize>(value.size()));
  if (static_cast<std::uint64_t>(stream.gcount()) != part.length) {
    throw MultipartError("Failed to read field " + part.name);
  }
  return value;
}


//==============================================
// PART STREAM
//==============================================

PartStream::RangeBuffer::RangeBuffer(const std::filesystem::path& file, std::uint64_t offset,
                                     std::uint64_t length)
  : remaining_(length)
  , buffer_(BUFFER_SIZE) {
  if (file_.open(file.c_str(), std::ios::in | std::ios::binary)) {
    std::streampos position = file_.pubseekoff(static_cast<std::streamoff>(offset), std::ios::beg, std::ios::in);
    open_ = position == std::streampos(static_cast<std::streamoff>(offset));
  }
  if (!open_) {
    BOOST_LOG_TRIVIAL(error) << "Multipart: Failed to open part of " << file.string() << " at offset " << offset;
  }
}

PartStream::RangeBuffer::int_type PartStream::RangeBuffer::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }
  if (!open_ || remaining_ == 0) {
    return traits_type::eof();
  }

  std::size_t wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer_.size(), remaining_));
  std::streamsize got = file_.sgetn(buffer_.data(), static_cast<std::streamsize>(wanted));
  if (got <= 0) {
    // The istream turns this into badbit
    throw std::runtime_error("Multipart: File ended inside a part");
  }

  remaining_ -= static_cast<std::uint64_t>(got);
  setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
  return traits_type::to_int_type(*gptr());
}

PartStream::PartStream(const std::filesystem::path& file, std::uint64_t offset, std::uint64_t length)
  : std::istream(nullptr)
  , buffer_(file, offset, length) {
  rdbuf(&buffer_);
  if (!buffer_.is_open()) {
    setstate(std::ios::failbit);
  }
}

} // namespace web
} // namespace lutube
