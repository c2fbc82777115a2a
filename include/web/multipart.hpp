#ifndef LUTUBE_WEB_MULTIPART_HPP
#define LUTUBE_WEB_MULTIPART_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lutube {
namespace web {

class MultipartError : public std::runtime_error {
public:
  explicit MultipartError(const std::string& message) : std::runtime_error(message) {}
};

// One part of a multipart/form-data body. The body bytes are not loaded, only
// located: they span [offset, offset + length) of the spooled request body.
struct MultipartPart {
  std::string name;
  std::string filename;
  std::string content_type;
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

// Extracts the boundary parameter of a multipart/form-data Content-Type value
std::string boundary_from_content_type(const std::string& content_type);

// Locates every part of the multipart body stored in body_file.
// Throws MultipartError for a malformed body.
std::vector<MultipartPart> scan_multipart(const std::filesystem::path& body_file,
                                          const std::string& boundary);

// Returns the first part with the given field name, or nullptr
const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name);

// Loads a small part (a text field) into memory. Throws MultipartError past max_size.
std::string read_part(const std::filesystem::path& body_file, const MultipartPart& part,
                      std::size_t max_size);

// Input stream over one byte range of a file. Reading past the end of a file
// that is shorter than the range sets badbit.
class PartStream : public std::istream {
public:
  PartStream(const std::filesystem::path& file, std::uint64_t offset, std::uint64_t length);

private:
  class RangeBuffer : public std::streambuf {
  public:
    RangeBuffer(const std::filesystem::path& file, std::uint64_t offset, std::uint64_t length);
    bool is_open() const { return open_; }

  protected:
    int_type underflow() override;

  private:
    static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

    std::filebuf file_;
    std::uint64_t remaining_;
    std::vector<char> buffer_;
    bool open_{false};
  };

  RangeBuffer buffer_;
};

} // namespace web
} // namespace lutube

#endif // LUTUBE_WEB_MULTIPART_HPP
