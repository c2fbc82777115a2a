#include "store/video_store.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace lutube {
namespace store {

namespace {

//==============================================
// RAII WRAPPER TO MANAGE FILE DESCRIPTOR LIFECYCLE
//==============================================

struct FileDescriptor {
  int fd = -1;

  explicit FileDescriptor(int descriptor) : fd(descriptor) {}

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  // Close on every exit path that did not close explicitly
  ~FileDescriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  // close() may report a deferred write error, so the happy path checks it
  int close() {
    int result = ::close(fd);
    fd = -1;
    return result;
  }

  int get() const { return fd; }
};

std::string errno_message(int err) {
  return std::system_category().message(err);
}

void write_all(int fd, const char* data, std::size_t length, const std::filesystem::path& path) {
  while (length > 0) {
    ssize_t written = ::write(fd, data, length);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw WriteFailed("Failed to write " + path.string() + ": " + errno_message(errno));
    }
    data += written;
    length -= static_cast<std::size_t>(written);
  }
}

// Makes a rename inside dir durable
void sync_directory(const std::filesystem::path& dir) {
  FileDescriptor handle(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (handle.get() < 0) {
    throw WriteFailed("Failed to open directory " + dir.string() + ": " + errno_message(errno));
  }
  if (::fsync(handle.get()) != 0) {
    throw WriteFailed("Failed to sync directory " + dir.string() + ": " + errno_message(errno));
  }
}

void discard_part(const std::filesystem::path& part) {
  std::error_code ec;
  std::filesystem::remove(part, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Video store: Could not remove partial file "
                               << part.string() << ": " << ec.message();
  }
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

VideoStore::VideoStore(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Video store: Initializing store with root: " << root_.string();

  // Failures here are reported by the operations that need the root
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Video store: Could not create root " << root_.string()
                               << ": " << ec.message();
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void VideoStore::save(const std::string& id, const std::string& title, std::istream& payload) {
  BOOST_LOG_TRIVIAL(info) << "Video store: Saving video " << id;

  if (!is_valid_id(id)) {
    BOOST_LOG_TRIVIAL(error) << "Video store: Refusing to save invalid id: " << id;
    throw WriteFailed("Invalid id: " + id);
  }

  std::filesystem::path slot = slot_path(id);
  std::error_code ec;
  if (!std::filesystem::is_directory(slot, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Video store: No reserved slot for id: " << id;
    throw WriteFailed("No reserved slot for id: " + id);
  }

  if (!payload.good()) {
    BOOST_LOG_TRIVIAL(error) << "Video store: Invalid payload stream provided for id: " << id;
    throw WriteFailed("Invalid payload stream for id: " + id);
  }

  // Payload first: metadata must never point at an incomplete blob
  std::uintmax_t payload_bytes = 0;
  std::filesystem::path payload_part = stage_file(slot / PAYLOAD_FILE, payload, payload_bytes);

  // A re-save must not pair the old title with the new payload
  try {
    retract_metadata(slot);
    commit_file(payload_part, slot / PAYLOAD_FILE);
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Video store: " << e.what();
    discard_part(payload_part);
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "Video store: Payload of " << id << " committed, " << payload_bytes << " bytes";

  // A failure from here on leaves the payload orphaned
  std::istringstream metadata(title);
  write_file(slot / METADATA_FILE, metadata);

  BOOST_LOG_TRIVIAL(info) << "Video store: Successfully saved video " << id
                          << " (" << payload_bytes << " bytes)";
}

std::string VideoStore::load(const std::string& id) const {
  BOOST_LOG_TRIVIAL(debug) << "Video store: Loading metadata for id: " << id;

  if (!is_valid_id(id)) {
    throw NotFound("Invalid id: " + id);
  }

  std::filesystem::path metadata_path = slot_path(id) / METADATA_FILE;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(metadata_path, ec)) {
    throw NotFound("No metadata for id: " + id);
  }

  std::ifstream file(metadata_path, std::ios::binary);
  if (!file) {
    throw NotFound("Failed to open metadata for id: " + id);
  }

  std::string title;
  char buffer[4096];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    title.append(buffer, static_cast<std::size_t>(file.gcount()));
  }

  if (file.bad()) {
    throw NotFound("Unreadable metadata for id: " + id);
  }
  return title;
}

std::vector<Video> VideoStore::enumerate() const {
  BOOST_LOG_TRIVIAL(debug) << "Video store: Enumerating videos under " << root_.string();

  std::vector<Video> videos;
  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::string id = it->path().filename().string();
    try {
      videos.push_back(Video{id, load(id)});
    } catch (const NotFound& e) {
      // One bad slot must not hide the rest of the catalog
      BOOST_LOG_TRIVIAL(debug) << "Video store: Skipping slot " << id << ": " << e.what();
    }
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Video store: Failed to list " << root_.string() << ": " << ec.message();
    throw EnumerationFailed("Failed to list " + root_.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Video store: Enumerated " << videos.size() << " videos";
  return videos;
}


//==============================================
// PAYLOAD ACCESS
//==============================================

std::filesystem::path VideoStore::payload_path(const std::string& id) const {
  verify_committed(id);
  return slot_path(id) / PAYLOAD_FILE;
}

std::uintmax_t VideoStore::read_payload(const std::string& id, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(info) << "Video store: Reading payload of " << id;

  std::filesystem::path path = payload_path(id);
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw NotFound("Failed to open payload of id: " + id);
  }

  std::vector<char> buffer(BUFFER_SIZE);
  std::uintmax_t total_bytes = 0;

  // Read in chunks, the final partial chunk included
  while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
    output.write(buffer.data(), file.gcount());
    total_bytes += static_cast<std::uintmax_t>(file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Video store: Read of " << path.string() << " failed after "
                             << total_bytes << " bytes";
    throw NotFound("Unreadable payload for id: " + id);
  }
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Video store: Output stream failed while copying payload of " << id;
    throw WriteFailed("Failed to copy payload of " + id + " to output");
  }

  BOOST_LOG_TRIVIAL(debug) << "Video store: Streamed " << total_bytes << " bytes of " << id;
  return total_bytes;
}

std::uintmax_t VideoStore::payload_size(const std::string& id) const {
  std::filesystem::path path = payload_path(id);
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw NotFound("No payload for id " + id + ": " + ec.message());
  }
  return size;
}


//==============================================
// INTEGRITY INSPECTION
//==============================================

SlotState VideoStore::inspect(const std::string& id) const {
  if (!is_valid_id(id)) {
    return SlotState::MISSING;
  }

  std::filesystem::path slot = slot_path(id);
  std::error_code ec;
  if (!std::filesystem::is_directory(slot, ec)) {
    return SlotState::MISSING;
  }

  bool has_metadata = std::filesystem::is_regular_file(slot / METADATA_FILE, ec);
  bool has_payload = std::filesystem::is_regular_file(slot / PAYLOAD_FILE, ec);

  if (has_metadata && has_payload) {
    return SlotState::COMPLETE;
  }
  if (has_metadata) {
    return SlotState::MISSING_PAYLOAD;
  }
  if (has_payload) {
    return SlotState::ORPHANED_PAYLOAD;
  }
  return SlotState::RESERVED;
}

Video VideoStore::verify(const std::string& id) const {
  SlotState state = inspect(id);
  switch (state) {
    case SlotState::COMPLETE:
      return Video{id, load(id)};
    case SlotState::ORPHANED_PAYLOAD:
    case SlotState::MISSING_PAYLOAD:
      BOOST_LOG_TRIVIAL(warning) << "Video store: Slot " << id << " is corrupt: " << slot_state_to_string(state);
      throw Corrupt("Slot " + id + " has " + slot_state_to_string(state));
    default:
      throw NotFound("No video with id: " + id);
  }
}

std::vector<std::string> VideoStore::slots() const {
  std::vector<std::string> names;
  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }

  if (ec) {
    throw EnumerationFailed("Failed to list " + root_.string() + ": " + ec.message());
  }
  return names;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool VideoStore::is_valid_id(const std::string& id) {
  if (id.empty() || id.front() == '.') {
    return false;
  }
  return id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}


//==============================================
// DURABLE WRITES
//==============================================

std::filesystem::path VideoStore::stage_file(const std::filesystem::path& target, std::istream& source,
                                            std::uintmax_t& bytes_written) const {
  std::filesystem::path part = target;
  part += PART_SUFFIX;

  FileDescriptor file(::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (file.get() < 0) {
    std::string reason = errno_message(errno);
    BOOST_LOG_TRIVIAL(error) << "Video store: Failed to create file " << part.string() << ": " << reason;
    throw WriteFailed("Failed to create file " + part.string() + ": " + reason);
  }

  bytes_written = 0;
  try {
    std::vector<char> buffer(BUFFER_SIZE);

    // Copy in chunks until the source is exhausted, the final partial chunk included
    while (source.read(buffer.data(), buffer.size()) || source.gcount() > 0) {
      write_all(file.get(), buffer.data(), static_cast<std::size_t>(source.gcount()), part);
      bytes_written += static_cast<std::uintmax_t>(source.gcount());
    }

    // eof alone is the normal end; bad means the source broke mid-stream
    if (source.bad()) {
      throw WriteFailed("Source stream failed after " + std::to_string(bytes_written) +
                        " bytes for " + target.string());
    }

    if (::fsync(file.get()) != 0) {
      throw WriteFailed("Failed to sync " + part.string() + ": " + errno_message(errno));
    }
    if (file.close() != 0) {
      throw WriteFailed("Failed to close " + part.string() + ": " + errno_message(errno));
    }
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Video store: " << e.what();
    discard_part(part);
    throw;
  } catch (const std::exception& e) {
    // Streams with an exception mask throw ios_base::failure from read()
    BOOST_LOG_TRIVIAL(error) << "Video store: Write of " << target.string() << " aborted: " << e.what();
    discard_part(part);
    throw WriteFailed("Write of " + target.string() + " aborted: " + e.what());
  }

  return part;
}

void VideoStore::commit_file(const std::filesystem::path& part, const std::filesystem::path& target) const {
  std::error_code ec;
  std::filesystem::rename(part, target, ec);
  if (ec) {
    throw WriteFailed("Failed to commit " + target.string() + ": " + ec.message());
  }
  sync_directory(target.parent_path());
}

std::uintmax_t VideoStore::write_file(const std::filesystem::path& target, std::istream& source) const {
  std::uintmax_t bytes_written = 0;
  std::filesystem::path part = stage_file(target, source, bytes_written);

  try {
    commit_file(part, target);
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Video store: " << e.what();
    discard_part(part);
    throw;
  }
  return bytes_written;
}

void VideoStore::retract_metadata(const std::filesystem::path& slot) const {
  std::error_code ec;
  if (!std::filesystem::remove(slot / METADATA_FILE, ec)) {
    if (ec) {
      throw WriteFailed("Failed to retract " + (slot / METADATA_FILE).string() + ": " + ec.message());
    }
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Video store: Retracted metadata of " << slot.filename().string();
  sync_directory(slot);
}


//==============================================
// UTILITY METHODS
//==============================================

void VideoStore::verify_committed(const std::string& id) const {
  if (!is_valid_id(id)) {
    throw NotFound("Invalid id: " + id);
  }

  std::filesystem::path slot = slot_path(id);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(slot / METADATA_FILE, ec)) {
    throw NotFound("No video with id: " + id);
  }
  if (!std::filesystem::is_regular_file(slot / PAYLOAD_FILE, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "Video store: Video " << id << " has metadata but no payload";
    throw NotFound("No payload for id: " + id);
  }
}

} // namespace store
} // namespace lutube
