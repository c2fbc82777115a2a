#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "store/store_error.hpp"
#include "store/video.hpp"

namespace lutube {
namespace store {

// Filesystem video store. Each video lives in its own slot directory:
//   {root}/{id}/video.mp4      payload blob
//   {root}/{id}/videodata.txt  title, stored verbatim
//
// save() writes the payload first and the metadata second, each through a
// fsynced temporary file renamed into place. The metadata file is therefore
// the commit marker: when it exists the payload is complete.
//
// The store holds no state besides its root and may be shared between threads.
class VideoStore {
public:
  static constexpr const char* PAYLOAD_FILE = "video.mp4";
  static constexpr const char* METADATA_FILE = "videodata.txt";
  static constexpr const char* PART_SUFFIX = ".part";

  // ---- CONSTRUCTOR ----
  explicit VideoStore(const std::filesystem::path& root);


  // ---- CORE STORAGE OPERATIONS ----
  // Streams the payload into the slot, then commits the title. Throws WriteFailed.
  void save(const std::string& id, const std::string& title, std::istream& payload);
  // Returns the committed title of a video. Throws NotFound.
  std::string load(const std::string& id) const;
  // Lists every slot with readable metadata, unordered. Unreadable slots are skipped.
  // Throws EnumerationFailed only when the root itself cannot be listed.
  std::vector<Video> enumerate() const;


  // ---- PAYLOAD ACCESS ----
  // Location of a committed video's payload. Throws NotFound.
  std::filesystem::path payload_path(const std::string& id) const;
  // Copies the payload of a committed video to output, returns the byte count
  std::uintmax_t read_payload(const std::string& id, std::ostream& output) const;
  std::uintmax_t payload_size(const std::string& id) const;


  // ---- INTEGRITY INSPECTION ----
  SlotState inspect(const std::string& id) const;
  // Returns the video if its slot is complete. Throws NotFound or Corrupt.
  Video verify(const std::string& id) const;
  // Raw slot names under the root, unordered
  std::vector<std::string> slots() const;


  // ---- QUERY OPERATIONS ----
  // Rejects names that could escape the root or collide with hidden files
  static bool is_valid_id(const std::string& id);
  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

  // Root path for all slots
  std::filesystem::path root_;


  // ---- DURABLE WRITES ----
  // Copies source into target.part and fsyncs it. Returns the part path and byte count.
  // The part file is removed on failure.
  std::filesystem::path stage_file(const std::filesystem::path& target, std::istream& source,
                                   std::uintmax_t& bytes_written) const;
  // Renames a staged part over target and fsyncs the directory
  void commit_file(const std::filesystem::path& part, const std::filesystem::path& target) const;
  // stage_file followed by commit_file
  std::uintmax_t write_file(const std::filesystem::path& target, std::istream& source) const;
  // Removes the commit marker of a slot so a half-finished re-save reads as orphaned
  void retract_metadata(const std::filesystem::path& slot) const;


  // ---- UTILITY METHODS ----
  std::filesystem::path slot_path(const std::string& id) const { return root_ / id; }
  // Throws NotFound unless the metadata and payload of id are both present
  void verify_committed(const std::string& id) const;
};

} // namespace store
} // namespace lutube
