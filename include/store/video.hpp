#ifndef LUTUBE_STORE_VIDEO_HPP
#define LUTUBE_STORE_VIDEO_HPP

#include <string>

namespace lutube {
namespace store {

// Catalog entry. The payload bytes stay in the store and are reached through the id.
struct Video {
  std::string id;
  std::string title;
};

inline bool operator==(const Video& lhs, const Video& rhs) {
  return lhs.id == rhs.id && lhs.title == rhs.title;
}

// Condition of a slot on disk, as reported by VideoStore::inspect
enum class SlotState {
  MISSING,
  RESERVED,
  COMPLETE,
  ORPHANED_PAYLOAD,
  MISSING_PAYLOAD
};

inline const char* slot_state_to_string(SlotState state) {
  switch (state) {
    case SlotState::MISSING: return "missing";
    case SlotState::RESERVED: return "reserved";
    case SlotState::COMPLETE: return "complete";
    case SlotState::ORPHANED_PAYLOAD: return "orphaned payload";
    case SlotState::MISSING_PAYLOAD: return "missing payload";
    default: return "unknown";
  }
}

} // namespace store
} // namespace lutube

#endif // LUTUBE_STORE_VIDEO_HPP
