#include "store/id_allocator.hpp"
#include <array>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace lutube {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

IdAllocator::IdAllocator(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Id allocator: Initializing with root: " << root_.string();

  // A root that cannot be created here surfaces as AllocationFailed on first use
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Id allocator: Could not create root " << root_.string()
                               << ": " << ec.message();
  }
}


//==============================================
// ALLOCATION
//==============================================

std::string IdAllocator::allocate() const {
  for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
    std::string id = generate_candidate();
    std::filesystem::path slot = root_ / id;

    // mkdir is the exclusive-create primitive: exactly one caller can create a given name
    std::error_code ec;
    bool created = std::filesystem::create_directory(slot, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Id allocator: Failed to create slot " << slot.string()
                               << ": " << ec.message();
      throw AllocationFailed("Failed to create slot " + slot.string() + ": " + ec.message());
    }

    if (created) {
      BOOST_LOG_TRIVIAL(info) << "Id allocator: Reserved slot " << id;
      return id;
    }

    BOOST_LOG_TRIVIAL(warning) << "Id allocator: Slot " << id << " already exists, drawing again";
  }

  BOOST_LOG_TRIVIAL(error) << "Id allocator: Namespace exhausted after " << MAX_ATTEMPTS << " attempts";
  throw AllocationFailed("Namespace exhausted under " + root_.string());
}


//==============================================
// ID GENERATION
//==============================================

std::string IdAllocator::generate_candidate() const {
  std::array<unsigned char, ID_BYTES> bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    BOOST_LOG_TRIVIAL(error) << "Id allocator: Random source failure: " << reason;
    throw AllocationFailed(std::string("Random source failure: ") + reason);
  }

  // Hex encode, two characters per byte
  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace store
} // namespace lutube
