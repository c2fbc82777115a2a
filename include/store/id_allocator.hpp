#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "store/store_error.hpp"

namespace lutube {
namespace store {

// Mints video ids by reserving a fresh slot directory under the store root.
// Uniqueness comes from the exclusive mkdir alone, so instances need no locking
// and any number of processes may allocate against the same root.
class IdAllocator {
public:

  // ---- CONSTRUCTOR ----
  explicit IdAllocator(const std::filesystem::path& root);


  // ---- ALLOCATION ----
  // Creates an empty slot and returns its name. Throws AllocationFailed.
  std::string allocate() const;


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  // 128 bits of randomness per id
  static constexpr std::size_t ID_BYTES = 16;
  // Collisions before the namespace is considered exhausted
  static constexpr int MAX_ATTEMPTS = 64;

  std::filesystem::path root_;


  // ---- ID GENERATION ----
  // Draws a candidate name from the OpenSSL random source
  std::string generate_candidate() const;
};

} // namespace store
} // namespace lutube
