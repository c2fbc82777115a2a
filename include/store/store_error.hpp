#ifndef LUTUBE_STORE_ERROR_HPP
#define LUTUBE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace lutube {
namespace store {

enum class StoreErrc {
    ALLOCATION_FAILED,
    WRITE_FAILED,
    NOT_FOUND,
    ENUMERATION_FAILED,
    CORRUPT
};

inline const char* store_errc_to_string(StoreErrc code) {
    switch (code) {
        case StoreErrc::ALLOCATION_FAILED: return "Allocation failed";
        case StoreErrc::WRITE_FAILED: return "Write failed";
        case StoreErrc::NOT_FOUND: return "Not found";
        case StoreErrc::ENUMERATION_FAILED: return "Enumeration failed";
        case StoreErrc::CORRUPT: return "Corrupt";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrc code, const std::string& message)
        : std::runtime_error(std::string(store_errc_to_string(code)) + ": " + message)
        , code_(code) {}

    StoreErrc code() const noexcept { return code_; }

private:
    StoreErrc code_;
};

class AllocationFailed : public StoreError {
public:
    explicit AllocationFailed(const std::string& message)
        : StoreError(StoreErrc::ALLOCATION_FAILED, message) {}
};

class WriteFailed : public StoreError {
public:
    explicit WriteFailed(const std::string& message)
        : StoreError(StoreErrc::WRITE_FAILED, message) {}
};

class NotFound : public StoreError {
public:
    explicit NotFound(const std::string& message)
        : StoreError(StoreErrc::NOT_FOUND, message) {}
};

class EnumerationFailed : public StoreError {
public:
    explicit EnumerationFailed(const std::string& message)
        : StoreError(StoreErrc::ENUMERATION_FAILED, message) {}
};

class Corrupt : public StoreError {
public:
    explicit Corrupt(const std::string& message)
        : StoreError(StoreErrc::CORRUPT, message) {}
};

} // namespace store
} // namespace lutube

#endif // LUTUBE_STORE_ERROR_HPP
