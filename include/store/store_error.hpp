#ifndef DR_STORE_ERROR_HPP
#define DR_STORE_ERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace dr::store {

enum class ErrorKind {
    NotFound,
    PermissionDenied,
    Conflict,
    Ambiguous,
    IOError,
    Unrecognized
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "Not found";
        case ErrorKind::PermissionDenied: return "Permission denied";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::Ambiguous: return "Ambiguous";
        case ErrorKind::IOError: return "I/O error";
        case ErrorKind::Unrecognized: return "Unrecognized";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Maps an errno-style error code onto the store's error kinds
ErrorKind error_kind_from_code(const std::error_code& ec);

// Builds a StoreError from a failed filesystem call, keeping the OS message
StoreError make_store_error(const std::string& context, const std::error_code& ec);
StoreError make_store_error(const std::string& context,
                            const std::filesystem::filesystem_error& error);

} // namespace dr::store

#endif // DR_STORE_ERROR_HPP
