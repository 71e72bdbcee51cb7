/// @file error.hpp
/// @brief Error types for the ledgersync library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ledgersync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    key_derivation,      ///< A master key could not be derived (missing password).
    decryption,          ///< An encrypted payload failed authentication.
    unsupported_schema,  ///< An unknown dataset or column was encountered.
    transport,           ///< The relay or key registry could not be reached.
    decoding_error,      ///< A wire payload is malformed or corrupt.
    clock_overflow,      ///< The logical counter ran past its 16-bit range.
    store_error,         ///< The local store rejected an operation.
    invalid_operation,   ///< An operation is invalid in the current state.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::key_derivation:     return "key_derivation";
        case ErrorKind::decryption:         return "decryption";
        case ErrorKind::unsupported_schema: return "unsupported_schema";
        case ErrorKind::transport:          return "transport";
        case ErrorKind::decoding_error:     return "decoding_error";
        case ErrorKind::clock_overflow:     return "clock_overflow";
        case ErrorKind::store_error:        return "store_error";
        case ErrorKind::invalid_operation:  return "invalid_operation";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Thrown by every fallible public operation. The typed subclasses
/// below exist so callers can catch one category without inspecting
/// kind().
class Error : public std::runtime_error {
public:
    /// Construct an Error with the given kind and message.
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    /// The category of this error.
    auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

/// Bad or missing password for an encrypted replica.
class KeyDerivationError : public Error {
public:
    explicit KeyDerivationError(const std::string& message)
        : Error{ErrorKind::key_derivation, message} {}
};

/// Authentication tag did not verify: wrong key, tampered payload or
/// mismatched key id. The sync round must be restarted from scratch.
class DecryptionError : public Error {
public:
    explicit DecryptionError(const std::string& message)
        : Error{ErrorKind::decryption, message} {}
};

/// Unknown dataset or column; indicates a replica/schema version mismatch.
class UnsupportedSchemaError : public Error {
public:
    explicit UnsupportedSchemaError(const std::string& message)
        : Error{ErrorKind::unsupported_schema, message} {}
};

/// Relay failure, reported to the caller uninterpreted.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error{ErrorKind::transport, message} {}
};

/// Malformed change-set payload.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error{ErrorKind::decoding_error, message} {}
};

/// Logical counter overflow.
class ClockError : public Error {
public:
    explicit ClockError(const std::string& message)
        : Error{ErrorKind::clock_overflow, message} {}
};

/// Failure inside a LocalStore implementation.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message)
        : Error{ErrorKind::store_error, message} {}
};

}  // namespace ledgersync
