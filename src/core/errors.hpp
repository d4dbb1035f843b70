// File: src/core/errors.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace modelstore {

// ErrorKind: classification of every failure surfaced by the store
enum class ErrorKind : uint8_t {
    NOT_FOUND = 0,     // item, session, unit, region or code does not exist
    PRECONDITION = 1,  // e.g. write without check out, check out of a solved scenario
    VALIDATION = 2,    // malformed arguments, mismatched lengths, duplicates
    ENGINE = 3,        // the storage engine or its connection failed
    UNSUPPORTED = 4,   // operation not available on this backend
    REFERENCE = 5,     // the owning Platform no longer exists
};

// Convert ErrorKind to string
const char* ToString(ErrorKind kind);

/// Base class of all errors raised by the store
class ModelStoreError : public std::runtime_error {
public:
    ModelStoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public ModelStoreError {
public:
    explicit NotFoundError(const std::string& message)
        : ModelStoreError(ErrorKind::NOT_FOUND, message) {}
};

class PreconditionError : public ModelStoreError {
public:
    explicit PreconditionError(const std::string& message)
        : ModelStoreError(ErrorKind::PRECONDITION, message) {}
};

class ValidationError : public ModelStoreError {
public:
    explicit ValidationError(const std::string& message)
        : ModelStoreError(ErrorKind::VALIDATION, message) {}
};

/// Failure of the underlying storage engine, wrapped with context
class EngineError : public ModelStoreError {
public:
    explicit EngineError(const std::string& message)
        : ModelStoreError(ErrorKind::ENGINE, message) {}
};

class UnsupportedError : public ModelStoreError {
public:
    explicit UnsupportedError(const std::string& message)
        : ModelStoreError(ErrorKind::UNSUPPORTED, message) {}
};

/// Raised by a session handle whose Platform has been destroyed
class ReferenceError : public ModelStoreError {
public:
    explicit ReferenceError(const std::string& message)
        : ModelStoreError(ErrorKind::REFERENCE, message) {}
};

} // namespace modelstore
