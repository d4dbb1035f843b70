// File: src/core/errors.cpp
#include "core/errors.hpp"

namespace modelstore {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::PRECONDITION: return "PRECONDITION";
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::ENGINE: return "ENGINE";
        case ErrorKind::UNSUPPORTED: return "UNSUPPORTED";
        case ErrorKind::REFERENCE: return "REFERENCE";
    }
    return "UNKNOWN";
}

} // namespace modelstore
