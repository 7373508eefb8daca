#pragma once
#include <stdexcept>
#include <string>

namespace engram {

// Base for all errors raised by the memory core.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Lookup miss (unknown entry id, thread id or name, link id).
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Missing or invalid required field.
class ValidationError : public Error {
public:
    using Error::Error;
};

// Similarity index, relational index or shared-state file unreachable.
class BackendUnavailableError : public Error {
public:
    using Error::Error;
};

// Entity changed underneath the caller (double supersession, racing continue).
class ConcurrentModificationError : public Error {
public:
    using Error::Error;
};

} // namespace engram
