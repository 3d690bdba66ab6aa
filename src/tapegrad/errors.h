// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include "tapegrad/utils/vector.h"

namespace tapegrad {

// Base for every error raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Operation given incompatible dimensions.
class ShapeMismatchError : public Error {
public:
    explicit ShapeMismatchError(const std::string& msg) : Error(msg) {}

    ShapeMismatchError(const std::string& where, const std::vector<size_t>& lhs, const std::vector<size_t>& rhs)
        : Error(where + ": shape mismatch " + utils::vector::to_string(lhs) + " vs " + utils::vector::to_string(rhs)) {}
};

// Operation mixing tensors resident on different backends.
class BackendMismatchError : public Error {
public:
    explicit BackendMismatchError(const std::string& msg) : Error(msg) {}
};

// Backend could not satisfy a memory request.
class AllocationError : public Error {
public:
    explicit AllocationError(const std::string& msg) : Error(msg) {}
};

// Tape replayed (or recorded into) after it was consumed.
class TapeReuseError : public Error {
public:
    explicit TapeReuseError(const std::string& msg) : Error(msg) {}
};

// backward() called on a tensor with no recorded history.
class NonDifferentiableRootError : public Error {
public:
    explicit NonDifferentiableRootError(const std::string& msg) : Error(msg) {}
};

// Operation against a released or null descriptor.
class UseAfterFreeError : public Error {
public:
    explicit UseAfterFreeError(const std::string& msg) : Error(msg) {}
};

} // namespace tapegrad
