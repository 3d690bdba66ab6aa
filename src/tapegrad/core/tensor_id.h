// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <atomic>
#include <cstdint>

namespace tapegrad {
namespace core {

// Process-unique tensor identity. Tape entries and gradient stores key on
// this, never on handles.
using TensorId = uint64_t;

// Monotonically increasing, starting at 1 (0 is never issued).
inline TensorId next_tensor_id() {
    static std::atomic<TensorId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace core
} // namespace tapegrad
