// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "tapegrad/errors.h"
#include "tapegrad/backend/dtype.h"

namespace tapegrad {
namespace backend {

class Buffer;

// Owns the physical memory of one device. Implementations must be safe to
// call from several threads at once.
class Allocator {
public:
    virtual ~Allocator() = default;

    // Throws AllocationError when the request cannot be satisfied.
    virtual std::shared_ptr<Buffer> allocate(size_t num_elements, DType dtype) = 0;
    virtual std::shared_ptr<Buffer> allocate(const void* src, size_t num_elements, DType dtype) = 0;

    // Called exactly once per buffer, from ~Buffer.
    virtual void deallocate(void* ptr, size_t size_bytes) = 0;

    virtual void copy_device_to_host(void* host_dst, const Buffer& device_src) const = 0;
    virtual void copy_host_to_device(Buffer& device_dst, const void* host_src) const = 0;
    virtual void copy_device_to_device(Buffer& device_dst, const Buffer& device_src) const = 0;

    // 0 = unlimited.
    void set_capacity_limit(size_t bytes) noexcept { _capacity_limit.store(bytes, std::memory_order_release); }
    size_t capacity_limit() const noexcept { return _capacity_limit.load(std::memory_order_acquire); }

    // Live allocation accounting.
    size_t live_buffers() const noexcept { return _live_buffers.load(std::memory_order_acquire); }
    size_t bytes_in_use() const noexcept { return _bytes_in_use.load(std::memory_order_acquire); }
    size_t peak_bytes() const noexcept { return _peak_bytes.load(std::memory_order_acquire); }

protected:
    // Accounts for a new buffer before the memory is obtained. Throws
    // AllocationError past the capacity limit.
    void reserve(size_t size_bytes, const char* device_name) {
        const size_t limit = capacity_limit();
        size_t cur = _bytes_in_use.load(std::memory_order_relaxed);
        for (;;) {
            if (limit != 0 && cur + size_bytes > limit) {
                throw AllocationError(std::string(device_name) + " allocator: request of " + std::to_string(size_bytes) +
                                      " bytes exceeds capacity (" + std::to_string(cur) + " of " + std::to_string(limit) + " bytes in use)");
            }
            if (_bytes_in_use.compare_exchange_weak(cur, cur + size_bytes, std::memory_order_acq_rel)) break;
        }
        _live_buffers.fetch_add(1, std::memory_order_acq_rel);
        const size_t now = cur + size_bytes;
        size_t peak = _peak_bytes.load(std::memory_order_relaxed);
        while (now > peak && !_peak_bytes.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {}
    }

    // Undo of reserve(); also used when the underlying allocation fails.
    void unreserve(size_t size_bytes) noexcept {
        _live_buffers.fetch_sub(1, std::memory_order_acq_rel);
        _bytes_in_use.fetch_sub(size_bytes, std::memory_order_acq_rel);
    }

private:
    std::atomic<size_t> _capacity_limit{0};
    std::atomic<size_t> _live_buffers{0};
    std::atomic<size_t> _bytes_in_use{0};
    std::atomic<size_t> _peak_bytes{0};
};

} // namespace backend
} // namespace tapegrad
