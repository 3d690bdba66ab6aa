// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cstddef>
#include <memory>
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/dtype.h"

namespace tapegrad {
namespace backend {

// Forward declaration.
class Allocator;

// One physical allocation. Only ever held through std::shared_ptr, so the
// allocator is notified exactly once, when the last reference drops.
class Buffer {
public:
    Buffer(void* ptr, size_t size_bytes, DType dtype, DeviceType device, Allocator* allocator);
    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) = delete;
    Buffer& operator=(Buffer&&) = delete;

    void* data() const { return _ptr; }
    size_t size_bytes() const { return _size_bytes; }
    size_t numel() const { return _size_bytes == 0 ? 0 : _size_bytes / size(_dtype); }
    DType dtype() const { return _dtype; }
    DeviceType device_type() const { return _device; }
    Allocator* allocator() const { return _allocator; }

private:
    void*      _ptr;
    size_t     _size_bytes;
    DType      _dtype;
    DeviceType _device;
    Allocator* _allocator;
};

} // namespace backend
} // namespace tapegrad
