// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/backend/buffer.h"
#include "tapegrad/backend/allocator.h"

namespace tapegrad {
namespace backend {

Buffer::Buffer(void* data, size_t size_bytes, DType dtype, DeviceType device, Allocator* allocator)
    : _ptr(data), _size_bytes(size_bytes), _dtype(dtype), _device(device), _allocator(allocator) {}

Buffer::~Buffer() {
    if (_allocator) {
        _allocator->deallocate(_ptr, _size_bytes);
    }
}

} // namespace backend
} // namespace tapegrad
