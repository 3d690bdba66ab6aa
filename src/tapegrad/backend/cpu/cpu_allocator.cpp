// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <new>
#include <cstdint>
#include <cstring>
#include "tapegrad/backend/cpu/cpu_allocator.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {
namespace backend {
namespace cpu {

CPUAllocator::CPUAllocator(DeviceType residency) : _residency(residency) {
    if (!is_host_resident(residency)) {
        throw Error(std::string("CPUAllocator: ") + to_string(residency) + " is not host resident");
    }
}

std::shared_ptr<Buffer> CPUAllocator::allocate(size_t num_elements, DType dtype) {
    const size_t item = size(dtype);
    if (item == 0) throw Error("CPUAllocator::allocate: unsupported dtype");
    if (num_elements != 0 && num_elements > SIZE_MAX / item) {
        throw AllocationError(std::string(to_string(_residency)) + " allocator: element count overflows");
    }
    const size_t bytes = num_elements * item;

    reserve(bytes, to_string(_residency));
    void* ptr = nullptr;
    if (bytes != 0) {
        ptr = ::operator new(bytes, std::nothrow);
        if (!ptr) {
            unreserve(bytes);
            TAPEGRAD_LOG_ERROR(to_string(_residency) << " allocator: out of memory for " << bytes << " bytes");
            throw AllocationError(std::string(to_string(_residency)) + " allocator: out of memory for " + std::to_string(bytes) + " bytes");
        }
    }
    try {
        return std::make_shared<Buffer>(ptr, bytes, dtype, _residency, this);
    } catch (const std::bad_alloc&) {
        ::operator delete(ptr);
        unreserve(bytes);
        throw AllocationError(std::string(to_string(_residency)) + " allocator: out of memory for buffer header");
    }
}

std::shared_ptr<Buffer> CPUAllocator::allocate(const void* src, size_t num_elements, DType dtype) {
    auto buffer = allocate(num_elements, dtype);
    if (src && buffer->data()) {
        std::memcpy(buffer->data(), src, buffer->size_bytes());
    }
    return buffer;
}

void CPUAllocator::deallocate(void* ptr, size_t size_bytes) {
    ::operator delete(ptr);
    unreserve(size_bytes);
}

// Device -> Host
void CPUAllocator::copy_device_to_host(void* host_dst, const Buffer& device_src) const {
    if (device_src.size_bytes() == 0) return;
    if (!is_host_resident(device_src.device_type())) {
        throw BackendMismatchError("CPUAllocator::copy_device_to_host: src is not a host buffer");
    }
    std::memcpy(host_dst, device_src.data(), device_src.size_bytes());
}

// Host -> Device
void CPUAllocator::copy_host_to_device(Buffer& device_dst, const void* host_src) const {
    if (device_dst.size_bytes() == 0) return;
    if (!is_host_resident(device_dst.device_type())) {
        throw BackendMismatchError("CPUAllocator::copy_host_to_device: dst is not a host buffer");
    }
    std::memcpy(device_dst.data(), host_src, device_dst.size_bytes());
}

// Device -> Device (both host resident)
void CPUAllocator::copy_device_to_device(Buffer& device_dst, const Buffer& device_src) const {
    if (device_src.size_bytes() == 0) return;
    if (!is_host_resident(device_dst.device_type()) || !is_host_resident(device_src.device_type())) {
        throw BackendMismatchError("CPUAllocator::copy_device_to_device: src and dst must both be host buffers");
    }
    if (device_dst.size_bytes() != device_src.size_bytes()) {
        throw Error("CPUAllocator::copy_device_to_device: size mismatch");
    }
    std::memcpy(device_dst.data(), device_src.data(), device_src.size_bytes());
}

} // namespace cpu
} // namespace backend
} // namespace tapegrad
