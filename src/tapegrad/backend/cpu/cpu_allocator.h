// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include "tapegrad/backend/allocator.h"
#include "tapegrad/backend/device.h"

namespace tapegrad {
namespace backend {
namespace cpu {

// Host heap allocator. Shared by every host-resident device; `residency`
// tags the buffers it hands out (CPU or BLAS).
class CPUAllocator : public Allocator {
public:
    explicit CPUAllocator(DeviceType residency = DeviceType::CPU);

    std::shared_ptr<Buffer> allocate(size_t num_elements, DType dtype) override;
    std::shared_ptr<Buffer> allocate(const void* src, size_t num_elements, DType dtype) override;
    void deallocate(void* ptr, size_t size_bytes) override;

    void copy_device_to_host(void* host_dst, const Buffer& device_src) const override;
    void copy_host_to_device(Buffer& device_dst, const void* host_src) const override;
    void copy_device_to_device(Buffer& device_dst, const Buffer& device_src) const override;

private:
    DeviceType _residency;
};

} // namespace cpu
} // namespace backend
} // namespace tapegrad
