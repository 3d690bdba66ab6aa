// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <new>
#include <cstdint>
#include <cuda_runtime.h>
#include "tapegrad/backend/cuda/cuda_allocator.h"
#include "tapegrad/backend/cuda/cuda_error.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {
namespace backend {
namespace cuda {

std::shared_ptr<Buffer> CUDAAllocator::allocate(size_t num_elements, DType dtype) {
    const size_t item = size(dtype);
    if (item == 0) throw Error("CUDAAllocator::allocate: unsupported dtype");
    if (num_elements != 0 && num_elements > SIZE_MAX / item) {
        throw AllocationError("CUDA allocator: element count overflows");
    }
    const size_t bytes = num_elements * item;

    reserve(bytes, "CUDA");
    void* ptr = nullptr;
    if (bytes != 0) {
        const cudaError_t status = cudaMalloc(&ptr, bytes);
        if (status != cudaSuccess) {
            unreserve(bytes);
            // Clear the sticky error state left by the failed call.
            (void)cudaGetLastError();
            if (status == cudaErrorMemoryAllocation) {
                TAPEGRAD_LOG_ERROR("CUDA allocator: out of memory for " << bytes << " bytes");
                throw AllocationError("CUDA allocator: out of memory for " + std::to_string(bytes) + " bytes");
            }
            throw CudaError(status, "cudaMalloc", __FILE__, __LINE__);
        }
    }
    try {
        return std::make_shared<Buffer>(ptr, bytes, dtype, DeviceType::CUDA, this);
    } catch (const std::bad_alloc&) {
        cudaFree(ptr);
        unreserve(bytes);
        throw AllocationError("CUDA allocator: out of memory for buffer header");
    }
}

std::shared_ptr<Buffer> CUDAAllocator::allocate(const void* src, size_t num_elements, DType dtype) {
    auto buffer = allocate(num_elements, dtype);
    if (src && buffer->data()) {
        copy_host_to_device(*buffer, src);
    }
    return buffer;
}

void CUDAAllocator::deallocate(void* ptr, size_t size_bytes) {
    if (ptr) {
        const cudaError_t status = cudaFree(ptr);
        if (status != cudaSuccess) {
            // Called from ~Buffer: report, never throw.
            TAPEGRAD_LOG_ERROR("CUDA allocator: cudaFree failed: " << cudaGetErrorString(status));
        }
    }
    unreserve(size_bytes);
}

void CUDAAllocator::copy_device_to_host(void* host_dst, const Buffer& device_src) const {
    if (device_src.size_bytes() == 0) return;
    if (device_src.device_type() != DeviceType::CUDA) {
        throw BackendMismatchError("CUDAAllocator::copy_device_to_host: src is not a CUDA buffer");
    }
    TAPEGRAD_CUDA_CHECK(cudaMemcpy(host_dst, device_src.data(), device_src.size_bytes(), cudaMemcpyDeviceToHost));
}

void CUDAAllocator::copy_host_to_device(Buffer& device_dst, const void* host_src) const {
    if (device_dst.size_bytes() == 0) return;
    if (device_dst.device_type() != DeviceType::CUDA) {
        throw BackendMismatchError("CUDAAllocator::copy_host_to_device: dst is not a CUDA buffer");
    }
    TAPEGRAD_CUDA_CHECK(cudaMemcpy(device_dst.data(), host_src, device_dst.size_bytes(), cudaMemcpyHostToDevice));
}

void CUDAAllocator::copy_device_to_device(Buffer& device_dst, const Buffer& device_src) const {
    if (device_src.size_bytes() == 0) return;
    if (device_dst.device_type() != DeviceType::CUDA || device_src.device_type() != DeviceType::CUDA) {
        throw BackendMismatchError("CUDAAllocator::copy_device_to_device: src and dst must both be CUDA buffers");
    }
    if (device_dst.size_bytes() != device_src.size_bytes()) {
        throw Error("CUDAAllocator::copy_device_to_device: size mismatch");
    }
    TAPEGRAD_CUDA_CHECK(cudaMemcpy(device_dst.data(), device_src.data(), device_src.size_bytes(), cudaMemcpyDeviceToDevice));
}

} // namespace cuda
} // namespace backend
} // namespace tapegrad
