// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cuda_runtime.h>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/cuda/cuda_backend.h"
#include "tapegrad/backend/cuda/cuda_allocator.h"
#include "tapegrad/utils/log.h"

namespace tapegrad::backend::cuda {

// Built without a usable GPU is fine: the device is simply not registered.
void register_device() {
    if (DeviceManager::device(DeviceType::CUDA)) return;
    int count = 0;
    const cudaError_t status = cudaGetDeviceCount(&count);
    if (status != cudaSuccess || count == 0) {
        (void)cudaGetLastError();
        TAPEGRAD_LOG_WARNING("CUDA: no usable device (" << cudaGetErrorString(status) << "), CUDA backend not registered");
        return;
    }
    DeviceManager::instance().register_device(std::make_unique<Device>(
        DeviceType::CUDA,
        std::make_unique<CUDABackend>(),
        std::make_unique<CUDAAllocator>()
    ));
}

} // namespace tapegrad::backend::cuda
