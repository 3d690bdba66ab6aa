// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/blas/blas_backend.h"
#include "tapegrad/backend/cpu/cpu_allocator.h"

namespace tapegrad::backend::blas {

// Host memory, but buffers are tagged BLAS so they never mix with CPU tensors.
void register_device() {
    if (DeviceManager::device(DeviceType::BLAS)) return;
    DeviceManager::instance().register_device(std::make_unique<Device>(
        DeviceType::BLAS,
        std::make_unique<BLASBackend>(),
        std::make_unique<cpu::CPUAllocator>(DeviceType::BLAS)
    ));
}

} // namespace tapegrad::backend::blas
