// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/cpu/cpu_backend.h"
#include "tapegrad/backend/cpu/cpu_allocator.h"

namespace tapegrad::backend::cpu {

void register_device() {
    if (DeviceManager::device(DeviceType::CPU)) return;
    DeviceManager::instance().register_device(std::make_unique<Device>(
        DeviceType::CPU,
        std::make_unique<CPUBackend>(),
        std::make_unique<CPUAllocator>(DeviceType::CPU)
    ));
}

} // namespace tapegrad::backend::cpu
