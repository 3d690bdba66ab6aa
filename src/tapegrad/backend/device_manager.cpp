// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/cpu/cpu_backend.h"
#include "tapegrad/backend/cpu/thread_runtime.h"
#include "tapegrad/backend/blas/blas_backend.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/log.h"

// Forward declare, the CUDA sources are only compiled when enabled.
#ifdef TAPEGRAD_WITH_CUDA
namespace tapegrad::backend::cuda {
void register_device();
}
#endif

namespace tapegrad {
namespace backend {

std::mutex DeviceManager::_mutex;

DeviceManager& DeviceManager::instance() {
    static DeviceManager inst;
    return inst;
}

Device* DeviceManager::device(DeviceType type) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = inst._devices.find(type);
    if (it == inst._devices.end()) {
        return nullptr;
    }
    return it->second.get();
}

Device* DeviceManager::require(DeviceType type) {
    Device* dev = device(type);
    if (!dev) {
        throw Error(std::string("DeviceManager: device ") + to_string(type) + " is not registered");
    }
    return dev;
}

void DeviceManager::set_default_device_type(DeviceType type) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(_mutex);
    if (inst._devices.find(type) == inst._devices.end()) {
        throw Error("Cannot set default device to an unregistered device type: " + std::string(to_string(type)));
    }
    inst._default_device_type = type;
    TAPEGRAD_LOG_INFO("default device set to " << to_string(type));
}

DeviceType DeviceManager::default_device_type() {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(_mutex);
    return inst._default_device_type;
}

void DeviceManager::register_device(std::unique_ptr<Device> device) {
    if (!device) throw Error("DeviceManager::register_device: null device");
    std::lock_guard<std::mutex> lock(_mutex);
    auto type = device->type();
    if (_devices.find(type) == _devices.end()) {
        TAPEGRAD_LOG_INFO(to_string(type) << " device registered (" << device->backend()->name() << ")");
        _devices[type] = std::move(device);
    } else {
        TAPEGRAD_LOG_DEBUG(to_string(type) << " device already registered");
    }
}

void DeviceManager::init(const RuntimeConfig& config) {
    utils::set_log_level(config.log_level);

    cpu::register_device();
    blas::register_device();
    #ifdef TAPEGRAD_WITH_CUDA
        cuda::register_device();
    #endif

    auto& rt = cpu::Runtime::instance();
    const unsigned nthreads = config.num_threads ? config.num_threads : cpu::ThreadPool::default_threads();
    if (nthreads != rt.pool.size()) rt.set_num_threads(nthreads);
    rt.set_grain(config.grain);

    for (DeviceType host : {DeviceType::CPU, DeviceType::BLAS}) {
        if (Device* dev = device(host)) dev->allocator()->set_capacity_limit(config.cpu_memory_limit);
    }
    set_default_device_type(config.default_device);
}

void DeviceManager::init() {
    init(RuntimeConfig::from_env());
}

} // namespace backend
} // namespace tapegrad
