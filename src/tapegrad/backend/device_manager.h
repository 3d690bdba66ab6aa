// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <map>
#include <mutex>
#include <memory>
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/allocator.h"
#include "tapegrad/config.h"

namespace tapegrad {
namespace backend {

// Process-wide device registry. Devices are never unregistered, so Device*
// held by tensors stays valid for the life of the process.
class DeviceManager {
public:
    static DeviceManager& instance();
    // nullptr when the type is not registered.
    static Device* device(DeviceType type);
    // Throws Error when the type is not registered.
    static Device* require(DeviceType type);
    static DeviceType default_device_type();
    static void set_default_device_type(DeviceType type);

    // Deleted copy constructor & assignment operator (enforce singleton pattern).
    DeviceManager(const DeviceManager&) = delete;
    void operator=(const DeviceManager&) = delete;

    void register_device(std::unique_ptr<Device> device);

    // Registers every compiled-in device, then applies `config`.
    void init(const RuntimeConfig& config);
    void init();

private:
    DeviceManager() = default;
    std::map<DeviceType, std::unique_ptr<Device>> _devices;
    DeviceType _default_device_type = DeviceType::CPU;
    static std::mutex _mutex;
};

} // namespace backend
} // namespace tapegrad
