// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <stdexcept>
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/backend.h"
#include "tapegrad/backend/allocator.h"

namespace tapegrad {
namespace backend {

Device::Device(DeviceType type, std::unique_ptr<Backend> backend, std::unique_ptr<Allocator> allocator)
    : _type(type), _backend(std::move(backend)), _allocator(std::move(allocator)) {
    if (!_backend || !_allocator) {
        throw std::invalid_argument(std::string("Device: ") + to_string(type) + " needs both a backend and an allocator");
    }
}

Device::~Device() = default;

} // namespace backend
} // namespace tapegrad
