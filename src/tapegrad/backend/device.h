// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <memory>

namespace tapegrad {
namespace backend {

// Forward declarations.
class Backend;
class Allocator;

// One entry per compute target. BLAS is host resident but is a distinct
// backend: mixing CPU and BLAS tensors needs an explicit transfer.
enum class DeviceType {
    CPU,
    BLAS,
    CUDA
};

inline const char* to_string(DeviceType dt) {
    switch (dt) {
        case DeviceType::CPU:  return "CPU";
        case DeviceType::BLAS: return "BLAS";
        case DeviceType::CUDA: return "CUDA";
        default:               return "UNKNOWN";
    }
}

// Host-addressable memory (plain pointers valid on the CPU).
inline constexpr bool is_host_resident(DeviceType dt) {
    return dt == DeviceType::CPU || dt == DeviceType::BLAS;
}

class Device {
public:
    Device(DeviceType type, std::unique_ptr<Backend> backend, std::unique_ptr<Allocator> allocator);
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    DeviceType type() const { return _type; }
    const char* name() const { return to_string(_type); }
    Backend* backend() const { return _backend.get(); }
    Allocator* allocator() const { return _allocator.get(); }

private:
    DeviceType _type;
    std::unique_ptr<Backend> _backend;
    std::unique_ptr<Allocator> _allocator;
};

} // namespace backend
} // namespace tapegrad
