// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cstdint>
#include "tapegrad/backend/transfer.h"
#include "tapegrad/backend/dispatch.h"
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/allocator.h"
#include "tapegrad/backend/backend.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {
namespace backend {

static Device* owner_of(const StorageDescriptor& d, const char* where) {
    if (!d.buffer) throw UseAfterFreeError(std::string(where) + ": descriptor has no buffer");
    return DeviceManager::require(d.buffer->device_type());
}

// Dense and covering the whole buffer, so a raw buffer copy is exact.
static bool is_packed(const StorageDescriptor& d) {
    return d.is_dense() && d.buffer->numel() == d.numel();
}

StorageDescriptor materialize(const StorageDescriptor& src) {
    Device* dev = owner_of(src, "materialize");
    if (is_packed(src)) return src;
    StorageDescriptor out = allocate(dev, src.shape, src.dtype);
    execute(dev, CopyOp{}, {&src}, out);
    return out;
}

StorageDescriptor copy_to(const StorageDescriptor& src, Device* target) {
    if (!target) throw Error("copy_to: null target device");
    Device* source = owner_of(src, "copy_to");

    if (source == target) {
        StorageDescriptor out = allocate(target, src.shape, src.dtype);
        execute(target, CopyOp{}, {&src}, out);
        return out;
    }

    const StorageDescriptor packed = materialize(src);
    StorageDescriptor out = allocate(target, packed.shape, packed.dtype);
    if (packed.buffer->size_bytes() == 0) return out;

    const bool src_host = is_host_resident(source->type());
    const bool dst_host = is_host_resident(target->type());
    source->backend()->synchronize();

    if (src_host && dst_host) {
        target->allocator()->copy_device_to_device(*out.buffer, *packed.buffer);
    } else if (src_host) {
        target->allocator()->copy_host_to_device(*out.buffer, packed.buffer->data());
    } else if (dst_host) {
        source->allocator()->copy_device_to_host(out.buffer->data(), *packed.buffer);
    } else {
        TAPEGRAD_LOG_DEBUG("copy_to: staging " << packed.buffer->size_bytes() << " bytes through host ("
                           << source->name() << " -> " << target->name() << ")");
        std::vector<uint8_t> staging(packed.buffer->size_bytes());
        source->allocator()->copy_device_to_host(staging.data(), *packed.buffer);
        target->allocator()->copy_host_to_device(*out.buffer, staging.data());
    }
    target->backend()->synchronize();
    return out;
}

void read_to_host(const StorageDescriptor& src, void* host_dst) {
    Device* dev = owner_of(src, "read_to_host");
    const StorageDescriptor packed = materialize(src);
    if (packed.buffer->size_bytes() == 0) return;
    dev->backend()->synchronize();
    dev->allocator()->copy_device_to_host(host_dst, *packed.buffer);
}

StorageDescriptor from_host(Device* device, const void* host_src, const std::vector<size_t>& shape, DType dtype) {
    if (!device) throw Error("from_host: null device");
    auto buf = device->allocator()->allocate(host_src, utils::vector::numel(shape), dtype);
    return StorageDescriptor::contiguous(std::move(buf), shape);
}

} // namespace backend
} // namespace tapegrad
