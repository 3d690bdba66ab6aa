// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/storage.h"

namespace tapegrad {
namespace backend {

// Dense copy of `src` on its own device. Returns `src` unchanged when it is
// already dense and spans its whole buffer.
StorageDescriptor materialize(const StorageDescriptor& src);

// Dense copy of `src` resident on `target`. Host-to-host, host-to-device and
// device-to-host copies go through the allocators directly; anything else is
// staged through host memory. Blocks until the data is resident on `target`.
StorageDescriptor copy_to(const StorageDescriptor& src, Device* target);

// Copies the logical contents of `src` (row-major) into `host_dst`, which
// must hold numel * size(dtype) bytes.
void read_to_host(const StorageDescriptor& src, void* host_dst);

// New dense descriptor on `device` initialised from row-major host data.
StorageDescriptor from_host(Device* device, const void* host_src, const std::vector<size_t>& shape, DType dtype);

} // namespace backend
} // namespace tapegrad
