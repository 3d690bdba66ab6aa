// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include "tapegrad/backend/op.h"
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/storage.h"

namespace tapegrad {
namespace backend {

// Allocates a dense descriptor of `shape` on `device`.
// Throws AllocationError when the allocator cannot satisfy the request.
StorageDescriptor allocate(Device* device, const std::vector<size_t>& shape, DType dtype);

// Runs `op` on `device`, reading `inputs` and writing into `out`'s layout.
// Validates arity, liveness (UseAfterFreeError), residency
// (BackendMismatchError), dtype agreement (Error) and the op's shape rule
// (ShapeMismatchError) before any kernel runs. The output is ready when this
// returns.
void execute(Device* device, const Op& op, const std::vector<const StorageDescriptor*>& inputs, StorageDescriptor& out);

} // namespace backend
} // namespace tapegrad
