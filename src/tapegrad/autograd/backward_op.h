// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <variant>
#include "tapegrad/backend/op.h"
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/storage.h"
#include "tapegrad/core/tensor.h"

namespace tapegrad {
namespace autograd {

struct TapeEntry;

// Saved state per operation family. Activations are kept as descriptors
// (buffer references), never as tensor handles. A descriptor without a buffer
// means "not saved".

struct UnaryBackward {
    backend::UnaryOpType type;
    backend::StorageDescriptor x; // LOG, RELU, SQUARE, ABS, SIN, COS
    backend::StorageDescriptor y; // EXP, TANH, SIGMOID, SQRT
};

// Tensor-tensor elementwise. `a`/`b` are the un-broadcast inputs.
struct BinaryBackward {
    backend::BinaryOpType type;
    backend::StorageDescriptor a;
    backend::StorageDescriptor b;
    backend::StorageDescriptor y; // POW only
};

// Tensor-scalar elementwise. `scalar_first` means `scalar op x`.
struct ScalarBackward {
    backend::BinaryOpType type;
    double scalar = 0.0;
    bool scalar_first = false;
    backend::StorageDescriptor x;
};

// SUM/MAX/MIN over normalized axes. MEAN is SUM with `count` > 1.
struct ReduceBackward {
    backend::ReduceOpType type;
    std::vector<int> axes;
    bool keep_dims = false;
    size_t count = 1;
    backend::StorageDescriptor x; // MAX/MIN only
    backend::StorageDescriptor y; // MAX/MIN only
};

struct MatMulBackward {
    backend::StorageDescriptor a;
    backend::StorageDescriptor b;
};

struct Conv2dBackward {
    backend::Conv2dParams params;
    backend::StorageDescriptor x;
    backend::StorageDescriptor w;
};

struct Pool2dBackward {
    backend::Pool2dParams params;
    backend::StorageDescriptor x;
    backend::StorageDescriptor y;
};

// reshape, unsqueeze, contiguous: the gradient is reshaped to the input shape.
struct ReshapeBackward {};

struct PermuteBackward { std::vector<size_t> perm; };

// broadcast_to: the gradient is summed back to the input shape.
struct BroadcastBackward {};

struct SliceBackward {
    std::vector<size_t> begin;
    std::vector<size_t> end;
    std::vector<size_t> step;
};

struct StackBackward { size_t axis = 0; };

// to(): the gradient is copied back to the source device.
struct TransferBackward { backend::DeviceType source; };

using BackwardOp = std::variant<
    UnaryBackward,
    BinaryBackward,
    ScalarBackward,
    ReduceBackward,
    MatMulBackward,
    Conv2dBackward,
    Pool2dBackward,
    ReshapeBackward,
    PermuteBackward,
    BroadcastBackward,
    SliceBackward,
    StackBackward,
    TransferBackward
>;

// Per-input gradient contributions of `entry` given the gradient of its
// output. Inputs whose needs-grad bit is clear get a null handle. Runs
// untaped forward kernels only.
std::vector<utils::Ref<core::Tensor>> compute_gradients(const TapeEntry& entry, const utils::Ref<const core::Tensor>& grad_out);

} // namespace autograd
} // namespace tapegrad
