// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include "tapegrad/backend/device.h"
#include "tapegrad/core/tensor.h"
#include "tapegrad/utils/ref.h"

namespace tapegrad {
namespace autograd { class Tape; }

namespace core {

// Every operation takes the tape first; nullptr runs without recording.
// Inputs must be live and on one device; outputs live on that device.

// Unary Operations
utils::Ref<Tensor> neg(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> exp(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> log(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> relu(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> tanh(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> sigmoid(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> square(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> sqrt(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> abs(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> sin(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> cos(autograd::Tape* tape, const utils::Ref<const Tensor>& a);
// Not differentiable; never recorded.
utils::Ref<Tensor> sign(const utils::Ref<const Tensor>& a);

// Binary Operations (NumPy broadcasting)
utils::Ref<Tensor> add(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> sub(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> mul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> div(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> pow(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
// Ties split the gradient evenly between a and b.
utils::Ref<Tensor> maximum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> minimum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);

// Scalar Operations (the scalar is a constant)
utils::Ref<Tensor> add(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s);
utils::Ref<Tensor> sub(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s);
utils::Ref<Tensor> mul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s);
utils::Ref<Tensor> div(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s);
utils::Ref<Tensor> pow(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s);
utils::Ref<Tensor> add(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> sub(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> mul(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a);
utils::Ref<Tensor> div(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a);

// Comparison (1 or 0 in the operand dtype; never recorded)
utils::Ref<Tensor> cmp_eq(const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);
utils::Ref<Tensor> cmp_gt(const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);

// Reduction Operations. Empty `axes` reduces everything to rank 0; negative
// axes count from the end.
utils::Ref<Tensor> sum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes = {}, bool keep_dims = false);
utils::Ref<Tensor> mean(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes = {}, bool keep_dims = false);
// Every element equal to the extreme receives the full upstream gradient.
utils::Ref<Tensor> max(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes = {}, bool keep_dims = false);
utils::Ref<Tensor> min(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes = {}, bool keep_dims = false);

// Linear algebra: (M,K) x (K,N) -> (M,N)
utils::Ref<Tensor> matmul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b);

// x (N,C,H,W), w (O,C,KH,KW) -> (N,O,OH,OW)
utils::Ref<Tensor> conv2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, const utils::Ref<const Tensor>& w, size_t stride = 1, size_t padding = 0);
utils::Ref<Tensor> max_pool2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, size_t kernel = 2, size_t stride = 2, size_t padding = 0);
utils::Ref<Tensor> avg_pool2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, size_t kernel = 2, size_t stride = 2, size_t padding = 0);

// Movement Operations. Views share the input buffer where the layout allows.
utils::Ref<Tensor> reshape(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& shape);
utils::Ref<Tensor> permute(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& axes);
utils::Ref<Tensor> transpose(autograd::Tape* tape, const utils::Ref<const Tensor>& a, size_t dim0 = 0, size_t dim1 = 1);
utils::Ref<Tensor> broadcast_to(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& shape);
// Half-open [begin, end) per axis; empty `step` means 1 everywhere.
utils::Ref<Tensor> slice(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& begin, const std::vector<size_t>& end, const std::vector<size_t>& step = {});
utils::Ref<Tensor> unsqueeze(autograd::Tape* tape, const utils::Ref<const Tensor>& a, size_t axis);
// Dense copy (always a new buffer).
utils::Ref<Tensor> contiguous(autograd::Tape* tape, const utils::Ref<const Tensor>& a);

// Joins equally shaped tensors along a new axis.
utils::Ref<Tensor> stack(autograd::Tape* tape, const std::vector<utils::Ref<const Tensor>>& tensors, size_t axis = 0);

// Copies `a` to another device; gradients flow back to the source device.
utils::Ref<Tensor> to(autograd::Tape* tape, const utils::Ref<const Tensor>& a, backend::DeviceType device);

// Dense gradient of `g` summed over the axes broadcast from `shape`.
utils::Ref<Tensor> sum_to_shape(const utils::Ref<const Tensor>& g, const std::vector<size_t>& shape);

} // namespace core
} // namespace tapegrad
