// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cstddef>
#include <string>
#include <utility>
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/autograd/backward_op.h"
#include "tapegrad/backend/dispatch.h"
#include "tapegrad/backend/transfer.h"
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/shape.h"
#include "tapegrad/utils/vector.h"

namespace tapegrad {
namespace core {

using backend::StorageDescriptor;
using autograd::should_record;

// Helpers

static void check_pair(const char* op, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) {
    check_live(a, op);
    check_live(b, op);
    if (a->device() != b->device()) {
        throw BackendMismatchError(std::string(op) + ": operands on " + a->device()->name() + " and " + b->device()->name() +
                                   ", transfer one with to() first");
    }
    if (a->dtype() != b->dtype()) {
        throw Error(std::string(op) + ": dtype mismatch " + backend::to_string(a->dtype()) + " vs " + backend::to_string(b->dtype()));
    }
}

static std::vector<size_t> broadcast_shape_for(const char* op, const std::vector<size_t>& a, const std::vector<size_t>& b) {
    try {
        return utils::shape::broadcast_shape(a, b);
    } catch (const ShapeMismatchError&) {
        throw ShapeMismatchError(std::string(op) + ": shapes are not broadcastable", a, b);
    }
}

// Allocate the output on `dev` and run `op` into it.
static utils::Ref<Tensor> run(backend::Device* dev, const backend::Op& op, const std::vector<const StorageDescriptor*>& inputs,
                              const std::vector<size_t>& shape, backend::DType dtype) {
    auto out = backend::allocate(dev, shape, dtype);
    backend::execute(dev, op, inputs, out);
    return Tensor::make(std::move(out), dev);
}

// New handle over a derived layout of `a`'s buffer.
static utils::Ref<Tensor> view_of(const utils::Ref<const Tensor>& a, StorageDescriptor desc) {
    return Tensor::make(std::move(desc), a->device());
}

static utils::Ref<Tensor> unary(autograd::Tape* tape, const char* name, backend::UnaryOpType type, const utils::Ref<const Tensor>& a) {
    check_live(a, name);
    auto out = run(a->device(), backend::UnaryOp{type}, {&a->storage()}, a->shape(), a->dtype());
    if (should_record(tape, {a})) {
        autograd::UnaryBackward bw{type, {}, {}};
        switch (type) {
            case backend::UnaryOpType::LOG:
            case backend::UnaryOpType::RELU:
            case backend::UnaryOpType::SQUARE:
            case backend::UnaryOpType::ABS:
            case backend::UnaryOpType::SIN:
            case backend::UnaryOpType::COS:
                bw.x = a->storage();
                break;
            case backend::UnaryOpType::EXP:
            case backend::UnaryOpType::TANH:
            case backend::UnaryOpType::SIGMOID:
            case backend::UnaryOpType::SQRT:
                bw.y = out->storage();
                break;
            default:
                break;
        }
        tape->record(name, {a}, out, std::move(bw));
    }
    return out;
}

static utils::Ref<Tensor> binary_forward(const char* name, backend::BinaryOpType type, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) {
    check_pair(name, a, b);
    const auto shape = broadcast_shape_for(name, a->shape(), b->shape());
    const StorageDescriptor va = a->storage().broadcast_to(shape);
    const StorageDescriptor vb = b->storage().broadcast_to(shape);
    return run(a->device(), backend::BinaryOp{type}, {&va, &vb}, shape, a->dtype());
}

static utils::Ref<Tensor> binary(autograd::Tape* tape, const char* name, backend::BinaryOpType type, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) {
    auto out = binary_forward(name, type, a, b);
    if (should_record(tape, {a, b})) {
        autograd::BinaryBackward bw{type, {}, {}, {}};
        if (type != backend::BinaryOpType::ADD && type != backend::BinaryOpType::SUB) {
            bw.a = a->storage();
            bw.b = b->storage();
        }
        if (type == backend::BinaryOpType::POW) bw.y = out->storage();
        tape->record(name, {a, b}, out, std::move(bw));
    }
    return out;
}

static utils::Ref<Tensor> scalar_op(autograd::Tape* tape, const char* name, backend::BinaryOpType type, const utils::Ref<const Tensor>& a, double s, bool scalar_first) {
    check_live(a, name);
    auto c = scalar_like(s, a);
    const StorageDescriptor vc = c->storage().broadcast_to(a->shape());
    const StorageDescriptor& va = a->storage();
    auto out = scalar_first
        ? run(a->device(), backend::BinaryOp{type}, {&vc, &va}, a->shape(), a->dtype())
        : run(a->device(), backend::BinaryOp{type}, {&va, &vc}, a->shape(), a->dtype());
    if (should_record(tape, {a})) {
        autograd::ScalarBackward bw{type, s, scalar_first, {}};
        const bool needs_x = (type == backend::BinaryOpType::POW) || (type == backend::BinaryOpType::DIV && scalar_first);
        if (needs_x) bw.x = a->storage();
        tape->record(name, {a}, out, std::move(bw));
    }
    return out;
}

static utils::Ref<Tensor> reduce(autograd::Tape* tape, const char* name, backend::ReduceOpType type, const utils::Ref<const Tensor>& a, const std::vector<int>& axes, bool keep_dims) {
    check_live(a, name);
    const auto axes_n = utils::shape::reduction_axes(axes, a->rank());
    const auto shape = utils::shape::reduce_shape(a->shape(), axes_n, keep_dims);
    auto out = run(a->device(), backend::ReduceOp{type, axes_n, keep_dims}, {&a->storage()}, shape, a->dtype());
    if (should_record(tape, {a})) {
        autograd::ReduceBackward bw{type, axes_n, keep_dims, 1, {}, {}};
        if (type != backend::ReduceOpType::SUM) {
            bw.x = a->storage();
            bw.y = out->storage();
        }
        tape->record(name, {a}, out, std::move(bw));
    }
    return out;
}

// Public API

// Unary Ops
utils::Ref<Tensor> neg(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "neg", backend::UnaryOpType::NEG, a); }
utils::Ref<Tensor> exp(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "exp", backend::UnaryOpType::EXP, a); }
utils::Ref<Tensor> log(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "log", backend::UnaryOpType::LOG, a); }
utils::Ref<Tensor> relu(autograd::Tape* tape, const utils::Ref<const Tensor>& a)    { return unary(tape, "relu", backend::UnaryOpType::RELU, a); }
utils::Ref<Tensor> tanh(autograd::Tape* tape, const utils::Ref<const Tensor>& a)    { return unary(tape, "tanh", backend::UnaryOpType::TANH, a); }
utils::Ref<Tensor> sigmoid(autograd::Tape* tape, const utils::Ref<const Tensor>& a) { return unary(tape, "sigmoid", backend::UnaryOpType::SIGMOID, a); }
utils::Ref<Tensor> square(autograd::Tape* tape, const utils::Ref<const Tensor>& a)  { return unary(tape, "square", backend::UnaryOpType::SQUARE, a); }
utils::Ref<Tensor> sqrt(autograd::Tape* tape, const utils::Ref<const Tensor>& a)    { return unary(tape, "sqrt", backend::UnaryOpType::SQRT, a); }
utils::Ref<Tensor> abs(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "abs", backend::UnaryOpType::ABS, a); }
utils::Ref<Tensor> sin(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "sin", backend::UnaryOpType::SIN, a); }
utils::Ref<Tensor> cos(autograd::Tape* tape, const utils::Ref<const Tensor>& a)     { return unary(tape, "cos", backend::UnaryOpType::COS, a); }
utils::Ref<Tensor> sign(const utils::Ref<const Tensor>& a)                          { return unary(nullptr, "sign", backend::UnaryOpType::SIGN, a); }

// Binary Ops
utils::Ref<Tensor> add(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b)     { return binary(tape, "add", backend::BinaryOpType::ADD, a, b); }
utils::Ref<Tensor> sub(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b)     { return binary(tape, "sub", backend::BinaryOpType::SUB, a, b); }
utils::Ref<Tensor> mul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b)     { return binary(tape, "mul", backend::BinaryOpType::MUL, a, b); }
utils::Ref<Tensor> div(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b)     { return binary(tape, "div", backend::BinaryOpType::DIV, a, b); }
utils::Ref<Tensor> pow(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b)     { return binary(tape, "pow", backend::BinaryOpType::POW, a, b); }
utils::Ref<Tensor> maximum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) { return binary(tape, "maximum", backend::BinaryOpType::MAXIMUM, a, b); }
utils::Ref<Tensor> minimum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) { return binary(tape, "minimum", backend::BinaryOpType::MINIMUM, a, b); }

// Scalar Ops
utils::Ref<Tensor> add(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s) { return scalar_op(tape, "add_scalar", backend::BinaryOpType::ADD, a, s, false); }
utils::Ref<Tensor> sub(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s) { return scalar_op(tape, "sub_scalar", backend::BinaryOpType::SUB, a, s, false); }
utils::Ref<Tensor> mul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s) { return scalar_op(tape, "mul_scalar", backend::BinaryOpType::MUL, a, s, false); }
utils::Ref<Tensor> div(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s) { return scalar_op(tape, "div_scalar", backend::BinaryOpType::DIV, a, s, false); }
utils::Ref<Tensor> pow(autograd::Tape* tape, const utils::Ref<const Tensor>& a, double s) { return scalar_op(tape, "pow_scalar", backend::BinaryOpType::POW, a, s, false); }
utils::Ref<Tensor> add(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a) { return scalar_op(tape, "add_scalar", backend::BinaryOpType::ADD, a, s, true); }
utils::Ref<Tensor> sub(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a) { return scalar_op(tape, "rsub_scalar", backend::BinaryOpType::SUB, a, s, true); }
utils::Ref<Tensor> mul(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a) { return scalar_op(tape, "mul_scalar", backend::BinaryOpType::MUL, a, s, true); }
utils::Ref<Tensor> div(autograd::Tape* tape, double s, const utils::Ref<const Tensor>& a) { return scalar_op(tape, "rdiv_scalar", backend::BinaryOpType::DIV, a, s, true); }

// Comparison Ops
utils::Ref<Tensor> cmp_eq(const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) { return binary_forward("cmp_eq", backend::BinaryOpType::CMP_EQ, a, b); }
utils::Ref<Tensor> cmp_gt(const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) { return binary_forward("cmp_gt", backend::BinaryOpType::CMP_GT, a, b); }

// Reduction Ops
utils::Ref<Tensor> sum(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes, bool keep_dims) {
    return reduce(tape, "sum", backend::ReduceOpType::SUM, a, axes, keep_dims);
}

utils::Ref<Tensor> max(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes, bool keep_dims) {
    return reduce(tape, "max", backend::ReduceOpType::MAX, a, axes, keep_dims);
}

utils::Ref<Tensor> min(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes, bool keep_dims) {
    return reduce(tape, "min", backend::ReduceOpType::MIN, a, axes, keep_dims);
}

utils::Ref<Tensor> mean(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<int>& axes, bool keep_dims) {
    check_live(a, "mean");
    if (!backend::is_floating(a->dtype())) {
        throw Error(std::string("mean: requires a floating point tensor, got ") + backend::to_string(a->dtype()));
    }
    const auto axes_n = utils::shape::reduction_axes(axes, a->rank());
    const size_t count = utils::shape::reduce_count(a->shape(), axes_n);
    auto total = sum(nullptr, a, axes_n, keep_dims);
    auto out = div(nullptr, total, static_cast<double>(count));
    if (should_record(tape, {a})) {
        tape->record("mean", {a}, out, autograd::ReduceBackward{backend::ReduceOpType::SUM, axes_n, keep_dims, count, {}, {}});
    }
    return out;
}

// Linear Algebra
utils::Ref<Tensor> matmul(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const utils::Ref<const Tensor>& b) {
    check_pair("matmul", a, b);
    const auto& as = a->shape();
    const auto& bs = b->shape();
    if (as.size() != 2 || bs.size() != 2 || as[1] != bs[0]) {
        throw ShapeMismatchError("matmul: expected (M,K) x (K,N)", as, bs);
    }
    auto out = run(a->device(), backend::MatMulOp{}, {&a->storage(), &b->storage()}, {as[0], bs[1]}, a->dtype());
    if (should_record(tape, {a, b})) {
        tape->record("matmul", {a, b}, out, autograd::MatMulBackward{a->storage(), b->storage()});
    }
    return out;
}

// Convolution / Pooling
utils::Ref<Tensor> conv2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, const utils::Ref<const Tensor>& w, size_t stride, size_t padding) {
    check_pair("conv2d", x, w);
    const backend::Conv2dParams params{stride, padding};
    const auto shape = utils::shape::conv2d_output_shape(x->shape(), w->shape(), stride, padding);
    auto out = run(x->device(), backend::Conv2dOp{params}, {&x->storage(), &w->storage()}, shape, x->dtype());
    if (should_record(tape, {x, w})) {
        tape->record("conv2d", {x, w}, out, autograd::Conv2dBackward{params, x->storage(), w->storage()});
    }
    return out;
}

static utils::Ref<Tensor> pool2d(autograd::Tape* tape, const char* name, const backend::Pool2dParams& params, const utils::Ref<const Tensor>& x) {
    check_live(x, name);
    const auto shape = utils::shape::pool2d_output_shape(x->shape(), params.kernel, params.stride, params.padding);
    auto out = run(x->device(), backend::Pool2dOp{params}, {&x->storage()}, shape, x->dtype());
    if (should_record(tape, {x})) {
        tape->record(name, {x}, out, autograd::Pool2dBackward{params, x->storage(), out->storage()});
    }
    return out;
}

utils::Ref<Tensor> max_pool2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, size_t kernel, size_t stride, size_t padding) {
    return pool2d(tape, "max_pool2d", backend::Pool2dParams{backend::PoolType::MAX, kernel, stride, padding}, x);
}

utils::Ref<Tensor> avg_pool2d(autograd::Tape* tape, const utils::Ref<const Tensor>& x, size_t kernel, size_t stride, size_t padding) {
    return pool2d(tape, "avg_pool2d", backend::Pool2dParams{backend::PoolType::AVG, kernel, stride, padding}, x);
}

// Movement Ops
utils::Ref<Tensor> reshape(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& shape) {
    check_live(a, "reshape");
    if (utils::vector::numel(a->shape()) != utils::vector::numel(shape)) {
        throw ShapeMismatchError("reshape: element count mismatch", a->shape(), shape);
    }
    // Strided views are materialized first.
    const StorageDescriptor src = a->is_contiguous() ? a->storage() : backend::materialize(a->storage());
    auto out = view_of(a, src.reshape(shape));
    if (should_record(tape, {a})) {
        tape->record("reshape", {a}, out, autograd::ReshapeBackward{});
    }
    return out;
}

utils::Ref<Tensor> permute(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& axes) {
    check_live(a, "permute");
    auto out = view_of(a, a->storage().permute(axes));
    if (should_record(tape, {a})) {
        tape->record("permute", {a}, out, autograd::PermuteBackward{axes});
    }
    return out;
}

utils::Ref<Tensor> transpose(autograd::Tape* tape, const utils::Ref<const Tensor>& a, size_t dim0, size_t dim1) {
    check_live(a, "transpose");
    const size_t rank = a->rank();
    if (dim0 >= rank || dim1 >= rank) {
        throw ShapeMismatchError("transpose: axes (" + std::to_string(dim0) + "," + std::to_string(dim1) +
                                 ") out of range for rank " + std::to_string(rank));
    }
    std::vector<size_t> axes(rank);
    for (size_t i = 0; i < rank; ++i) axes[i] = i;
    std::swap(axes[dim0], axes[dim1]);
    return permute(tape, a, axes);
}

utils::Ref<Tensor> broadcast_to(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& shape) {
    check_live(a, "broadcast_to");
    auto out = view_of(a, a->storage().broadcast_to(shape));
    if (should_record(tape, {a})) {
        tape->record("broadcast_to", {a}, out, autograd::BroadcastBackward{});
    }
    return out;
}

utils::Ref<Tensor> slice(autograd::Tape* tape, const utils::Ref<const Tensor>& a, const std::vector<size_t>& begin, const std::vector<size_t>& end, const std::vector<size_t>& step) {
    check_live(a, "slice");
    const std::vector<size_t> steps = step.empty() ? std::vector<size_t>(a->rank(), 1) : step;
    auto out = view_of(a, a->storage().slice(begin, end, steps));
    if (should_record(tape, {a})) {
        tape->record("slice", {a}, out, autograd::SliceBackward{begin, end, steps});
    }
    return out;
}

utils::Ref<Tensor> unsqueeze(autograd::Tape* tape, const utils::Ref<const Tensor>& a, size_t axis) {
    check_live(a, "unsqueeze");
    auto out = view_of(a, a->storage().unsqueeze(axis));
    if (should_record(tape, {a})) {
        tape->record("unsqueeze", {a}, out, autograd::ReshapeBackward{});
    }
    return out;
}

utils::Ref<Tensor> contiguous(autograd::Tape* tape, const utils::Ref<const Tensor>& a) {
    check_live(a, "contiguous");
    auto out = run(a->device(), backend::CopyOp{}, {&a->storage()}, a->shape(), a->dtype());
    if (should_record(tape, {a})) {
        tape->record("contiguous", {a}, out, autograd::ReshapeBackward{});
    }
    return out;
}

utils::Ref<Tensor> stack(autograd::Tape* tape, const std::vector<utils::Ref<const Tensor>>& tensors, size_t axis) {
    if (tensors.empty()) throw Error("stack: expected at least one tensor");
    const auto& first = tensors[0];
    for (const auto& t : tensors) check_pair("stack", first, t);
    const auto& in_shape = first->shape();
    if (axis > in_shape.size()) {
        throw ShapeMismatchError("stack: axis " + std::to_string(axis) + " out of range for rank " + std::to_string(in_shape.size()));
    }
    for (const auto& t : tensors) {
        if (t->shape() != in_shape) throw ShapeMismatchError("stack: tensors must share a shape", in_shape, t->shape());
    }

    std::vector<size_t> out_shape = in_shape;
    out_shape.insert(out_shape.begin() + static_cast<std::ptrdiff_t>(axis), tensors.size());
    backend::Device* dev = first->device();
    auto out = backend::allocate(dev, out_shape, first->dtype());

    std::vector<size_t> begin(out_shape.size(), 0), end = out_shape, step(out_shape.size(), 1);
    for (size_t i = 0; i < tensors.size(); ++i) {
        begin[axis] = i;
        end[axis] = i + 1;
        StorageDescriptor dst = out.slice(begin, end, step);
        const StorageDescriptor src = tensors[i]->storage().unsqueeze(axis);
        backend::execute(dev, backend::CopyOp{}, {&src}, dst);
    }
    auto result = Tensor::make(std::move(out), dev);
    if (should_record(tape, tensors)) {
        tape->record("stack", tensors, result, autograd::StackBackward{axis});
    }
    return result;
}

utils::Ref<Tensor> to(autograd::Tape* tape, const utils::Ref<const Tensor>& a, backend::DeviceType device) {
    check_live(a, "to");
    backend::Device* target = backend::DeviceManager::require(device);
    auto out = Tensor::make(backend::copy_to(a->storage(), target), target);
    if (should_record(tape, {a})) {
        tape->record("to", {a}, out, autograd::TransferBackward{a->device_type()});
    }
    return out;
}

utils::Ref<Tensor> sum_to_shape(const utils::Ref<const Tensor>& g, const std::vector<size_t>& shape) {
    check_live(g, "sum_to_shape");
    if (g->shape() == shape) return view_of(g, g->storage());
    const auto axes = utils::shape::broadcast_axes(g->shape(), shape);
    auto reduced = sum(nullptr, g, axes, /*keep_dims=*/true);
    return reshape(nullptr, reduced, shape);
}

} // namespace core
} // namespace tapegrad
