// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <string>
#include <type_traits>
#include "tapegrad/autograd/backward_op.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/backend/dispatch.h"
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/shape.h"

namespace tapegrad {
namespace autograd {

using core::Tensor;
using TensorRef = utils::Ref<Tensor>;
using ConstRef = utils::Ref<const Tensor>;

namespace {

// Saved activation back to a handle on the entry's device.
ConstRef wrap(const backend::StorageDescriptor& desc, backend::Device* device, const char* name) {
    if (!desc.has_buffer()) {
        throw Error(std::string("backward(") + name + "): required saved state is missing");
    }
    return Tensor::make(desc, device);
}

TensorRef run(backend::Device* dev, const backend::Op& op, const std::vector<const backend::StorageDescriptor*>& inputs,
              const std::vector<size_t>& shape, backend::DType dtype) {
    auto out = backend::allocate(dev, shape, dtype);
    backend::execute(dev, op, inputs, out);
    return Tensor::make(std::move(out), dev);
}

// g broadcast back over the axes a reduction removed.
TensorRef expand_reduced(const ConstRef& g, const std::vector<size_t>& in_shape, const std::vector<int>& axes) {
    const auto keep = utils::shape::reduce_shape(in_shape, axes, /*keep_dims=*/true);
    auto gk = core::reshape(nullptr, g, keep);
    return core::broadcast_to(nullptr, gk, in_shape);
}

// 1 where a > b, 0.5 where a == b, 0 elsewhere.
TensorRef tie_split(const ConstRef& a, const ConstRef& b) {
    return core::add(nullptr, core::cmp_gt(a, b), core::mul(nullptr, core::cmp_eq(a, b), 0.5));
}

std::vector<TensorRef> unary_grad(const TapeEntry& e, const UnaryBackward& bw, const ConstRef& g) {
    using backend::UnaryOpType;
    backend::Device* dev = e.device;
    TensorRef gx;
    switch (bw.type) {
        case UnaryOpType::NEG:
            gx = core::neg(nullptr, g);
            break;
        case UnaryOpType::EXP:
            gx = core::mul(nullptr, g, wrap(bw.y, dev, e.name));
            break;
        case UnaryOpType::LOG:
            gx = core::div(nullptr, g, wrap(bw.x, dev, e.name));
            break;
        case UnaryOpType::RELU: {
            auto x = wrap(bw.x, dev, e.name);
            gx = core::mul(nullptr, g, core::cmp_gt(x, core::scalar_like(0.0, x)));
            break;
        }
        case UnaryOpType::TANH: {
            auto y = wrap(bw.y, dev, e.name);
            gx = core::mul(nullptr, g, core::sub(nullptr, 1.0, core::square(nullptr, y)));
            break;
        }
        case UnaryOpType::SIGMOID: {
            auto y = wrap(bw.y, dev, e.name);
            gx = core::mul(nullptr, g, core::mul(nullptr, y, core::sub(nullptr, 1.0, y)));
            break;
        }
        case UnaryOpType::SQUARE:
            gx = core::mul(nullptr, core::mul(nullptr, g, wrap(bw.x, dev, e.name)), 2.0);
            break;
        case UnaryOpType::SQRT:
            gx = core::div(nullptr, g, core::mul(nullptr, wrap(bw.y, dev, e.name), 2.0));
            break;
        case UnaryOpType::ABS:
            gx = core::mul(nullptr, g, core::sign(wrap(bw.x, dev, e.name)));
            break;
        case UnaryOpType::SIN:
            gx = core::mul(nullptr, g, core::cos(nullptr, wrap(bw.x, dev, e.name)));
            break;
        case UnaryOpType::COS:
            gx = core::neg(nullptr, core::mul(nullptr, g, core::sin(nullptr, wrap(bw.x, dev, e.name))));
            break;
        case UnaryOpType::SIGN:
            throw Error(std::string("backward(") + e.name + "): sign is not differentiable");
    }
    return {gx};
}

std::vector<TensorRef> binary_grad(const TapeEntry& e, const BinaryBackward& bw, const ConstRef& g) {
    using backend::BinaryOpType;
    backend::Device* dev = e.device;
    const bool need_a = e.needs_grad[0];
    const bool need_b = e.needs_grad[1];
    TensorRef ga, gb;
    switch (bw.type) {
        case BinaryOpType::ADD:
            if (need_a) ga = core::sum_to_shape(g, e.input_shapes[0]);
            if (need_b) gb = core::sum_to_shape(g, e.input_shapes[1]);
            return {ga, gb};
        case BinaryOpType::SUB:
            if (need_a) ga = core::sum_to_shape(g, e.input_shapes[0]);
            if (need_b) gb = core::neg(nullptr, core::sum_to_shape(g, e.input_shapes[1]));
            return {ga, gb};
        default:
            break;
    }

    auto a = wrap(bw.a, dev, e.name);
    auto b = wrap(bw.b, dev, e.name);
    switch (bw.type) {
        case BinaryOpType::MUL:
            if (need_a) ga = core::mul(nullptr, g, b);
            if (need_b) gb = core::mul(nullptr, g, a);
            break;
        case BinaryOpType::DIV:
            if (need_a) ga = core::div(nullptr, g, b);
            if (need_b) gb = core::neg(nullptr, core::div(nullptr, core::mul(nullptr, g, a), core::square(nullptr, b)));
            break;
        case BinaryOpType::POW:
            // d/da a^b = b a^(b-1), d/db a^b = a^b log a
            if (need_a) ga = core::mul(nullptr, g, core::mul(nullptr, b, core::pow(nullptr, a, core::sub(nullptr, b, 1.0))));
            if (need_b) gb = core::mul(nullptr, g, core::mul(nullptr, wrap(bw.y, dev, e.name), core::log(nullptr, a)));
            break;
        case BinaryOpType::MAXIMUM:
            if (need_a) ga = core::mul(nullptr, g, tie_split(a, b));
            if (need_b) gb = core::mul(nullptr, g, tie_split(b, a));
            break;
        case BinaryOpType::MINIMUM:
            if (need_a) ga = core::mul(nullptr, g, tie_split(b, a));
            if (need_b) gb = core::mul(nullptr, g, tie_split(a, b));
            break;
        default:
            throw Error(std::string("backward(") + e.name + "): " + backend::to_string(bw.type) + " is not differentiable");
    }
    if (ga) ga = core::sum_to_shape(ga, e.input_shapes[0]);
    if (gb) gb = core::sum_to_shape(gb, e.input_shapes[1]);
    return {ga, gb};
}

std::vector<TensorRef> scalar_grad(const TapeEntry& e, const ScalarBackward& bw, const ConstRef& g) {
    using backend::BinaryOpType;
    const double s = bw.scalar;
    switch (bw.type) {
        case BinaryOpType::ADD:
            return {core::sum_to_shape(g, g->shape())};
        case BinaryOpType::SUB:
            return {bw.scalar_first ? core::neg(nullptr, g) : core::sum_to_shape(g, g->shape())};
        case BinaryOpType::MUL:
            return {core::mul(nullptr, g, s)};
        case BinaryOpType::DIV: {
            if (!bw.scalar_first) return {core::div(nullptr, g, s)};
            // d/dx s/x = -s/x^2
            auto x = wrap(bw.x, e.device, e.name);
            return {core::neg(nullptr, core::div(nullptr, core::mul(nullptr, g, s), core::square(nullptr, x)))};
        }
        case BinaryOpType::POW: {
            auto x = wrap(bw.x, e.device, e.name);
            return {core::mul(nullptr, g, core::mul(nullptr, core::pow(nullptr, x, s - 1.0), s))};
        }
        default:
            throw Error(std::string("backward(") + e.name + "): " + backend::to_string(bw.type) + " is not differentiable");
    }
}

std::vector<TensorRef> reduce_grad(const TapeEntry& e, const ReduceBackward& bw, const ConstRef& g) {
    const auto& in_shape = e.input_shapes[0];
    auto gb = expand_reduced(g, in_shape, bw.axes);
    if (bw.type == backend::ReduceOpType::SUM) {
        if (bw.count > 1) return {core::div(nullptr, gb, static_cast<double>(bw.count))};
        return {gb};
    }
    // MAX/MIN: every element equal to the extreme gets the full gradient.
    auto x = wrap(bw.x, e.device, e.name);
    auto y = wrap(bw.y, e.device, e.name);
    auto mask = core::cmp_eq(x, expand_reduced(y, in_shape, bw.axes));
    return {core::mul(nullptr, gb, mask)};
}

std::vector<TensorRef> matmul_grad(const TapeEntry& e, const MatMulBackward& bw, const ConstRef& g) {
    TensorRef ga, gb;
    if (e.needs_grad[0]) {
        auto b = wrap(bw.b, e.device, e.name);
        ga = core::matmul(nullptr, g, core::transpose(nullptr, b));
    }
    if (e.needs_grad[1]) {
        auto a = wrap(bw.a, e.device, e.name);
        gb = core::matmul(nullptr, core::transpose(nullptr, a), g);
    }
    return {ga, gb};
}

std::vector<TensorRef> conv2d_grad(const TapeEntry& e, const Conv2dBackward& bw, const ConstRef& g) {
    TensorRef gx, gw;
    if (e.needs_grad[0]) {
        gx = run(e.device, backend::Conv2dGradInputOp{bw.params}, {&g->storage(), &bw.w}, e.input_shapes[0], g->dtype());
    }
    if (e.needs_grad[1]) {
        gw = run(e.device, backend::Conv2dGradWeightOp{bw.params}, {&bw.x, &g->storage()}, e.input_shapes[1], g->dtype());
    }
    return {gx, gw};
}

std::vector<TensorRef> slice_grad(const TapeEntry& e, const SliceBackward& bw, const ConstRef& g) {
    auto grad = core::zeros(e.input_shapes[0], e.device->type(), g->dtype());
    backend::StorageDescriptor window = grad->storage().slice(bw.begin, bw.end, bw.step);
    backend::execute(e.device, backend::CopyOp{}, {&g->storage()}, window);
    return {grad};
}

std::vector<TensorRef> stack_grad(const TapeEntry& e, const StackBackward& bw, const ConstRef& g) {
    std::vector<TensorRef> out(e.inputs.size());
    std::vector<size_t> begin(g->rank(), 0), end = g->shape();
    for (size_t i = 0; i < e.inputs.size(); ++i) {
        if (!e.needs_grad[i]) continue;
        begin[bw.axis] = i;
        end[bw.axis] = i + 1;
        auto part = core::slice(nullptr, g, begin, end);
        out[i] = core::reshape(nullptr, part, e.input_shapes[i]);
    }
    return out;
}

} // namespace

std::vector<TensorRef> compute_gradients(const TapeEntry& entry, const ConstRef& grad_out) {
    core::check_live(grad_out, entry.name);
    return std::visit([&](const auto& bw) -> std::vector<TensorRef> {
        using T = std::decay_t<decltype(bw)>;
        const ConstRef& g = grad_out;
        if constexpr (std::is_same_v<T, UnaryBackward>) {
            return unary_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, BinaryBackward>) {
            return binary_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, ScalarBackward>) {
            return scalar_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, ReduceBackward>) {
            return reduce_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, MatMulBackward>) {
            return matmul_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, Conv2dBackward>) {
            return conv2d_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, Pool2dBackward>) {
            return {run(entry.device, backend::Pool2dGradOp{bw.params}, {&bw.x, &bw.y, &g->storage()}, entry.input_shapes[0], g->dtype())};
        } else if constexpr (std::is_same_v<T, ReshapeBackward>) {
            return {core::reshape(nullptr, g, entry.input_shapes[0])};
        } else if constexpr (std::is_same_v<T, PermuteBackward>) {
            return {core::permute(nullptr, g, utils::shape::inverse_permutation(bw.perm))};
        } else if constexpr (std::is_same_v<T, BroadcastBackward>) {
            return {core::sum_to_shape(g, entry.input_shapes[0])};
        } else if constexpr (std::is_same_v<T, SliceBackward>) {
            return slice_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, StackBackward>) {
            return stack_grad(entry, bw, g);
        } else if constexpr (std::is_same_v<T, TransferBackward>) {
            return {core::to(nullptr, g, bw.source)};
        }
    }, entry.backward);
}

} // namespace autograd
} // namespace tapegrad
