// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <string>
#include <type_traits>
#include "tapegrad/backend/dispatch.h"
#include "tapegrad/backend/allocator.h"
#include "tapegrad/backend/backend.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/backend/view.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/shape.h"

namespace tapegrad {
namespace backend {

namespace {

void check_buffer(const char* op_name, const Device* device, const StorageDescriptor& d, const char* role) {
    if (!d.buffer) {
        throw UseAfterFreeError(std::string("execute(") + op_name + "): " + role + " has no buffer");
    }
    if (d.buffer->device_type() != device->type()) {
        throw BackendMismatchError(std::string("execute(") + op_name + "): " + role + " resides on " +
                                   to_string(d.buffer->device_type()) + ", expected " + to_string(device->type()));
    }
}

void check_shape(const char* op_name, const std::vector<size_t>& got, const std::vector<size_t>& expected) {
    if (got != expected) {
        throw ShapeMismatchError(std::string("execute(") + op_name + ")", got, expected);
    }
}

} // namespace

StorageDescriptor allocate(Device* device, const std::vector<size_t>& shape, DType dtype) {
    if (!device) throw Error("allocate: null device");
    if (size(dtype) == 0) throw Error(std::string("allocate: unsupported dtype ") + to_string(dtype));
    auto buf = device->allocator()->allocate(utils::vector::numel(shape), dtype);
    return StorageDescriptor::contiguous(std::move(buf), shape);
}

void execute(Device* device, const Op& op_v, const std::vector<const StorageDescriptor*>& inputs, StorageDescriptor& out) {
    if (!device) throw Error("execute: null device");
    const char* op_name = to_string(op_v);

    if (inputs.size() != arity_of(op_v)) {
        throw Error(std::string("execute(") + op_name + "): expected " + std::to_string(arity_of(op_v)) +
                    " inputs, got " + std::to_string(inputs.size()));
    }
    check_buffer(op_name, device, out, "output");
    for (const StorageDescriptor* in : inputs) {
        if (!in) throw UseAfterFreeError(std::string("execute(") + op_name + "): null input descriptor");
        check_buffer(op_name, device, *in, "input");
        if (in->dtype != out.dtype) {
            throw Error(std::string("execute(") + op_name + "): dtype mismatch " + to_string(in->dtype) + " vs " + to_string(out.dtype));
        }
    }

    const Backend* be = device->backend();
    const View vo = View::from(out);

    std::visit([&](auto&& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, FillOp>) {
            be->fill(*out.buffer, vo, op.value);
        }
        else if constexpr (std::is_same_v<T, CopyOp>) {
            check_shape(op_name, inputs[0]->shape, out.shape);
            be->copy_view(*inputs[0]->buffer, View::from(*inputs[0]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, UnaryOp>) {
            check_shape(op_name, inputs[0]->shape, out.shape);
            be->unary_op(op.type, *inputs[0]->buffer, View::from(*inputs[0]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, BinaryOp>) {
            check_shape(op_name, inputs[0]->shape, out.shape);
            check_shape(op_name, inputs[1]->shape, out.shape);
            be->binary_op(op.type, *inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, ReduceOp>) {
            const auto axes = utils::shape::reduction_axes(op.axes, inputs[0]->rank());
            check_shape(op_name, out.shape, utils::shape::reduce_shape(inputs[0]->shape, axes, op.keep_dims));
            if (!vo.is_contiguous()) {
                throw Error("execute(ReduceOp): output must be contiguous");
            }
            be->reduce_op(op.type, *inputs[0]->buffer, View::from(*inputs[0]), *out.buffer, vo, axes, op.keep_dims);
        }
        else if constexpr (std::is_same_v<T, MatMulOp>) {
            const auto& a = inputs[0]->shape;
            const auto& b = inputs[1]->shape;
            if (a.size() != 2 || b.size() != 2 || a[1] != b[0]) {
                throw ShapeMismatchError("execute(MatMulOp)", a, b);
            }
            check_shape(op_name, out.shape, {a[0], b[1]});
            be->matmul(*inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, Conv2dOp>) {
            check_shape(op_name, out.shape, utils::shape::conv2d_output_shape(inputs[0]->shape, inputs[1]->shape, op.params.stride, op.params.padding));
            be->conv2d(op.params, *inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, Conv2dGradInputOp>) {
            // inputs: grad_y, w; out: grad_x
            check_shape(op_name, inputs[0]->shape, utils::shape::conv2d_output_shape(out.shape, inputs[1]->shape, op.params.stride, op.params.padding));
            be->conv2d_grad_input(op.params, *inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, Conv2dGradWeightOp>) {
            // inputs: x, grad_y; out: grad_w
            check_shape(op_name, inputs[1]->shape, utils::shape::conv2d_output_shape(inputs[0]->shape, out.shape, op.params.stride, op.params.padding));
            be->conv2d_grad_weight(op.params, *inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, Pool2dOp>) {
            check_shape(op_name, out.shape, utils::shape::pool2d_output_shape(inputs[0]->shape, op.params.kernel, op.params.stride, op.params.padding));
            be->pool2d(op.params, *inputs[0]->buffer, View::from(*inputs[0]), *out.buffer, vo);
        }
        else if constexpr (std::is_same_v<T, Pool2dGradOp>) {
            // inputs: x, y, grad_y; out: grad_x
            const auto y_shape = utils::shape::pool2d_output_shape(inputs[0]->shape, op.params.kernel, op.params.stride, op.params.padding);
            check_shape(op_name, inputs[1]->shape, y_shape);
            check_shape(op_name, inputs[2]->shape, y_shape);
            check_shape(op_name, out.shape, inputs[0]->shape);
            be->pool2d_grad(op.params, *inputs[0]->buffer, View::from(*inputs[0]), *inputs[1]->buffer, View::from(*inputs[1]),
                            *inputs[2]->buffer, View::from(*inputs[2]), *out.buffer, vo);
        }
    }, op_v);
}

} // namespace backend
} // namespace tapegrad
