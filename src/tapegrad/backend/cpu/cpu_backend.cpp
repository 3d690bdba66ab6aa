// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cmath>
#include <cstring>
#include <limits>
#include <algorithm>
#include <type_traits>
#include "tapegrad/backend/cpu/cpu_backend.h"
#include "tapegrad/backend/cpu/cpu_kernels.h"
#include "tapegrad/backend/cpu/dtype_dispatch.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/errors.h"

namespace tapegrad {
namespace backend {
namespace cpu {

// Buffer operations

void CPUBackend::fill(Buffer& out, const View& vo, double value) const {
    dispatch_dtype(out.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        fill_view_kernel<T>(out, vo, static_cast<T>(value));
    });
}

void CPUBackend::copy_view(const Buffer& src, const View& vs, Buffer& dst, const View& vd) const {
    // Single fast path: dense row-major on both sides, same logical shape.
    if (vs.is_contiguous() && vd.is_contiguous() && same_shape(vs, vd)) {
        const size_t item  = size(dst.dtype());
        const size_t bytes = vd.numel * item;
        const uint8_t* sp = static_cast<const uint8_t*>(src.data()) + (size_t)vs.offset * item;
        uint8_t*       dp = static_cast<uint8_t*>(dst.data())       + (size_t)vd.offset * item;
        if (bytes) std::memcpy(dp, sp, bytes);
        return;
    }
    // Fallback: typed elementwise mapping (handles broadcast and strides).
    dispatch_dtype(dst.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        copy_view_kernel<T>(src, vs, dst, vd);
    });
}

// Compute ops (view-aware)

void CPUBackend::unary_op(UnaryOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo) const {
    dispatch_dtype(out.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        auto fn = [op_type](T x) -> T {
            const double d = static_cast<double>(x);
            switch (op_type) {
                case UnaryOpType::NEG:     return static_cast<T>(-x);
                case UnaryOpType::EXP:     return static_cast<T>(std::exp(d));
                case UnaryOpType::LOG:     return static_cast<T>(std::log(d));
                case UnaryOpType::RELU:    return x > T(0) ? x : T(0);
                case UnaryOpType::TANH:    return static_cast<T>(std::tanh(d));
                case UnaryOpType::SIGMOID: return static_cast<T>(1.0 / (1.0 + std::exp(-d)));
                case UnaryOpType::SQUARE:  return static_cast<T>(x * x);
                case UnaryOpType::SQRT:    return static_cast<T>(std::sqrt(d));
                case UnaryOpType::ABS:     return x < T(0) ? static_cast<T>(-x) : x;
                case UnaryOpType::SIN:     return static_cast<T>(std::sin(d));
                case UnaryOpType::COS:     return static_cast<T>(std::cos(d));
                case UnaryOpType::SIGN:
                    if (x > T(0)) return T(1);
                    if (x < T(0)) return static_cast<T>(-1);
                    return x; // 0 stays 0, NaN stays NaN
            }
            return x;
        };
        unary_view_kernel<T>(a, va, out, vo, fn);
    });
}

void CPUBackend::binary_op(BinaryOpType op_type, const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const {
    dispatch_dtype(out.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        auto fn = [op_type](T x, T y) -> T {
            switch (op_type) {
                case BinaryOpType::ADD: return static_cast<T>(x + y);
                case BinaryOpType::SUB: return static_cast<T>(x - y);
                case BinaryOpType::MUL: return static_cast<T>(x * y);
                case BinaryOpType::DIV:
                    if constexpr (!std::is_floating_point<T>::value) {
                        if (y == T(0)) throw Error("div: integer division by zero");
                    }
                    return static_cast<T>(x / y);
                case BinaryOpType::POW:     return static_cast<T>(std::pow(static_cast<double>(x), static_cast<double>(y)));
                case BinaryOpType::MAXIMUM: return is_nan(x) ? x : (is_nan(y) ? y : std::max(x, y));
                case BinaryOpType::MINIMUM: return is_nan(x) ? x : (is_nan(y) ? y : std::min(x, y));
                case BinaryOpType::CMP_EQ:  return T(x == y);
                case BinaryOpType::CMP_GT:  return T(x > y);
            }
            return T(0);
        };
        binary_view_kernel<T>(a, va, b, vb, out, vo, fn);
    });
}

void CPUBackend::reduce_op(ReduceOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo, const std::vector<int>& axes, bool keep_dims) const {
    dispatch_dtype(out.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        switch (op_type) {
            case ReduceOpType::SUM: {
                auto init = []() { return T(0); };
                auto acc  = [](T& acc, T v) { acc = static_cast<T>(acc + v); };
                reduce_view_kernel<T>(a, va, out, vo, axes, keep_dims, init, acc);
                break;
            }
            case ReduceOpType::MAX: {
                // Once acc is NaN no comparison succeeds, so NaN sticks.
                auto init = []() { return lowest_value<T>(); };
                auto acc  = [](T& acc, T v) { if (is_nan(v) || v > acc) acc = v; };
                reduce_view_kernel<T>(a, va, out, vo, axes, keep_dims, init, acc);
                break;
            }
            case ReduceOpType::MIN: {
                auto init = []() { return highest_value<T>(); };
                auto acc  = [](T& acc, T v) { if (is_nan(v) || v < acc) acc = v; };
                reduce_view_kernel<T>(a, va, out, vo, axes, keep_dims, init, acc);
                break;
            }
        }
    });
}

void CPUBackend::matmul(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const {
    dispatch_dtype(out.dtype(), [&](auto tag) {
        using T = typename decltype(tag)::type;
        matmul_view_kernel<T>(a, va, b, vb, out, vo);
    });
}

// Convolution

void CPUBackend::conv2d(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) const {
    dispatch_floating(out.dtype(), "conv2d", [&](auto tag) {
        using T = typename decltype(tag)::type;
        conv2d_view_kernel<T>(p, x, vx, w, vw, out, vo);
    });
}

void CPUBackend::conv2d_grad_input(const Conv2dParams& p, const Buffer& grad_out, const View& vg, const Buffer& w, const View& vw, Buffer& grad_in, const View& vi) const {
    dispatch_floating(grad_in.dtype(), "conv2d_grad_input", [&](auto tag) {
        using T = typename decltype(tag)::type;
        conv2d_grad_input_view_kernel<T>(p, grad_out, vg, w, vw, grad_in, vi);
    });
}

void CPUBackend::conv2d_grad_weight(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& grad_out, const View& vg, Buffer& grad_w, const View& vw) const {
    dispatch_floating(grad_w.dtype(), "conv2d_grad_weight", [&](auto tag) {
        using T = typename decltype(tag)::type;
        conv2d_grad_weight_view_kernel<T>(p, x, vx, grad_out, vg, grad_w, vw);
    });
}

// Pooling

void CPUBackend::pool2d(const Pool2dParams& p, const Buffer& x, const View& vx, Buffer& out, const View& vo) const {
    dispatch_floating(out.dtype(), "pool2d", [&](auto tag) {
        using T = typename decltype(tag)::type;
        pool2d_view_kernel<T>(p, x, vx, out, vo);
    });
}

void CPUBackend::pool2d_grad(const Pool2dParams& p, const Buffer& x, const View& vx, const Buffer& y, const View& vy, const Buffer& grad_out, const View& vg, Buffer& grad_in, const View& vi) const {
    dispatch_floating(grad_in.dtype(), "pool2d_grad", [&](auto tag) {
        using T = typename decltype(tag)::type;
        pool2d_grad_view_kernel<T>(p, x, vx, y, vy, grad_out, vg, grad_in, vi);
    });
}

} // namespace cpu
} // namespace backend
} // namespace tapegrad
