// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <string>
#include <algorithm>
#include "tapegrad/errors.h"
#include "tapegrad/utils/vector.h"

namespace tapegrad {
namespace utils {
namespace shape {

// NumPy-style broadcast: right-align, a dimension of 1 stretches.
inline std::vector<size_t> broadcast_shape(const std::vector<size_t>& a_shape, const std::vector<size_t>& b_shape) {
    const size_t max_rank = std::max(a_shape.size(), b_shape.size());
    std::vector<size_t> out_shape(max_rank);

    for (size_t i = 0; i < max_rank; ++i) {
        size_t dim_a = (i < a_shape.size()) ? a_shape[a_shape.size() - 1 - i] : 1;
        size_t dim_b = (i < b_shape.size()) ? b_shape[b_shape.size() - 1 - i] : 1;

        if (dim_a != dim_b && dim_a != 1 && dim_b != 1) {
            throw ShapeMismatchError("broadcast_shape: shapes are not broadcastable", a_shape, b_shape);
        }
        out_shape[max_rank - 1 - i] = (dim_a == 1) ? dim_b : dim_a;
    }
    return out_shape;
}

// Map possibly-negative axes to [0, rank). Throws on out of bounds.
inline std::vector<int> normalize_axes(const std::vector<int>& axes, size_t rank) {
    std::vector<int> out;
    out.reserve(axes.size());
    for (int ax : axes) {
        int a = ax < 0 ? ax + static_cast<int>(rank) : ax;
        if (a < 0 || a >= static_cast<int>(rank)) {
            throw ShapeMismatchError("normalize_axes: axis " + std::to_string(ax) + " out of bounds for rank " + std::to_string(rank));
        }
        out.push_back(a);
    }
    return out;
}

// Normalize, sort and dedup. An empty list means every axis.
inline std::vector<int> reduction_axes(const std::vector<int>& axes, size_t rank) {
    std::vector<int> out;
    if (axes.empty()) {
        out.resize(rank);
        for (size_t i = 0; i < rank; ++i) out[i] = static_cast<int>(i);
        return out;
    }
    out = normalize_axes(axes, rank);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// Output shape of a reduction over normalized axes. Reducing every axis
// without keep_dims gives rank 0.
inline std::vector<size_t> reduce_shape(const std::vector<size_t>& in_shape, const std::vector<int>& axes_norm, bool keep_dims) {
    std::vector<bool> reduce_mask(in_shape.size(), false);
    for (int a : axes_norm) reduce_mask[static_cast<size_t>(a)] = true;

    std::vector<size_t> out_shape;
    for (size_t i = 0; i < in_shape.size(); ++i) {
        if (reduce_mask[i]) {
            if (keep_dims) out_shape.push_back(1);
        } else {
            out_shape.push_back(in_shape[i]);
        }
    }
    return out_shape;
}

// Number of input elements folded into each output element.
inline size_t reduce_count(const std::vector<size_t>& in_shape, const std::vector<int>& axes_norm) {
    size_t count = 1;
    for (int a : axes_norm) count *= in_shape[static_cast<size_t>(a)];
    return count;
}

// Axes of `larger` that were broadcast from `smaller` (right aligned). The
// returned axes index `larger`.
inline std::vector<int> broadcast_axes(const std::vector<size_t>& larger, const std::vector<size_t>& smaller) {
    if (smaller.size() > larger.size()) {
        throw ShapeMismatchError("broadcast_axes: target rank exceeds source rank", larger, smaller);
    }
    std::vector<int> axes;
    const size_t rank_diff = larger.size() - smaller.size();
    for (size_t i = 0; i < rank_diff; ++i) axes.push_back(static_cast<int>(i));
    for (size_t i = 0; i < smaller.size(); ++i) {
        const size_t L = larger[i + rank_diff];
        const size_t S = smaller[i];
        if (S == 1 && L != 1) {
            axes.push_back(static_cast<int>(i + rank_diff));
        } else if (S != L) {
            throw ShapeMismatchError("broadcast_axes: shapes not broadcast-compatible", larger, smaller);
        }
    }
    return axes;
}

// Inverse permutation: inverse[axes[i]] = i.
inline std::vector<size_t> inverse_permutation(const std::vector<size_t>& axes) {
    std::vector<size_t> inv(axes.size());
    for (size_t i = 0; i < axes.size(); ++i) inv[axes[i]] = i;
    return inv;
}

// Row-major strides. For {A, B, C} the strides are {B*C, C, 1}.
inline std::vector<size_t> row_major_strides(const std::vector<size_t>& shape) {
    std::vector<size_t> strides(shape.size());
    size_t stride = 1;
    for (size_t i = shape.size(); i-- > 0; ) {
        strides[i] = stride;
        stride *= shape[i];
    }
    return strides;
}

// Dense row-major layout, independent of storage offset.
inline bool is_row_major_contiguous(const std::vector<size_t>& shape, const std::vector<size_t>& strides) {
    if (shape.size() != strides.size()) return false;
    size_t expected = 1;
    for (size_t i = shape.size(); i-- > 0; ) {
        // Size-1 axes never contribute to addressing.
        if (shape[i] != 1 && strides[i] != expected) return false;
        expected *= shape[i];
    }
    return true;
}

// Spatial output size of a sliding window: (in + 2*pad - k) / stride + 1.
inline size_t window_output_size(const char* where, size_t in, size_t k, size_t stride, size_t pad) {
    if (stride == 0) throw ShapeMismatchError(std::string(where) + ": stride must be positive");
    if (in + 2 * pad < k) {
        throw ShapeMismatchError(std::string(where) + ": window " + std::to_string(k) + " larger than padded input " + std::to_string(in + 2 * pad));
    }
    return (in + 2 * pad - k) / stride + 1;
}

// x (N,C,H,W) conv w (O,C,KH,KW) -> (N,O,OH,OW).
inline std::vector<size_t> conv2d_output_shape(const std::vector<size_t>& x, const std::vector<size_t>& w, size_t stride, size_t padding) {
    if (x.size() != 4 || w.size() != 4) {
        throw ShapeMismatchError("conv2d: expected NCHW input and OIHW weight", x, w);
    }
    if (x[1] != w[1]) {
        throw ShapeMismatchError("conv2d: input channels differ from weight channels", x, w);
    }
    return {x[0], w[0],
            window_output_size("conv2d", x[2], w[2], stride, padding),
            window_output_size("conv2d", x[3], w[3], stride, padding)};
}

// x (N,C,H,W) -> (N,C,OH,OW).
inline std::vector<size_t> pool2d_output_shape(const std::vector<size_t>& x, size_t kernel, size_t stride, size_t padding) {
    if (x.size() != 4) {
        throw ShapeMismatchError("pool2d: expected NCHW input, got " + vector::to_string(x));
    }
    if (kernel == 0) throw ShapeMismatchError("pool2d: kernel must be positive");
    if (2 * padding > kernel) {
        throw ShapeMismatchError("pool2d: padding " + std::to_string(padding) + " exceeds half the kernel " + std::to_string(kernel));
    }
    return {x[0], x[1],
            window_output_size("pool2d", x[2], kernel, stride, padding),
            window_output_size("pool2d", x[3], kernel, stride, padding)};
}

} // namespace shape
} // namespace utils
} // namespace tapegrad
