// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include "tapegrad/errors.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/backend/dtype.h"
#include "tapegrad/utils/shape.h"
#include "tapegrad/utils/vector.h"

namespace tapegrad {
namespace backend {

// Layout of a tensor over a backend allocation. Several descriptors may share
// one buffer, each with its own shape/strides/offset (views).
// Strides and offset are in elements.
struct StorageDescriptor {
    static StorageDescriptor contiguous(std::shared_ptr<Buffer> buf, std::vector<size_t> shape, size_t offset = 0) {
        StorageDescriptor d;
        d.dtype = buf ? buf->dtype() : DType::UNKNOWN;
        d.buffer = std::move(buf);
        d.shape = std::move(shape);
        d.strides = utils::shape::row_major_strides(d.shape);
        d.offset = offset;
        d.is_contiguous = true;
        d.validate("StorageDescriptor::contiguous");
        return d;
    }

    static StorageDescriptor strided(std::shared_ptr<Buffer> buf, std::vector<size_t> shape, std::vector<size_t> strides, size_t offset = 0) {
        StorageDescriptor d;
        d.dtype = buf ? buf->dtype() : DType::UNKNOWN;
        d.buffer = std::move(buf);
        d.shape = std::move(shape);
        d.strides = std::move(strides);
        d.offset = offset;
        d.recompute_contiguity();
        d.validate("StorageDescriptor::strided");
        return d;
    }

    // View derivations. All share `buffer`.

    StorageDescriptor reshape(const std::vector<size_t>& new_shape) const {
        if (utils::vector::numel(shape) != utils::vector::numel(new_shape)) {
            throw ShapeMismatchError("reshape: element count mismatch", shape, new_shape);
        }
        if (!is_contiguous) {
            throw Error("reshape: non-contiguous view must be materialized first");
        }
        StorageDescriptor d = *this;
        d.shape = new_shape;
        d.strides = utils::shape::row_major_strides(d.shape);
        d.is_contiguous = true;
        return d;
    }

    StorageDescriptor permute(const std::vector<size_t>& perm) const {
        if (perm.size() != shape.size()) {
            throw ShapeMismatchError("permute: expected " + std::to_string(shape.size()) + " axes, got " + std::to_string(perm.size()));
        }
        std::vector<char> seen(perm.size(), 0);
        for (size_t p : perm) {
            if (p >= perm.size() || seen[p]) throw ShapeMismatchError("permute: invalid permutation " + utils::vector::to_string(perm));
            seen[p] = 1;
        }
        StorageDescriptor d = *this;
        for (size_t i = 0; i < perm.size(); ++i) {
            d.shape[i]   = shape[perm[i]];
            d.strides[i] = strides[perm[i]];
        }
        d.recompute_contiguity();
        return d;
    }

    // Right-aligned broadcast; stretched axes get stride 0.
    StorageDescriptor broadcast_to(const std::vector<size_t>& out_shape) const {
        const size_t r_in = shape.size();
        const size_t r_out = out_shape.size();
        if (r_in > r_out) {
            throw ShapeMismatchError("broadcast_to: cannot broadcast to a lower rank", shape, out_shape);
        }
        StorageDescriptor d = *this;
        d.shape = out_shape;
        d.strides.assign(r_out, 0);
        for (size_t i = 0; i < r_out; ++i) {
            const size_t out_dim   = out_shape[r_out - 1 - i];
            const size_t in_dim    = (i < r_in) ? shape[r_in - 1 - i] : 1;
            const size_t in_stride = (i < r_in) ? strides[r_in - 1 - i] : 0;
            if (in_dim == out_dim) {
                d.strides[r_out - 1 - i] = in_stride;
            } else if (in_dim == 1) {
                d.strides[r_out - 1 - i] = 0;
            } else {
                throw ShapeMismatchError("broadcast_to: incompatible shapes", shape, out_shape);
            }
        }
        d.recompute_contiguity();
#ifdef TAPEGRAD_DEBUG
        d.validate("broadcast_to");
#endif
        return d;
    }

    // Half-open [begin, end) per axis with positive step.
    StorageDescriptor slice(const std::vector<size_t>& begin, const std::vector<size_t>& end, const std::vector<size_t>& step) const {
        const size_t R = shape.size();
        if (begin.size() != R || end.size() != R || step.size() != R) {
            throw ShapeMismatchError("slice: expected " + std::to_string(R) + " bounds per argument");
        }
        StorageDescriptor d = *this;
        for (size_t i = 0; i < R; ++i) {
            if (begin[i] > end[i] || end[i] > shape[i]) {
                throw ShapeMismatchError("slice: bounds [" + std::to_string(begin[i]) + "," + std::to_string(end[i]) +
                                         ") out of range for axis " + std::to_string(i) + " of size " + std::to_string(shape[i]));
            }
            if (step[i] == 0) throw Error("slice: step must be positive");
            d.shape[i]   = (end[i] - begin[i] + step[i] - 1) / step[i];
            d.strides[i] = strides[i] * step[i];
            d.offset    += begin[i] * strides[i];
        }
        d.recompute_contiguity();
#ifdef TAPEGRAD_DEBUG
        d.validate("slice");
#endif
        return d;
    }

    // Insert a size-1 axis at `axis` (0..rank).
    StorageDescriptor unsqueeze(size_t axis) const {
        if (axis > shape.size()) {
            throw ShapeMismatchError("unsqueeze: axis " + std::to_string(axis) + " out of range for rank " + std::to_string(shape.size()));
        }
        StorageDescriptor d = *this;
        d.shape.insert(d.shape.begin() + static_cast<std::ptrdiff_t>(axis), 1);
        d.strides.insert(d.strides.begin() + static_cast<std::ptrdiff_t>(axis), 0);
        d.recompute_contiguity();
        return d;
    }

    size_t numel() const { return utils::vector::numel(shape); }
    size_t rank() const { return shape.size(); }
    bool has_buffer() const { return buffer != nullptr; }

    // Dense, offset 0 and no stretched axes. Gradient buffers must be dense.
    bool is_dense() const {
        if (!is_contiguous || offset != 0) return false;
        for (size_t i = 0; i < shape.size(); ++i) {
            if (strides[i] == 0 && shape[i] > 1) return false;
        }
        return true;
    }

    void recompute_contiguity() {
        is_contiguous = utils::shape::is_row_major_contiguous(shape, strides);
    }

    // Every addressable element lies inside the buffer.
    void validate(const char* where) const {
        if (shape.size() != strides.size()) {
            throw ShapeMismatchError(std::string(where) + ": shape/strides rank differ", shape, strides);
        }
        if (!buffer) return;
        if (numel() == 0) return;
        size_t max_index = offset;
        for (size_t i = 0; i < shape.size(); ++i) max_index += (shape[i] - 1) * strides[i];
        if (max_index >= buffer->numel()) {
            throw ShapeMismatchError(std::string(where) + ": layout addresses element " + std::to_string(max_index) +
                                     " of a " + std::to_string(buffer->numel()) + " element buffer");
        }
    }

    DType dtype = DType::UNKNOWN;
    std::vector<size_t> shape;
    std::vector<size_t> strides;
    size_t offset = 0;
    bool is_contiguous = true;
    std::shared_ptr<Buffer> buffer;
};

} // namespace backend
} // namespace tapegrad
