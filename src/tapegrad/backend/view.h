// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cstddef>
#include <cstdint>
#include "tapegrad/errors.h"
#include "tapegrad/backend/storage.h"

namespace tapegrad {
namespace backend {

constexpr int kMaxRank = 8;

// Bit flags for fast paths.
enum ViewFlags : uint32_t {
    VIEW_CONTIGUOUS          = 1u << 0,  // dense row-major layout for this shape (offset may be non-zero)
    VIEW_LAST_AXIS_CONTIG    = 1u << 1,  // stride[last] == 1 (rank > 0)
    VIEW_SINGLETON           = 1u << 2,  // numel == 1

    // 2D layout classification (matmul planning)
    VIEW2D_LAYOUT_SHIFT      = 8,
    VIEW2D_LAYOUT_MASK       = 0xFu << VIEW2D_LAYOUT_SHIFT,
    VIEW2D_ROWMAJ_NN         = 1u << VIEW2D_LAYOUT_SHIFT, // strides [N,1]
    VIEW2D_ROWMAJ_TN         = 2u << VIEW2D_LAYOUT_SHIFT  // strides [1,M] (transposed)
};

// Largest extent, stride or offset a View can index.
constexpr size_t kMaxViewIndex = UINT32_MAX;

// Fixed-size kernel view of a StorageDescriptor. Trivially copyable so it can
// be passed by value to device kernels.
struct View {
    uint32_t rank = 0;
    uint32_t shape[kMaxRank]   = {0};
    uint32_t strides[kMaxRank] = {0};
    uint32_t offset = 0;
    uint32_t flags  = 0;
    size_t   numel  = 1;

    bool is_contiguous()        const { return (flags & VIEW_CONTIGUOUS)       != 0; }
    bool last_axis_contiguous() const { return (flags & VIEW_LAST_AXIS_CONTIG) != 0; }
    bool is_singleton()         const { return (flags & VIEW_SINGLETON)        != 0; }
    bool is_rowmaj_nn_2d()      const { return (rank == 2) && ((flags & VIEW2D_ROWMAJ_NN) != 0); }
    bool is_rowmaj_tn_2d()      const { return (rank == 2) && ((flags & VIEW2D_ROWMAJ_TN) != 0); }

    // Throws ShapeMismatchError when an extent, stride, offset or the
    // largest reachable element index does not fit in 32 bits.
    static View from(const StorageDescriptor& desc) {
        View v{};
        v.rank = static_cast<uint32_t>(desc.shape.size());
        if (v.rank > kMaxRank) throw Error("View::from: rank " + std::to_string(v.rank) + " exceeds kMaxRank");

        if (desc.offset > kMaxViewIndex) {
            throw ShapeMismatchError("View::from: offset " + std::to_string(desc.offset) + " exceeds 32-bit indexing");
        }
        size_t numel = 1;
        size_t last = desc.offset;
        for (uint32_t i = 0; i < v.rank; ++i) {
            if (desc.shape[i] == 0) numel = 0;
            else numel *= desc.shape[i];
        }
        if (numel != 0) {
            for (uint32_t i = 0; i < v.rank; ++i) {
                const size_t step = desc.strides[i];
                const size_t span = desc.shape[i] - 1;
                if (step != 0 && span > (kMaxViewIndex - last) / step) {
                    throw ShapeMismatchError("View::from: layout exceeds 32-bit indexing", desc.shape, desc.strides);
                }
                last += span * step;
            }
        }
        for (uint32_t i = 0; i < v.rank; ++i) {
            if (desc.shape[i] > kMaxViewIndex || desc.strides[i] > kMaxViewIndex) {
                throw ShapeMismatchError("View::from: extent exceeds 32-bit indexing", desc.shape, desc.strides);
            }
            v.shape[i]   = static_cast<uint32_t>(desc.shape[i]);
            v.strides[i] = static_cast<uint32_t>(desc.strides[i]);
        }
        v.offset = static_cast<uint32_t>(desc.offset);

        #ifdef TAPEGRAD_DEBUG
            if (utils::shape::is_row_major_contiguous(desc.shape, desc.strides) != desc.is_contiguous) {
                throw Error("View::from: descriptor contiguity flag is stale");
            }
        #endif
        if (desc.is_contiguous) v.flags |= VIEW_CONTIGUOUS;
        if (v.rank > 0 && v.strides[v.rank - 1] == 1) v.flags |= VIEW_LAST_AXIS_CONTIG;

        v.numel = numel;
        if (numel == 1) v.flags |= VIEW_SINGLETON;

        if (v.rank == 2) {
            const uint32_t M = v.shape[0], N = v.shape[1];
            const uint32_t s0 = v.strides[0], s1 = v.strides[1];
            if (s1 == 1 && s0 == N)      v.flags |= VIEW2D_ROWMAJ_NN;
            else if (s0 == 1 && s1 == M) v.flags |= VIEW2D_ROWMAJ_TN;
        }
        return v;
    }
};

inline bool same_shape(const View& a, const View& b) {
    if (a.rank != b.rank) return false;
    for (uint32_t i = 0; i < a.rank; ++i) if (a.shape[i] != b.shape[i]) return false;
    return true;
}

} // namespace backend
} // namespace tapegrad
