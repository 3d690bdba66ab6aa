// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cmath>
#include <limits>
#include <vector>
#include <cstring>
#include <cstdint>
#include <algorithm>
#include <type_traits>

#include "tapegrad/backend/cpu/thread_runtime.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/backend/view.h"
#include "tapegrad/backend/op.h"
#include "tapegrad/utils/shape.h"

namespace tapegrad {
namespace backend {
namespace cpu {

// Helpers

template<typename T> inline T* ptr(Buffer& buf) { return static_cast<T*>(buf.data()); }
template<typename T> inline const T* ptr(const Buffer& buf) { return static_cast<const T*>(buf.data()); }

template<typename T> inline bool is_nan(T v) {
    if constexpr (std::is_floating_point<T>::value) return std::isnan(v);
    else return false;
}

// Identity element of MAX (lowest) and MIN (highest) reductions.
template<typename T> inline T lowest_value() {
    if constexpr (std::is_floating_point<T>::value) return -std::numeric_limits<T>::infinity();
    else return std::numeric_limits<T>::lowest();
}
template<typename T> inline T highest_value() {
    if constexpr (std::is_floating_point<T>::value) return std::numeric_limits<T>::infinity();
    else return std::numeric_limits<T>::max();
}

inline size_t index_from_coords(const View& v, const std::vector<size_t>& coords) {
    size_t idx = v.offset;
    for (size_t i = 0; i < v.rank; ++i) idx += coords[i] * static_cast<size_t>(v.strides[i]);
    return idx;
}

inline void coords_from_linear(size_t lin, const View& v, std::vector<size_t>& coords) {
    coords.assign(v.rank, 0);
    for (size_t d = v.rank; d-- > 0; ) {
        const size_t dim = static_cast<size_t>(v.shape[d]);
        coords[d] = (dim == 0) ? 0 : (lin % dim);
        lin       = (dim == 0) ? lin : (lin / dim);
    }
}

// Right-aligned broadcast of output coords onto an input view.
inline void map_out_to_in_coords_broadcast(const std::vector<size_t>& out_coords, const View& in_v, std::vector<size_t>& in_coords) {
    const size_t r_out = out_coords.size(), r_in = in_v.rank;
    in_coords.assign(r_in, 0);
    const size_t off = r_out - r_in;
    for (size_t i = 0; i < r_in; ++i) {
        in_coords[i] = (in_v.shape[i] == 1) ? 0 : out_coords[off + i];
    }
}

inline size_t at4(const View& v, size_t a, size_t b, size_t c, size_t d) {
    return (size_t)v.offset + a * v.strides[0] + b * v.strides[1] + c * v.strides[2] + d * v.strides[3];
}

// Data kernels

template<typename T>
inline void fill_view_kernel(Buffer& out, const View& vo, T value) {
    T* op = ptr<T>(out);
    if (!vo.numel) return;
    if (vo.is_contiguous()) {
        std::fill(op + vo.offset, op + vo.offset + vo.numel, value);
        return;
    }
    std::vector<size_t> coords;
    for (size_t lin = 0; lin < vo.numel; ++lin) {
        coords_from_linear(lin, vo, coords);
        op[index_from_coords(vo, coords)] = value;
    }
}

template<typename T>
inline void copy_view_kernel(const Buffer& src, const View& vs, Buffer& dst, const View& vd) {
    const T* sp = ptr<T>(src);
    T*       dp = ptr<T>(dst);
    const size_t nout = vd.numel;
    if (!nout) return;

    parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
        std::vector<size_t> ocoords, icoords;
        for (size_t lin = s; lin < e; ++lin) {
            coords_from_linear(lin, vd, ocoords);
            map_out_to_in_coords_broadcast(ocoords, vs, icoords);
            dp[index_from_coords(vd, ocoords)] = sp[index_from_coords(vs, icoords)];
        }
    });
}

// Elementwise kernels

template<typename T, typename UnaryFn>
inline void unary_view_kernel(const Buffer& a, const View& va, Buffer& out, const View& vo, UnaryFn fn) {
    const T* ap = ptr<T>(a);
    T* op = ptr<T>(out);
    const size_t nout = vo.numel;
    if (!nout) return;

    // Dense flat loop.
    if (va.is_contiguous() && vo.is_contiguous() && same_shape(va, vo)) {
        const T* a0 = ap + va.offset;
        T* o0 = op + vo.offset;
        parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
            for (size_t i = s; i < e; ++i) o0[i] = fn(a0[i]);
        });
        return;
    }

    parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
        std::vector<size_t> ocoords, icoords;
        for (size_t lin = s; lin < e; ++lin) {
            coords_from_linear(lin, vo, ocoords);
            map_out_to_in_coords_broadcast(ocoords, va, icoords);
            op[index_from_coords(vo, ocoords)] = fn(ap[index_from_coords(va, icoords)]);
        }
    });
}

template<typename T, typename BinaryFn>
inline void binary_view_kernel(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo, BinaryFn fn) {
    const T* ap = ptr<T>(a);
    const T* bp = ptr<T>(b);
    T* op = ptr<T>(out);
    const size_t nout = vo.numel;
    if (!nout) return;

    if (va.is_contiguous() && vb.is_contiguous() && vo.is_contiguous() && same_shape(va, vb) && same_shape(va, vo)) {
        const T* a0 = ap + va.offset;
        const T* b0 = bp + vb.offset;
        T* o0 = op + vo.offset;
        parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
            for (size_t i = s; i < e; ++i) o0[i] = fn(a0[i], b0[i]);
        });
        return;
    }

    // Scalar right operand (common for `x * c` style ops).
    if (va.is_contiguous() && vo.is_contiguous() && same_shape(va, vo) && vb.is_singleton()) {
        const T* a0 = ap + va.offset;
        const T bv = bp[vb.offset];
        T* o0 = op + vo.offset;
        parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
            for (size_t i = s; i < e; ++i) o0[i] = fn(a0[i], bv);
        });
        return;
    }

    parallel_for((size_t)0, nout, [&](size_t s, size_t e) {
        std::vector<size_t> ocoords, acoords, bcoords;
        for (size_t lin = s; lin < e; ++lin) {
            coords_from_linear(lin, vo, ocoords);
            map_out_to_in_coords_broadcast(ocoords, va, acoords);
            map_out_to_in_coords_broadcast(ocoords, vb, bcoords);
            op[index_from_coords(vo, ocoords)] = fn(ap[index_from_coords(va, acoords)], bp[index_from_coords(vb, bcoords)]);
        }
    });
}

// Reduction kernels

// Reduce the last axis only; one task per output row.
template<typename T, typename InitFn, typename AccFn>
inline void reduce_last_axis_kernel_view(const Buffer& a, const View& va, Buffer& out, const View& vo, bool keep_dims, InitFn init, AccFn acc_fn) {
    const T* ap = ptr<T>(a);
    T* op = ptr<T>(out);

    const size_t rank = va.rank;
    const size_t inner = (size_t)va.shape[rank - 1];
    const size_t outer = inner ? va.numel / inner : vo.numel;
    const size_t s_last = (size_t)va.strides[rank - 1];

    parallel_for((size_t)0, outer, [&](size_t s, size_t e) {
        std::vector<size_t> icoords(rank, 0), ocoords(vo.rank, 0);
        for (size_t oi = s; oi < e; ++oi) {
            // Unravel the outer index over dims [0, rank-1).
            size_t rem = oi;
            for (size_t d = rank - 1; d-- > 0; ) {
                const size_t dim = (size_t)va.shape[d];
                icoords[d] = dim ? rem % dim : 0;
                rem = dim ? rem / dim : rem;
            }
            icoords[rank - 1] = 0;
            for (size_t d = 0; d + 1 < rank; ++d) ocoords[d] = icoords[d];
            if (keep_dims) ocoords[rank - 1] = 0;

            const size_t row_in = index_from_coords(va, icoords);
            T acc = init();
            for (size_t j = 0; j < inner; ++j) acc_fn(acc, ap[row_in + j * s_last]);
            op[index_from_coords(vo, ocoords)] = acc;
        }
    });
}

// `axes` are normalized, sorted and unique. The output must be contiguous.
template<typename T, typename InitFn, typename AccFn>
inline void reduce_view_kernel(const Buffer& a, const View& va, Buffer& out, const View& vo,
                               const std::vector<int>& axes, bool keep_dims, InitFn init, AccFn acc_fn) {
    const T* ap = ptr<T>(a);
    T* optr = ptr<T>(out);

    const size_t nin  = va.numel;
    const size_t nout = vo.numel;
    if (nout == 0) return;

    const size_t rank = va.rank;
    std::vector<bool> reduce_mask(rank, false);
    for (int ax : axes) reduce_mask[(size_t)ax] = true;
    const bool reduce_all = (axes.size() == rank);

    // Reduce-all fast path (contiguous).
    if (reduce_all && va.is_contiguous()) {
        T acc = init();
        const T* a0 = ap + va.offset;
        for (size_t i = 0; i < nin; ++i) acc_fn(acc, a0[i]);
        optr[vo.offset] = acc;
        return;
    }

    // Last axis only, last axis contiguous.
    if (rank > 0 && axes.size() == 1 && (size_t)axes[0] == rank - 1 && va.last_axis_contiguous()) {
        reduce_last_axis_kernel_view<T>(a, va, out, vo, keep_dims, init, acc_fn);
        return;
    }

    for (size_t i = 0; i < nout; ++i) optr[vo.offset + i] = init();

    // General path (view-correct).
    std::vector<size_t> icoords, ocoords;
    ocoords.reserve(rank);
    for (size_t lin = 0; lin < nin; ++lin) {
        coords_from_linear(lin, va, icoords);
        ocoords.clear();
        for (size_t d = 0; d < rank; ++d) {
            if (!reduce_mask[d]) ocoords.push_back(icoords[d]);
            else if (keep_dims) ocoords.push_back(0);
        }
        T& slot = optr[index_from_coords(vo, ocoords)];
        acc_fn(slot, ap[index_from_coords(va, icoords)]);
    }
}

// Matmul

template<typename T>
inline void matmul_view_kernel(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) {
    const T* ap = ptr<T>(a);
    const T* bp = ptr<T>(b);
    T*       op = ptr<T>(out);

    const size_t M = (size_t)va.shape[0];
    const size_t K = (size_t)va.shape[1];
    const size_t N = (size_t)vb.shape[1];

    const bool fast_packed = va.is_rowmaj_nn_2d() && vo.is_rowmaj_nn_2d();

    // NN: A, B and out row-major. i-k-j order keeps B rows contiguous.
    if (fast_packed && vb.is_rowmaj_nn_2d()) {
        const T* ap0 = ap + (size_t)va.offset;
        const T* bp0 = bp + (size_t)vb.offset;
        T*       op0 = op + (size_t)vo.offset;

        constexpr size_t BJ = 128;
        constexpr size_t BK = 64;

        parallel_for((size_t)0, M, [&](size_t i0, size_t i1) {
            for (size_t i = i0; i < i1; ++i) {
                T* crow = op0 + i * N;
                for (size_t j = 0; j < N; ++j) crow[j] = T(0);
                const T* arow = ap0 + i * K;
                for (size_t kk = 0; kk < K; kk += BK) {
                    const size_t kend = std::min(K, kk + BK);
                    for (size_t jb = 0; jb < N; jb += BJ) {
                        const size_t jend = std::min(N, jb + BJ);
                        for (size_t k = kk; k < kend; ++k) {
                            const T av = arow[k];
                            const T* brow = bp0 + k * N;
                            for (size_t j = jb; j < jend; ++j) crow[j] += av * brow[j];
                        }
                    }
                }
            }
        });
        return;
    }

    // TN: B has strides [1, K] (a transposed row-major matrix), contiguous over k.
    if (fast_packed && vb.is_rowmaj_tn_2d()) {
        const T* ap0 = ap + (size_t)va.offset;
        const T* bp0 = bp + (size_t)vb.offset;
        T*       op0 = op + (size_t)vo.offset;

        parallel_for((size_t)0, M, [&](size_t i0, size_t i1) {
            for (size_t i = i0; i < i1; ++i) {
                const T* arow = ap0 + i * K;
                T* crow = op0 + i * N;
                for (size_t j = 0; j < N; ++j) {
                    const T* bcol = bp0 + j * K;
                    T sum = 0;
                    for (size_t k = 0; k < K; ++k) sum += arow[k] * bcol[k];
                    crow[j] = sum;
                }
            }
        });
        return;
    }

    // Generic stride-aware path.
    parallel_for((size_t)0, M, [&](size_t i0, size_t i1) {
        for (size_t i = i0; i < i1; ++i) {
            const size_t a_row = (size_t)va.offset + i * (size_t)va.strides[0];
            const size_t o_row = (size_t)vo.offset + i * (size_t)vo.strides[0];
            for (size_t j = 0; j < N; ++j) {
                const size_t b_col = (size_t)vb.offset + j * (size_t)vb.strides[1];
                T sum = 0;
                for (size_t k = 0; k < K; ++k) {
                    sum += ap[a_row + k * (size_t)va.strides[1]] * bp[b_col + k * (size_t)vb.strides[0]];
                }
                op[o_row + j * (size_t)vo.strides[1]] = sum;
            }
        }
    });
}

// Convolution (direct). One task per (n, o) output plane.

template<typename T>
inline void conv2d_view_kernel(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) {
    const T* xp = ptr<T>(x);
    const T* wp = ptr<T>(w);
    T* op = ptr<T>(out);

    const size_t N = vx.shape[0], C = vx.shape[1], H = vx.shape[2], W = vx.shape[3];
    const size_t O = vw.shape[0], KH = vw.shape[2], KW = vw.shape[3];
    const size_t OH = vo.shape[2], OW = vo.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride;

    parallel_for((size_t)0, N * O, [&](size_t s, size_t e) {
        for (size_t idx = s; idx < e; ++idx) {
            const size_t n = idx / O, o = idx % O;
            for (size_t oh = 0; oh < OH; ++oh) {
                for (size_t ow = 0; ow < OW; ++ow) {
                    T acc = 0;
                    for (size_t c = 0; c < C; ++c) {
                        for (size_t kh = 0; kh < KH; ++kh) {
                            const long ih = (long)oh * stride + (long)kh - pad;
                            if (ih < 0 || ih >= (long)H) continue;
                            for (size_t kw = 0; kw < KW; ++kw) {
                                const long iw = (long)ow * stride + (long)kw - pad;
                                if (iw < 0 || iw >= (long)W) continue;
                                acc += xp[at4(vx, n, c, (size_t)ih, (size_t)iw)] * wp[at4(vw, o, c, kh, kw)];
                            }
                        }
                    }
                    op[at4(vo, n, o, oh, ow)] = acc;
                }
            }
        }
    });
}

// grad_x[n,c,ih,iw] = sum over (o,kh,kw) of grad_y[n,o,oh,ow] * w[o,c,kh,kw]
// where ih = oh*stride + kh - pad. One task per (n, c) plane.
template<typename T>
inline void conv2d_grad_input_view_kernel(const Conv2dParams& p, const Buffer& g, const View& vg, const Buffer& w, const View& vw, Buffer& gx, const View& vi) {
    const T* gp = ptr<T>(g);
    const T* wp = ptr<T>(w);
    T* ip = ptr<T>(gx);

    const size_t N = vi.shape[0], C = vi.shape[1], H = vi.shape[2], W = vi.shape[3];
    const size_t O = vw.shape[0], KH = vw.shape[2], KW = vw.shape[3];
    const size_t OH = vg.shape[2], OW = vg.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride;

    parallel_for((size_t)0, N * C, [&](size_t s, size_t e) {
        for (size_t idx = s; idx < e; ++idx) {
            const size_t n = idx / C, c = idx % C;
            for (size_t ih = 0; ih < H; ++ih) {
                for (size_t iw = 0; iw < W; ++iw) {
                    T acc = 0;
                    for (size_t kh = 0; kh < KH; ++kh) {
                        const long th = (long)ih + pad - (long)kh;
                        if (th < 0 || th % stride != 0) continue;
                        const long oh = th / stride;
                        if (oh >= (long)OH) continue;
                        for (size_t kw = 0; kw < KW; ++kw) {
                            const long tw = (long)iw + pad - (long)kw;
                            if (tw < 0 || tw % stride != 0) continue;
                            const long ow = tw / stride;
                            if (ow >= (long)OW) continue;
                            for (size_t o = 0; o < O; ++o) {
                                acc += gp[at4(vg, n, o, (size_t)oh, (size_t)ow)] * wp[at4(vw, o, c, kh, kw)];
                            }
                        }
                    }
                    ip[at4(vi, n, c, ih, iw)] = acc;
                }
            }
        }
    });
}

// grad_w[o,c,kh,kw] = sum over (n,oh,ow) of x[n,c,ih,iw] * grad_y[n,o,oh,ow].
// One task per (o, c).
template<typename T>
inline void conv2d_grad_weight_view_kernel(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& g, const View& vg, Buffer& gw, const View& vw) {
    const T* xp = ptr<T>(x);
    const T* gp = ptr<T>(g);
    T* wp = ptr<T>(gw);

    const size_t N = vx.shape[0], C = vx.shape[1], H = vx.shape[2], W = vx.shape[3];
    const size_t O = vw.shape[0], KH = vw.shape[2], KW = vw.shape[3];
    const size_t OH = vg.shape[2], OW = vg.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride;

    parallel_for((size_t)0, O * C, [&](size_t s, size_t e) {
        for (size_t idx = s; idx < e; ++idx) {
            const size_t o = idx / C, c = idx % C;
            for (size_t kh = 0; kh < KH; ++kh) {
                for (size_t kw = 0; kw < KW; ++kw) {
                    T acc = 0;
                    for (size_t n = 0; n < N; ++n) {
                        for (size_t oh = 0; oh < OH; ++oh) {
                            const long ih = (long)oh * stride + (long)kh - pad;
                            if (ih < 0 || ih >= (long)H) continue;
                            for (size_t ow = 0; ow < OW; ++ow) {
                                const long iw = (long)ow * stride + (long)kw - pad;
                                if (iw < 0 || iw >= (long)W) continue;
                                acc += xp[at4(vx, n, c, (size_t)ih, (size_t)iw)] * gp[at4(vg, n, o, oh, ow)];
                            }
                        }
                    }
                    wp[at4(vw, o, c, kh, kw)] = acc;
                }
            }
        }
    });
}

// Pooling. One task per (n, c) plane.

template<typename T>
inline void pool2d_view_kernel(const Pool2dParams& p, const Buffer& x, const View& vx, Buffer& out, const View& vo) {
    const T* xp = ptr<T>(x);
    T* op = ptr<T>(out);

    const size_t N = vx.shape[0], C = vx.shape[1], H = vx.shape[2], W = vx.shape[3];
    const size_t OH = vo.shape[2], OW = vo.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride, K = (long)p.kernel;
    const T area = static_cast<T>(p.kernel * p.kernel);

    parallel_for((size_t)0, N * C, [&](size_t s, size_t e) {
        for (size_t idx = s; idx < e; ++idx) {
            const size_t n = idx / C, c = idx % C;
            for (size_t oh = 0; oh < OH; ++oh) {
                for (size_t ow = 0; ow < OW; ++ow) {
                    T acc = (p.type == PoolType::MAX) ? lowest_value<T>() : T(0);
                    for (long kh = 0; kh < K; ++kh) {
                        const long ih = (long)oh * stride + kh - pad;
                        if (ih < 0 || ih >= (long)H) continue;
                        for (long kw = 0; kw < K; ++kw) {
                            const long iw = (long)ow * stride + kw - pad;
                            if (iw < 0 || iw >= (long)W) continue;
                            const T v = xp[at4(vx, n, c, (size_t)ih, (size_t)iw)];
                            if (p.type == PoolType::MAX) {
                                if (is_nan(v) || v > acc) acc = v;
                            } else {
                                acc += v;
                            }
                        }
                    }
                    op[at4(vo, n, c, oh, ow)] = (p.type == PoolType::MAX) ? acc : acc / area;
                }
            }
        }
    });
}

// MAX routes grad_y to every window element equal to the pooled value.
// AVG spreads grad_y / (k*k) over the window. Windows may overlap, so
// grad_in is zeroed first and accumulated per (n, c) plane.
template<typename T>
inline void pool2d_grad_view_kernel(const Pool2dParams& p, const Buffer& x, const View& vx, const Buffer& y, const View& vy,
                                    const Buffer& g, const View& vg, Buffer& gx, const View& vi) {
    const T* xp = ptr<T>(x);
    const T* yp = ptr<T>(y);
    const T* gp = ptr<T>(g);
    T* ip = ptr<T>(gx);

    const size_t N = vx.shape[0], C = vx.shape[1], H = vx.shape[2], W = vx.shape[3];
    const size_t OH = vg.shape[2], OW = vg.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride, K = (long)p.kernel;
    const T area = static_cast<T>(p.kernel * p.kernel);

    parallel_for((size_t)0, N * C, [&](size_t s, size_t e) {
        for (size_t idx = s; idx < e; ++idx) {
            const size_t n = idx / C, c = idx % C;
            for (size_t ih = 0; ih < H; ++ih)
                for (size_t iw = 0; iw < W; ++iw) ip[at4(vi, n, c, ih, iw)] = T(0);

            for (size_t oh = 0; oh < OH; ++oh) {
                for (size_t ow = 0; ow < OW; ++ow) {
                    const T gv = gp[at4(vg, n, c, oh, ow)];
                    const T yv = (p.type == PoolType::MAX) ? yp[at4(vy, n, c, oh, ow)] : T(0);
                    for (long kh = 0; kh < K; ++kh) {
                        const long ih = (long)oh * stride + kh - pad;
                        if (ih < 0 || ih >= (long)H) continue;
                        for (long kw = 0; kw < K; ++kw) {
                            const long iw = (long)ow * stride + kw - pad;
                            if (iw < 0 || iw >= (long)W) continue;
                            const size_t ii = at4(vi, n, c, (size_t)ih, (size_t)iw);
                            if (p.type == PoolType::MAX) {
                                const T xv = xp[at4(vx, n, c, (size_t)ih, (size_t)iw)];
                                if (xv == yv) ip[ii] += gv;
                            } else {
                                ip[ii] += gv / area;
                            }
                        }
                    }
                }
            }
        }
    });
}

} // namespace cpu
} // namespace backend
} // namespace tapegrad
