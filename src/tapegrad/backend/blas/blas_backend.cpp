// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <vector>
#include <algorithm>
#include <cblas.h>
#include "tapegrad/backend/blas/blas_backend.h"
#include "tapegrad/backend/cpu/cpu_kernels.h"
#include "tapegrad/backend/cpu/dtype_dispatch.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {
namespace backend {
namespace blas {

namespace {

// How a rank-2 view maps onto a CBLAS row-major operand.
struct GemmOperand {
    bool ok = false;
    CBLAS_TRANSPOSE trans = CblasNoTrans;
    int ld = 0;
};

// [rows, cols] with strides [ld, 1] is NoTrans; strides [1, ld] is the
// transpose of a row-major (cols, rows) matrix.
GemmOperand classify(const View& v) {
    GemmOperand g;
    if (v.rank != 2) return g;
    const uint32_t rows = v.shape[0], cols = v.shape[1];
    const uint32_t s0 = v.strides[0], s1 = v.strides[1];
    if ((s1 == 1 || cols <= 1) && s0 >= std::max(1u, cols)) {
        g.ok = true; g.trans = CblasNoTrans; g.ld = static_cast<int>(s0);
    } else if ((s0 == 1 || rows <= 1) && s1 >= std::max(1u, rows)) {
        g.ok = true; g.trans = CblasTrans; g.ld = static_cast<int>(s1);
    }
    return g;
}

void gemm(CBLAS_TRANSPOSE ta, CBLAS_TRANSPOSE tb, int M, int N, int K,
          const float* a, int lda, const float* b, int ldb, float* c, int ldc) {
    cblas_sgemm(CblasRowMajor, ta, tb, M, N, K, 1.0f, a, lda, b, ldb, 0.0f, c, ldc);
}

void gemm(CBLAS_TRANSPOSE ta, CBLAS_TRANSPOSE tb, int M, int N, int K,
          const double* a, int lda, const double* b, int ldb, double* c, int ldc) {
    cblas_dgemm(CblasRowMajor, ta, tb, M, N, K, 1.0, a, lda, b, ldb, 0.0, c, ldc);
}

template<typename T>
void im2col(const T* xp, const View& vx, size_t n, const Conv2dParams& p,
            size_t KH, size_t KW, size_t OH, size_t OW, T* cols) {
    const size_t C = vx.shape[1], H = vx.shape[2], W = vx.shape[3];
    const long pad = (long)p.padding, stride = (long)p.stride;
    const size_t ncols = OH * OW;
    cpu::parallel_for((size_t)0, C * KH * KW, [&](size_t s, size_t e) {
        for (size_t row = s; row < e; ++row) {
            const size_t c = row / (KH * KW), kh = (row / KW) % KH, kw = row % KW;
            T* dst = cols + row * ncols;
            for (size_t oh = 0; oh < OH; ++oh) {
                const long ih = (long)oh * stride + (long)kh - pad;
                for (size_t ow = 0; ow < OW; ++ow) {
                    const long iw = (long)ow * stride + (long)kw - pad;
                    const bool inside = ih >= 0 && ih < (long)H && iw >= 0 && iw < (long)W;
                    dst[oh * OW + ow] = inside ? xp[cpu::at4(vx, n, c, (size_t)ih, (size_t)iw)] : T(0);
                }
            }
        }
    });
}

} // namespace

void BLASBackend::matmul(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const {
    const DType dt = out.dtype();
    const GemmOperand ga = classify(va), gb = classify(vb), go = classify(vo);
    const bool floating = dt == DType::FLOAT32 || dt == DType::FLOAT64;
    if (!floating || !ga.ok || !gb.ok || !go.ok || go.trans != CblasNoTrans) {
        TAPEGRAD_LOG_DEBUG("BLAS matmul: " << to_string(dt) << " layout not expressible in CBLAS, using CPU kernel");
        cpu::CPUBackend::matmul(a, va, b, vb, out, vo);
        return;
    }

    const int M = static_cast<int>(va.shape[0]);
    const int K = static_cast<int>(va.shape[1]);
    const int N = static_cast<int>(vb.shape[1]);
    if (M == 0 || N == 0) return;
    if (K == 0) {
        fill(out, vo, 0.0);
        return;
    }

    if (dt == DType::FLOAT32) {
        gemm(ga.trans, gb.trans, M, N, K,
             cpu::ptr<float>(a) + va.offset, ga.ld,
             cpu::ptr<float>(b) + vb.offset, gb.ld,
             cpu::ptr<float>(out) + vo.offset, go.ld);
    } else {
        gemm(ga.trans, gb.trans, M, N, K,
             cpu::ptr<double>(a) + va.offset, ga.ld,
             cpu::ptr<double>(b) + vb.offset, gb.ld,
             cpu::ptr<double>(out) + vo.offset, go.ld);
    }
}

// y[n] (O, OH*OW) = W (O, C*KH*KW) x im2col(x[n]) (C*KH*KW, OH*OW)
void BLASBackend::conv2d(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) const {
    const DType dt = out.dtype();
    if ((dt != DType::FLOAT32 && dt != DType::FLOAT64) || !vw.is_contiguous() || !vo.is_contiguous()) {
        TAPEGRAD_LOG_DEBUG("BLAS conv2d: falling back to CPU kernel");
        cpu::CPUBackend::conv2d(p, x, vx, w, vw, out, vo);
        return;
    }

    const size_t N = vx.shape[0], C = vx.shape[1];
    const size_t O = vw.shape[0], KH = vw.shape[2], KW = vw.shape[3];
    const size_t OH = vo.shape[2], OW = vo.shape[3];
    const size_t rows = C * KH * KW, ncols = OH * OW;
    if (vo.numel == 0) return;
    if (rows == 0) {
        fill(out, vo, 0.0);
        return;
    }

    cpu::dispatch_floating(dt, "conv2d", [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<T> cols(rows * ncols);
        const T* xp = cpu::ptr<T>(x);
        const T* wp = cpu::ptr<T>(w) + vw.offset;
        T* op = cpu::ptr<T>(out) + vo.offset;
        for (size_t n = 0; n < N; ++n) {
            im2col<T>(xp, vx, n, p, KH, KW, OH, OW, cols.data());
            gemm(CblasNoTrans, CblasNoTrans, (int)O, (int)ncols, (int)rows,
                 wp, (int)rows, cols.data(), (int)ncols, op + n * O * ncols, (int)ncols);
        }
    });
}

} // namespace blas
} // namespace backend
} // namespace tapegrad
