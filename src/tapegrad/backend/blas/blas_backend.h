// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include "tapegrad/backend/cpu/cpu_backend.h"

namespace tapegrad {
namespace backend {
namespace blas {

// Host backend that routes float/double GEMM (matmul, and conv2d through
// im2col) to CBLAS. Layouts CBLAS cannot express, and integer dtypes, fall
// back to the inherited CPU kernels.
class BLASBackend final : public cpu::CPUBackend {
public:
    const char* name() const override { return "BLAS"; }

    void matmul(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const override;
    void conv2d(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) const override;
};

// Registers DeviceType::BLAS with the DeviceManager.
void register_device();

} // namespace blas
} // namespace backend
} // namespace tapegrad
