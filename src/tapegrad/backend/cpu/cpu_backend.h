// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include "tapegrad/backend/backend.h"
#include "tapegrad/backend/view.h"

namespace tapegrad {
namespace backend {
namespace cpu {

// Portable host kernels. Subclassed by the BLAS backend, which replaces the
// dense linear algebra paths and inherits everything else.
class CPUBackend : public Backend {
public:
    const char* name() const override { return "CPU"; }

    // Data Ops
    void fill(Buffer& out, const View& vo, double value) const override;
    void copy_view(const Buffer& src, const View& vs, Buffer& dst, const View& vd) const override;

    // Main Compute Ops
    void unary_op(UnaryOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo) const override;
    void binary_op(BinaryOpType op_type, const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const override;
    void reduce_op(ReduceOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo, const std::vector<int>& axes, bool keep_dims) const override;
    void matmul(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const override;

    // Convolution
    void conv2d(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) const override;
    void conv2d_grad_input(const Conv2dParams& p, const Buffer& grad_out, const View& vg, const Buffer& w, const View& vw, Buffer& grad_in, const View& vi) const override;
    void conv2d_grad_weight(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& grad_out, const View& vg, Buffer& grad_w, const View& vw) const override;

    // Pooling
    void pool2d(const Pool2dParams& p, const Buffer& x, const View& vx, Buffer& out, const View& vo) const override;
    void pool2d_grad(const Pool2dParams& p, const Buffer& x, const View& vx, const Buffer& y, const View& vy, const Buffer& grad_out, const View& vg, Buffer& grad_in, const View& vi) const override;
};

// Registers DeviceType::CPU with the DeviceManager.
void register_device();

} // namespace cpu
} // namespace backend
} // namespace tapegrad
