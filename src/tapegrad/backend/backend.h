// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <cstddef>
#include "tapegrad/backend/op.h"
#include "tapegrad/backend/view.h"

namespace tapegrad {
namespace backend {

class Buffer;

// Kernel library of one compute target. Every method writes into `out`
// through its View; inputs are never modified. Buffers passed in are resident
// on this backend's device (checked by dispatch).
class Backend {
public:
    virtual ~Backend() = default;

    virtual const char* name() const = 0;

    // Data Ops
    virtual void fill(Buffer& out, const View& vo, double value) const = 0;
    virtual void copy_view(const Buffer& src, const View& vs, Buffer& dst, const View& vd) const = 0;

    // Main Compute Ops
    virtual void unary_op(UnaryOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo) const = 0;
    virtual void binary_op(BinaryOpType op_type, const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const = 0;
    virtual void reduce_op(ReduceOpType op_type, const Buffer& a, const View& va, Buffer& out, const View& vo, const std::vector<int>& axes, bool keep_dims) const = 0;
    virtual void matmul(const Buffer& a, const View& va, const Buffer& b, const View& vb, Buffer& out, const View& vo) const = 0;

    // Convolution
    virtual void conv2d(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& w, const View& vw, Buffer& out, const View& vo) const = 0;
    virtual void conv2d_grad_input(const Conv2dParams& p, const Buffer& grad_out, const View& vg, const Buffer& w, const View& vw, Buffer& grad_in, const View& vi) const = 0;
    virtual void conv2d_grad_weight(const Conv2dParams& p, const Buffer& x, const View& vx, const Buffer& grad_out, const View& vg, Buffer& grad_w, const View& vw) const = 0;

    // Pooling
    virtual void pool2d(const Pool2dParams& p, const Buffer& x, const View& vx, Buffer& out, const View& vo) const = 0;
    virtual void pool2d_grad(const Pool2dParams& p, const Buffer& x, const View& vx, const Buffer& y, const View& vy, const Buffer& grad_out, const View& vg, Buffer& grad_in, const View& vi) const = 0;

    // Block until all queued work is complete. Synchronous backends do nothing.
    virtual void synchronize() const {}
};

} // namespace backend
} // namespace tapegrad
