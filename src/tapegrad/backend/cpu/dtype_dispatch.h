// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <string>
#include <cstdint>
#include "tapegrad/errors.h"
#include "tapegrad/backend/dtype.h"

namespace tapegrad {
namespace backend {
namespace cpu {

// Type tag carried into generic lambdas.
template <typename T> struct type_tag { using type = T; };

// Calls body(type_tag<T>{}) for the runtime dtype.
// Example:
//   dispatch_dtype(out.dtype(), [&](auto tag) {
//       using T = typename decltype(tag)::type;
//       unary_view_kernel<T>(...);
//   });
template <typename Body>
inline void dispatch_dtype(DType dt, Body&& body) {
    switch (dt) {
        case DType::FLOAT32: body(type_tag<float>{});   break;
        case DType::FLOAT64: body(type_tag<double>{});  break;
        case DType::INT32:   body(type_tag<int32_t>{}); break;
        case DType::INT64:   body(type_tag<int64_t>{}); break;
        case DType::BOOL8:   body(type_tag<uint8_t>{}); break;
        default:
            throw Error(std::string("dispatch_dtype: unsupported dtype ") + to_string(dt));
    }
}

// Floating point only (transcendental and gradient kernels).
template <typename Body>
inline void dispatch_floating(DType dt, const char* where, Body&& body) {
    switch (dt) {
        case DType::FLOAT32: body(type_tag<float>{});  break;
        case DType::FLOAT64: body(type_tag<double>{}); break;
        default:
            throw Error(std::string(where) + ": requires float32 or float64, got " + to_string(dt));
    }
}

} // namespace cpu
} // namespace backend
} // namespace tapegrad
