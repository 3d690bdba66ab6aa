// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <string>
#include <cuda_runtime.h>
#include <cublas_v2.h>
#include "tapegrad/errors.h"

namespace tapegrad {
namespace backend {
namespace cuda {

// CUDA runtime or cuBLAS failure, with the call site.
class CudaError : public Error {
public:
    CudaError(cudaError_t status, const char* expr, const char* file, int line)
        : Error(std::string("CUDA error ") + cudaGetErrorName(status) + " (" + cudaGetErrorString(status) + ") in " +
                expr + " at " + file + ":" + std::to_string(line)),
          _status(status) {}

    cudaError_t status() const noexcept { return _status; }

private:
    cudaError_t _status;
};

inline const char* cublas_status_name(cublasStatus_t status) {
    switch (status) {
        case CUBLAS_STATUS_SUCCESS:          return "CUBLAS_STATUS_SUCCESS";
        case CUBLAS_STATUS_NOT_INITIALIZED:  return "CUBLAS_STATUS_NOT_INITIALIZED";
        case CUBLAS_STATUS_ALLOC_FAILED:     return "CUBLAS_STATUS_ALLOC_FAILED";
        case CUBLAS_STATUS_INVALID_VALUE:    return "CUBLAS_STATUS_INVALID_VALUE";
        case CUBLAS_STATUS_ARCH_MISMATCH:    return "CUBLAS_STATUS_ARCH_MISMATCH";
        case CUBLAS_STATUS_MAPPING_ERROR:    return "CUBLAS_STATUS_MAPPING_ERROR";
        case CUBLAS_STATUS_EXECUTION_FAILED: return "CUBLAS_STATUS_EXECUTION_FAILED";
        case CUBLAS_STATUS_INTERNAL_ERROR:   return "CUBLAS_STATUS_INTERNAL_ERROR";
        case CUBLAS_STATUS_NOT_SUPPORTED:    return "CUBLAS_STATUS_NOT_SUPPORTED";
        default:                             return "<unknown cuBLAS status>";
    }
}

inline void check(cudaError_t status, const char* expr, const char* file, int line) {
    if (status != cudaSuccess) throw CudaError(status, expr, file, line);
}

inline void check(cublasStatus_t status, const char* expr, const char* file, int line) {
    if (status != CUBLAS_STATUS_SUCCESS) {
        throw Error(std::string("cuBLAS error ") + cublas_status_name(status) + " in " + expr + " at " + file + ":" + std::to_string(line));
    }
}

} // namespace cuda
} // namespace backend
} // namespace tapegrad

#define TAPEGRAD_CUDA_CHECK(expr) ::tapegrad::backend::cuda::check((expr), #expr, __FILE__, __LINE__)
