// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace tapegrad {
namespace backend {

enum class DType {
    INT32,
    INT64,
    FLOAT32,
    FLOAT64,
    BOOL8,
    UNKNOWN
};

inline const char* to_string(DType dt) {
    switch (dt) {
        case DType::INT32:   return "int32";
        case DType::INT64:   return "int64";
        case DType::FLOAT32: return "float32";
        case DType::FLOAT64: return "float64";
        case DType::BOOL8:   return "bool8";
        default:             return "unknown";
    }
}

// Size in bytes.
inline constexpr size_t size(DType dtype) {
    switch (dtype) {
        case DType::INT32:   return sizeof(int32_t);
        case DType::INT64:   return sizeof(int64_t);
        case DType::FLOAT32: return sizeof(float);
        case DType::FLOAT64: return sizeof(double);
        case DType::BOOL8:   return sizeof(uint8_t);
        default:             return 0;
    }
}

// Only floating point tensors can request gradients.
inline constexpr bool is_floating(DType dtype) {
    return dtype == DType::FLOAT32 || dtype == DType::FLOAT64;
}

// Compile-time mapping.
template<typename T>
constexpr DType dtype_of() {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if      constexpr (std::is_same<U, float>::value)   return DType::FLOAT32;
    else if constexpr (std::is_same<U, double>::value)  return DType::FLOAT64;
    else if constexpr (std::is_same<U, int32_t>::value) return DType::INT32;
    else if constexpr (std::is_same<U, int64_t>::value) return DType::INT64;
    else if constexpr (std::is_same<U, uint8_t>::value) return DType::BOOL8;
    else return DType::UNKNOWN;
}

template<typename T>
constexpr DType dtype_v = dtype_of<T>();

} // namespace backend
} // namespace tapegrad
