// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <cstddef>
#include <variant>
#include <type_traits>

namespace tapegrad {
namespace backend {

// Closed set of kernel operations a Backend executes. Reshape/view,
// permute, broadcast and slice are descriptor derivations (storage.h);
// CopyOp materializes any of them.

// Data
struct FillOp { double value = 0.0; };
// Materialize the input layout into the output layout (same shape). The
// input may carry zero strides (broadcast).
struct CopyOp {};

// Elementwise, one input.
//   RELU: x > 0 ? x : 0.  SIGN: -1, 0 or +1 (NaN stays NaN).
//   LOG/SQRT of negative input give NaN (IEEE).
enum class UnaryOpType { NEG, EXP, LOG, RELU, TANH, SIGMOID, SQUARE, SQRT, ABS, SIN, COS, SIGN };
struct UnaryOp { UnaryOpType type; };

// Elementwise, two inputs of the output's shape (broadcast views allowed).
//   MAXIMUM/MINIMUM: NaN if either operand is NaN.
//   CMP_EQ/CMP_GT: 1 or 0 in the operand dtype.
enum class BinaryOpType { ADD, SUB, MUL, DIV, POW, MAXIMUM, MINIMUM, CMP_EQ, CMP_GT };
struct BinaryOp { BinaryOpType type; };

// Reduction over `axes` (normalized, sorted, unique; empty = all axes).
//   SUM: NaN propagates; empty reduction gives 0.
//   MAX/MIN: any NaN in the window gives NaN; empty reduction gives -inf/+inf.
enum class ReduceOpType { SUM, MAX, MIN };
struct ReduceOp { ReduceOpType type; std::vector<int> axes; bool keep_dims = false; };

// (M,K) x (K,N) -> (M,N). Any strides.
struct MatMulOp {};

// NCHW input, OIHW weight, square stride/padding, no dilation or groups.
// Output spatial size: (H + 2*padding - K) / stride + 1.
struct Conv2dParams { size_t stride = 1; size_t padding = 0; };
struct Conv2dOp           { Conv2dParams params; }; // inputs: x, w           -> y
struct Conv2dGradInputOp  { Conv2dParams params; }; // inputs: grad_y, w      -> grad_x
struct Conv2dGradWeightOp { Conv2dParams params; }; // inputs: x, grad_y      -> grad_w

// NCHW pooling. AVG divides by kernel*kernel (padding counts as zero). MAX
// ignores padding; NaN propagates.
enum class PoolType { MAX, AVG };
struct Pool2dParams { PoolType type = PoolType::MAX; size_t kernel = 2; size_t stride = 2; size_t padding = 0; };
struct Pool2dOp     { Pool2dParams params; }; // inputs: x                  -> y
struct Pool2dGradOp { Pool2dParams params; }; // inputs: x, y, grad_y       -> grad_x

using Op = std::variant<
    FillOp,
    CopyOp,
    UnaryOp,
    BinaryOp,
    ReduceOp,
    MatMulOp,
    Conv2dOp,
    Conv2dGradInputOp,
    Conv2dGradWeightOp,
    Pool2dOp,
    Pool2dGradOp
>;

enum class OpKind { DATA, ELEMENTWISE, REDUCTION, MATMUL, CONVOLUTION, POOLING };

inline const char* to_string(OpKind kind) {
    switch (kind) {
        case OpKind::DATA:        return "DATA";
        case OpKind::ELEMENTWISE: return "ELEMENTWISE";
        case OpKind::REDUCTION:   return "REDUCTION";
        case OpKind::MATMUL:      return "MATMUL";
        case OpKind::CONVOLUTION: return "CONVOLUTION";
        case OpKind::POOLING:     return "POOLING";
    }
    return "UNKNOWN";
}

inline const char* to_string(UnaryOpType t) {
    switch (t) {
        case UnaryOpType::NEG:     return "neg";
        case UnaryOpType::EXP:     return "exp";
        case UnaryOpType::LOG:     return "log";
        case UnaryOpType::RELU:    return "relu";
        case UnaryOpType::TANH:    return "tanh";
        case UnaryOpType::SIGMOID: return "sigmoid";
        case UnaryOpType::SQUARE:  return "square";
        case UnaryOpType::SQRT:    return "sqrt";
        case UnaryOpType::ABS:     return "abs";
        case UnaryOpType::SIN:     return "sin";
        case UnaryOpType::COS:     return "cos";
        case UnaryOpType::SIGN:    return "sign";
    }
    return "unknown";
}

inline const char* to_string(BinaryOpType t) {
    switch (t) {
        case BinaryOpType::ADD:     return "add";
        case BinaryOpType::SUB:     return "sub";
        case BinaryOpType::MUL:     return "mul";
        case BinaryOpType::DIV:     return "div";
        case BinaryOpType::POW:     return "pow";
        case BinaryOpType::MAXIMUM: return "maximum";
        case BinaryOpType::MINIMUM: return "minimum";
        case BinaryOpType::CMP_EQ:  return "cmp_eq";
        case BinaryOpType::CMP_GT:  return "cmp_gt";
    }
    return "unknown";
}

inline const char* to_string(ReduceOpType t) {
    switch (t) {
        case ReduceOpType::SUM: return "sum";
        case ReduceOpType::MAX: return "max";
        case ReduceOpType::MIN: return "min";
    }
    return "unknown";
}

inline const char* to_string(const FillOp&)             { return "FillOp"; }
inline const char* to_string(const CopyOp&)             { return "CopyOp"; }
inline const char* to_string(const UnaryOp&)            { return "UnaryOp"; }
inline const char* to_string(const BinaryOp&)           { return "BinaryOp"; }
inline const char* to_string(const ReduceOp&)           { return "ReduceOp"; }
inline const char* to_string(const MatMulOp&)           { return "MatMulOp"; }
inline const char* to_string(const Conv2dOp&)           { return "Conv2dOp"; }
inline const char* to_string(const Conv2dGradInputOp&)  { return "Conv2dGradInputOp"; }
inline const char* to_string(const Conv2dGradWeightOp&) { return "Conv2dGradWeightOp"; }
inline const char* to_string(const Pool2dOp&)           { return "Pool2dOp"; }
inline const char* to_string(const Pool2dGradOp&)       { return "Pool2dGradOp"; }

inline const char* to_string(const Op& op_v) {
    return std::visit([](const auto& op) -> const char* { return to_string(op); }, op_v);
}

// Compile-time traits.
template <class T>
inline constexpr OpKind op_kind_v =
    std::is_same_v<T, UnaryOp> || std::is_same_v<T, BinaryOp> ? OpKind::ELEMENTWISE :
    std::is_same_v<T, ReduceOp>                                ? OpKind::REDUCTION   :
    std::is_same_v<T, MatMulOp>                                ? OpKind::MATMUL      :
    std::is_same_v<T, Conv2dOp> || std::is_same_v<T, Conv2dGradInputOp> ||
    std::is_same_v<T, Conv2dGradWeightOp>                      ? OpKind::CONVOLUTION :
    std::is_same_v<T, Pool2dOp> || std::is_same_v<T, Pool2dGradOp> ? OpKind::POOLING :
                                                                 OpKind::DATA;

template <class T>
inline constexpr size_t op_arity_v =
    std::is_same_v<T, FillOp>       ? 0 :
    std::is_same_v<T, CopyOp>   || std::is_same_v<T, UnaryOp> ||
    std::is_same_v<T, ReduceOp> || std::is_same_v<T, Pool2dOp> ? 1 :
    std::is_same_v<T, Pool2dGradOp> ? 3 :
                                      2;

// Runtime.
inline OpKind kind_of(const Op& op_v) {
    return std::visit([](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        return op_kind_v<T>;
    }, op_v);
}

inline size_t arity_of(const Op& op_v) {
    return std::visit([](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        return op_arity_v<T>;
    }, op_v);
}

} // namespace backend
} // namespace tapegrad
