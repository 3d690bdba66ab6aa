// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cmath>
#include <string>
#include <vector>
#include <iostream>
#include <functional>
#include <stdexcept>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/core/tensor.h"
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/autograd/driver.h"
#include "tapegrad/errors.h"
#include "tests/helpers.h"

using namespace tapegrad;
using core::Tensor;
using utils::Ref;

using ScalarFn = std::function<Ref<Tensor>(autograd::Tape*, const Ref<const Tensor>&)>;

template <typename T>
static Ref<Tensor> param(const std::vector<T>& v, const std::vector<size_t>& shape) {
    auto t = core::from_vector(v, shape);
    t->set_requires_grad(true);
    return t;
}

static std::vector<float> grad_of(const std::vector<float>& v, const std::vector<size_t>& shape, const ScalarFn& f) {
    autograd::Tape tape;
    auto x = param(v, shape);
    auto grads = autograd::backward(f(&tape, x), tape);
    auto g = grads.take(x);
    if (!g) throw std::runtime_error("no gradient recorded");
    return g->to_vector<float>();
}

// Central differences in float64 against the taped gradient.
static void check_numeric(const std::string& name, const std::vector<double>& v, const std::vector<size_t>& shape,
                          const ScalarFn& f, double tol = 1e-6) {
    autograd::Tape tape;
    auto x = param(v, shape);
    auto grads = autograd::backward(f(&tape, x), tape);
    auto analytic = grads.take(x)->to_vector<double>();

    const double h = 1e-6;
    for (size_t i = 0; i < v.size(); ++i) {
        auto plus = v, minus = v;
        plus[i] += h;
        minus[i] -= h;
        const double fp = f(nullptr, core::from_vector(plus, shape))->item<double>();
        const double fm = f(nullptr, core::from_vector(minus, shape))->item<double>();
        EXPECT_CLOSE(analytic[i], (fp - fm) / (2.0 * h), tol, name + " idx=" + std::to_string(i));
    }
}

static void test_reference_values() {
    TEST_HEADER("reference gradients");
    auto g = grad_of({1.0f, 2.0f, 3.0f}, {3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, x));
    });
    expect_allclose(g, std::vector<float>{2.0f, 4.0f, 6.0f}, 1e-6, "sum(square(x))");

    g = grad_of({3.0f, 5.0f, 5.0f, 7.0f, 1.0f, 2.0f}, {2, 3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::max(t, x, {1}));
    });
    expect_allclose(g, std::vector<float>{0, 1, 1, 1, 0, 0}, 1e-6, "max ties get the full gradient");

    g = grad_of({4.0f, -1.0f, -1.0f, 2.0f}, {4}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::min(t, x);
    });
    expect_allclose(g, std::vector<float>{0, 1, 1, 0}, 1e-6, "global min ties");

    g = grad_of({1.0f, 2.0f, 3.0f}, {3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::broadcast_to(t, x, {2, 4, 3}));
    });
    expect_allclose(g, std::vector<float>{8.0f, 8.0f, 8.0f}, 1e-6, "broadcast then sum");

    g = grad_of(std::vector<float>(6, 1.0f), {2, 3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::mean(t, x);
    });
    expect_allclose(g, std::vector<float>(6, 1.0f / 6.0f), 1e-6, "mean");

    g = grad_of(std::vector<float>(6, 1.0f), {2, 3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::mean(t, x, {0}));
    });
    expect_allclose(g, std::vector<float>(6, 0.5f), 1e-6, "mean over axis 0");

    g = grad_of({-1.0f, 2.0f, 0.5f}, {3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::relu(t, x));
    });
    expect_allclose(g, std::vector<float>{0.0f, 1.0f, 1.0f}, 1e-6, "relu");

    g = grad_of({-2.0f, 3.0f}, {2}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::abs(t, x));
    });
    expect_allclose(g, std::vector<float>{-1.0f, 1.0f}, 1e-6, "abs");
}

static void test_maximum_tie_split() {
    TEST_HEADER("maximum/minimum: ties split evenly");
    autograd::Tape tape;
    auto a = param(std::vector<float>{1.0f, 2.0f, 3.0f}, {3});
    auto b = param(std::vector<float>{3.0f, 2.0f, 1.0f}, {3});
    auto grads = autograd::backward(core::sum(&tape, core::maximum(&tape, a, b)), tape);
    expect_allclose(grads.peek(a)->to_vector<float>(), std::vector<float>{0.0f, 0.5f, 1.0f}, 1e-6, "maximum grad a");
    expect_allclose(grads.peek(b)->to_vector<float>(), std::vector<float>{1.0f, 0.5f, 0.0f}, 1e-6, "maximum grad b");

    autograd::Tape tape2;
    auto grads2 = autograd::backward(core::sum(&tape2, core::minimum(&tape2, a, b)), tape2);
    expect_allclose(grads2.peek(a)->to_vector<float>(), std::vector<float>{1.0f, 0.5f, 0.0f}, 1e-6, "minimum grad a");
    expect_allclose(grads2.peek(b)->to_vector<float>(), std::vector<float>{0.0f, 0.5f, 1.0f}, 1e-6, "minimum grad b");
}

static void test_elementwise_numeric() {
    TEST_HEADER("elementwise gradients against central differences");
    const std::vector<double> pos = {0.5, 1.2, 2.0, 0.8};
    const std::vector<size_t> shape = {2, 2};
    auto unary = [&](const char* name, Ref<Tensor> (*op)(autograd::Tape*, const Ref<const Tensor>&)) {
        check_numeric(name, pos, shape, [op](autograd::Tape* t, const Ref<const Tensor>& x) {
            return core::sum(t, op(t, x));
        });
    };
    unary("neg", core::neg);
    unary("exp", core::exp);
    unary("log", core::log);
    unary("tanh", core::tanh);
    unary("sigmoid", core::sigmoid);
    unary("sqrt", core::sqrt);
    unary("sin", core::sin);
    unary("cos", core::cos);

    auto c = core::from_vector(std::vector<double>{1.5, 0.5, 2.5, 1.0}, shape);
    check_numeric("mul", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::mul(t, x, core::mul(t, x, c)));
    });
    check_numeric("div numerator", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::div(t, x, c));
    });
    check_numeric("div denominator", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::div(t, c, x));
    });
    check_numeric("pow base", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::pow(t, x, c));
    }, 1e-5);
    check_numeric("pow exponent", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::pow(t, c, x));
    }, 1e-5);
    check_numeric("sub", pos, shape, [c](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::mul(t, core::sub(t, c, x), x));
    });

    check_numeric("scalar rsub/rdiv", pos, shape, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::add(t, core::sub(t, 3.0, x), core::div(t, 2.0, x)));
    });
    check_numeric("scalar pow", pos, shape, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::pow(t, x, 3.0));
    }, 1e-5);
    check_numeric("scalar add/mul/div", pos, shape, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::div(t, core::mul(t, 4.0, core::add(t, x, 1.0)), 8.0));
    });

    auto row = core::from_vector(std::vector<double>{2.0, -1.0}, {2});
    check_numeric("broadcast mul", pos, shape, [row](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, core::mul(t, x, row)));
    });
}

static void test_broadcast_operand_gradient() {
    TEST_HEADER("binary: broadcast operand receives the reduced gradient");
    autograd::Tape tape;
    auto x = param(std::vector<float>{1, 2, 3, 4, 5, 6}, {2, 3});
    auto b = param(std::vector<float>{2.0f}, {1});
    auto loss = core::sum(&tape, core::mul(&tape, x, b));
    auto grads = autograd::backward(loss, tape);
    expect_allclose(grads.peek(b)->to_vector<float>(), std::vector<float>{21.0f}, 1e-5, "grad b = sum(x)");
    expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>(6, 2.0f), 1e-6, "grad x = b");
}

static void test_matmul_gradients() {
    TEST_HEADER("matmul: dA = g B^T, dB = A^T g");
    autograd::Tape tape;
    auto A = param(std::vector<float>{1, 2, 3, 4, 5, 6}, {2, 3});
    auto B = param(std::vector<float>{1, -1, 2, 0, 0.5f, 3}, {3, 2});
    auto grads = autograd::backward(core::sum(&tape, core::matmul(&tape, A, B)), tape);
    // Row sums of B, column sums of A.
    expect_allclose(grads.peek(A)->to_vector<float>(), std::vector<float>{0, 2, 3.5f, 0, 2, 3.5f}, 1e-6, "dA");
    expect_allclose(grads.peek(B)->to_vector<float>(), std::vector<float>{5, 5, 7, 7, 9, 9}, 1e-6, "dB");

    auto X = core::from_vector(std::vector<float>(6, 1.0f), {2, 3});
    EXPECT_THROWS(core::matmul(nullptr, X, X), ShapeMismatchError, "inner dimensions must agree");
    EXPECT_THROWS(core::matmul(nullptr, X, core::from_vector(std::vector<float>(3, 1.0f), {3})), ShapeMismatchError, "rank 2 only");
    EXPECT_THROWS(core::matmul(nullptr, X, core::ones({4, 5})), ShapeMismatchError, "(2,3) x (4,5)");

    {
        autograd::Tape t2;
        auto A2 = param(std::vector<float>{1, 2, 3, 4, 5, 6}, {2, 3});
        std::vector<float> bv(12);
        for (size_t i = 0; i < bv.size(); ++i) bv[i] = static_cast<float>(i + 1);
        auto B2 = param(bv, {3, 4});
        auto C = core::matmul(&t2, A2, B2);
        EXPECT_TRUE(C->shape() == std::vector<size_t>({2, 4}), "(2,3) x (3,4) -> (2,4)");
        auto g2 = autograd::backward(core::sum(&t2, C), t2);
        auto dA = g2.take(A2);
        auto dB = g2.take(B2);
        EXPECT_TRUE(dA && dA->shape() == std::vector<size_t>({2, 3}), "dA shape (2,3)");
        EXPECT_TRUE(dB && dB->shape() == std::vector<size_t>({3, 4}), "dB shape (3,4)");
        if (dA && dB) {
            expect_allclose(dA->to_vector<float>(), std::vector<float>{10, 26, 42, 10, 26, 42}, 1e-5, "dA (3,4) case");
            expect_allclose(dB->to_vector<float>(), std::vector<float>{5, 5, 5, 5, 7, 7, 7, 7, 9, 9, 9, 9}, 1e-5, "dB (3,4) case");
        }
    }

    check_numeric("matmul through transpose", {0.1, 0.2, 0.3, 0.4, 0.5, 0.6}, {3, 2}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, core::matmul(t, core::transpose(t, x), x)));
    }, 1e-5);
}

static void test_movement_gradients() {
    TEST_HEADER("movement ops route gradients back to the source layout");
    auto g = grad_of({1, 2, 3, 4}, {4}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::slice(t, x, {1}, {3}));
    });
    expect_allclose(g, std::vector<float>{0, 1, 1, 0}, 1e-6, "slice");

    g = grad_of({1, 2, 3, 4, 5, 6}, {6}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::slice(t, x, {0}, {6}, {2}));
    });
    expect_allclose(g, std::vector<float>{1, 0, 1, 0, 1, 0}, 1e-6, "strided slice");

    auto w = core::from_vector(std::vector<float>{1, 2, 3, 4, 5, 6}, {3, 2});
    g = grad_of({0, 0, 0, 0, 0, 0}, {2, 3}, [w](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::mul(t, core::transpose(t, x), w));
    });
    expect_allclose(g, std::vector<float>{1, 3, 5, 2, 4, 6}, 1e-6, "transpose");

    auto w6 = core::from_vector(std::vector<float>{1, 2, 3, 4, 5, 6}, {6});
    g = grad_of({0, 0, 0, 0, 0, 0}, {2, 3}, [w6](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::mul(t, core::reshape(t, core::transpose(t, x), {6}), w6));
    });
    // reshape(x^T)[j*2 + i] = x[i, j]
    expect_allclose(g, std::vector<float>{1, 3, 5, 2, 4, 6}, 1e-6, "reshape of a transposed view");

    g = grad_of({1, 2, 3}, {3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        auto u = core::unsqueeze(t, x, 0);
        return core::sum(t, core::mul(t, core::contiguous(t, u), u));
    });
    expect_allclose(g, std::vector<float>{2, 4, 6}, 1e-6, "unsqueeze and contiguous");

    g = grad_of({1, 2, 3, 4, 5, 6}, {1, 2, 3}, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        auto p = core::permute(t, x, {2, 0, 1});
        auto w = core::from_vector(std::vector<float>{1, 2, 3, 4, 5, 6}, {3, 1, 2});
        return core::sum(t, core::mul(t, p, w));
    });
    // p[k,0,i] = x[0,i,k] carries weight w[k,0,i] = 2k + i + 1
    expect_allclose(g, std::vector<float>{1, 3, 5, 2, 4, 6}, 1e-6, "permute");
}

static void test_stack_gradients() {
    TEST_HEADER("stack: each input receives its slice of the gradient");
    for (size_t axis = 0; axis < 2; ++axis) {
        autograd::Tape tape;
        auto a = param(std::vector<float>{1, 2}, {2});
        auto b = param(std::vector<float>{3, 4}, {2});
        auto s = core::stack(&tape, {a, b}, axis);
        EXPECT_TRUE(s->shape() == std::vector<size_t>({2, 2}), "stack shape");
        auto w = core::from_vector(std::vector<float>{1, 2, 3, 4}, {2, 2});
        auto grads = autograd::backward(core::sum(&tape, core::mul(&tape, s, w)), tape);
        const std::vector<float> ga = axis == 0 ? std::vector<float>{1, 2} : std::vector<float>{1, 3};
        const std::vector<float> gb = axis == 0 ? std::vector<float>{3, 4} : std::vector<float>{2, 4};
        expect_allclose(grads.peek(a)->to_vector<float>(), ga, 1e-6, "stack grad a axis=" + std::to_string(axis));
        expect_allclose(grads.peek(b)->to_vector<float>(), gb, 1e-6, "stack grad b axis=" + std::to_string(axis));
    }
    auto a = core::from_vector(std::vector<float>{1, 2}, {2});
    auto c = core::from_vector(std::vector<float>{1, 2, 3}, {3});
    EXPECT_THROWS(core::stack(nullptr, {a, c}), ShapeMismatchError, "stack of mismatched shapes");
    EXPECT_THROWS(core::stack(nullptr, {}), Error, "stack of nothing");
}

static void test_forward_edge_cases() {
    TEST_HEADER("forward edge cases");
    auto x = core::from_vector(std::vector<float>{1, 2, 3, 4, 5, 6}, {2, 3});
    auto y = core::from_vector(std::vector<float>{1, 2}, {2});
    EXPECT_THROWS(core::add(nullptr, x, y), ShapeMismatchError, "non-broadcastable shapes");
    EXPECT_THROWS(core::sum(nullptr, x, {2}), ShapeMismatchError, "reduction axis out of range");
    EXPECT_THROWS(core::reshape(nullptr, x, {4}), ShapeMismatchError, "reshape element count");

    auto s = core::sum(nullptr, x, {-1});
    expect_allclose(s->to_vector<float>(), std::vector<float>{6, 15}, 1e-6, "negative axis");
    EXPECT_TRUE(core::sum(nullptr, x)->rank() == 0, "full reduction is rank 0");
    EXPECT_CLOSE(core::max(nullptr, x)->item<float>(), 6.0f, 1e-6, "global max");

    auto n = core::from_vector(std::vector<float>{1.0f, NAN, 3.0f}, {3});
    EXPECT_TRUE(std::isnan(core::max(nullptr, n)->item<float>()), "max propagates NaN");
    EXPECT_TRUE(std::isnan(core::sum(nullptr, n)->item<float>()), "sum propagates NaN");

    auto i = core::from_vector(std::vector<int32_t>{1, 2}, {2});
    auto zero = core::from_vector(std::vector<int32_t>{1, 0}, {2});
    EXPECT_THROWS(core::div(nullptr, i, zero), Error, "integer division by zero");
    EXPECT_THROWS(core::add(nullptr, x, core::from_vector(std::vector<double>(6, 1.0), {2, 3})), Error, "dtype mismatch");
}

int main() {
    try {
        backend::DeviceManager::instance().init();

        test_reference_values();
        test_maximum_tie_split();
        test_elementwise_numeric();
        test_broadcast_operand_gradient();
        test_matmul_gradients();
        test_movement_gradients();
        test_stack_gradients();
        test_forward_edge_cases();

        return finish("GRADIENT");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
