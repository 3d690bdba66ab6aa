// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
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

static void check_numeric(const std::string& name, const std::vector<double>& v, const std::vector<size_t>& shape,
                          const ScalarFn& f, double tol = 1e-6) {
    autograd::Tape tape;
    auto x = core::from_vector(v, shape);
    x->set_requires_grad(true);
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

static std::vector<double> ramp(size_t n, double scale) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = scale * static_cast<double>((i * 7) % 11) - 0.4;
    return v;
}

static void test_conv2d_forward() {
    TEST_HEADER("conv2d forward");
    auto x = core::from_vector(std::vector<float>{1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 1, 3, 3});
    auto w = core::ones({1, 1, 2, 2});
    auto y = core::conv2d(nullptr, x, w);
    EXPECT_TRUE(y->shape() == std::vector<size_t>({1, 1, 2, 2}), "output shape");
    expect_allclose(y->to_vector<float>(), std::vector<float>{12, 16, 24, 28}, 1e-5, "2x2 box filter");

    auto yp = core::conv2d(nullptr, x, w, 2, 1);
    EXPECT_TRUE(yp->shape() == std::vector<size_t>({1, 1, 2, 2}), "stride 2 padding 1 shape");
    expect_allclose(yp->to_vector<float>(), std::vector<float>{1, 5, 11, 28}, 1e-5, "stride 2 padding 1 values");

    auto wc = core::ones({1, 2, 2, 2});
    EXPECT_THROWS(core::conv2d(nullptr, x, wc), ShapeMismatchError, "channel mismatch");
    auto big = core::ones({1, 1, 4, 4});
    EXPECT_THROWS(core::conv2d(nullptr, x, big), ShapeMismatchError, "kernel larger than input");
}

static void test_conv2d_gradients() {
    TEST_HEADER("conv2d gradients against central differences");
    const std::vector<size_t> xs = {2, 2, 4, 4}, ws = {3, 2, 3, 3};
    const auto xv = ramp(2 * 2 * 4 * 4, 0.1);
    const auto wv = ramp(3 * 2 * 3 * 3, 0.05);

    for (size_t stride : {1, 2}) {
        for (size_t padding : {0, 1}) {
            const std::string tag = " stride=" + std::to_string(stride) + " padding=" + std::to_string(padding);
            auto w = core::from_vector(wv, ws);
            check_numeric("conv2d dx" + tag, xv, xs, [w, stride, padding](autograd::Tape* t, const Ref<const Tensor>& x) {
                return core::sum(t, core::square(t, core::conv2d(t, x, w, stride, padding)));
            }, 1e-5);
            auto x = core::from_vector(xv, xs);
            check_numeric("conv2d dw" + tag, wv, ws, [x, stride, padding](autograd::Tape* t, const Ref<const Tensor>& w) {
                return core::sum(t, core::square(t, core::conv2d(t, x, w, stride, padding)));
            }, 1e-5);
        }
    }
}

static void test_pool_reference() {
    TEST_HEADER("pooling reference gradients");
    {
        autograd::Tape tape;
        auto x = core::from_vector(std::vector<float>{1, 3, 2, 3}, {1, 1, 2, 2});
        x->set_requires_grad(true);
        auto y = core::max_pool2d(&tape, x);
        EXPECT_CLOSE(y->to_vector<float>()[0], 3.0f, 1e-6, "max pool value");
        auto grads = autograd::backward(core::sum(&tape, y), tape);
        expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>{0, 1, 0, 1}, 1e-6, "max pool ties both receive");
    }
    {
        autograd::Tape tape;
        auto x = core::from_vector(std::vector<float>{1, 3, 2, 4}, {1, 1, 2, 2});
        x->set_requires_grad(true);
        auto y = core::avg_pool2d(&tape, x);
        EXPECT_CLOSE(y->to_vector<float>()[0], 2.5f, 1e-6, "avg pool value");
        auto grads = autograd::backward(core::sum(&tape, y), tape);
        expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>(4, 0.25f), 1e-6, "avg pool spreads evenly");
    }
    auto x = core::ones({1, 1, 4, 4});
    EXPECT_THROWS(core::max_pool2d(nullptr, x, 2, 2, 2), ShapeMismatchError, "padding wider than half the kernel");
    EXPECT_THROWS(core::max_pool2d(nullptr, x, 2, 0, 0), ShapeMismatchError, "zero stride");
    EXPECT_THROWS(core::avg_pool2d(nullptr, core::ones({4, 4})), ShapeMismatchError, "rank 4 required");
}

static void test_pool_gradients() {
    TEST_HEADER("pooling gradients against central differences");
    std::vector<double> xv(2 * 3 * 4 * 4);
    for (size_t i = 0; i < xv.size(); ++i) xv[i] = 0.01 * static_cast<double>((i * 37) % 97); // distinct values
    const std::vector<size_t> xs = {2, 3, 4, 4};

    check_numeric("max_pool2d k2 s2", xv, xs, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, core::max_pool2d(t, x, 2, 2, 0)));
    }, 1e-5);
    check_numeric("max_pool2d k3 s1 p1", xv, xs, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, core::max_pool2d(t, x, 3, 1, 1)));
    }, 1e-5);
    check_numeric("avg_pool2d k2 s1 p1", xv, xs, [](autograd::Tape* t, const Ref<const Tensor>& x) {
        return core::sum(t, core::square(t, core::avg_pool2d(t, x, 2, 1, 1)));
    }, 1e-5);
}

static void test_small_cnn() {
    TEST_HEADER("conv -> relu -> pool -> mean trains the kernel");
    auto x = core::from_vector(ramp(1 * 1 * 6 * 6, 0.2), {1, 1, 6, 6});
    auto w = core::from_vector(ramp(2 * 1 * 3 * 3, 0.1), {2, 1, 3, 3});
    w->set_requires_grad(true);

    auto loss_of = [&](autograd::Tape* t, const Ref<const Tensor>& wt) {
        auto h = core::relu(t, core::conv2d(t, x, wt, 1, 1));
        return core::mean(t, core::square(t, core::max_pool2d(t, h)));
    };

    autograd::Tape tape;
    auto loss0 = loss_of(&tape, w);
    auto grads = autograd::backward(loss0, tape);
    auto gw = grads.take(w);
    EXPECT_TRUE(gw && gw->shape() == w->shape(), "weight gradient shape");

    auto w1 = core::sub(nullptr, w, core::mul(nullptr, gw, 0.01));
    const double before = loss0->item<double>();
    const double after = loss_of(nullptr, w1)->item<double>();
    EXPECT_TRUE(after < before, "one gradient step lowers the loss");
}

int main() {
    try {
        backend::DeviceManager::instance().init();

        test_conv2d_forward();
        test_conv2d_gradients();
        test_pool_reference();
        test_pool_gradients();
        test_small_cnn();

        return finish("CONV/POOL");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
