// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <vector>
#include <iostream>
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

static Ref<Tensor> param(const std::vector<float>& v, const std::vector<size_t>& shape) {
    auto t = core::from_vector(v, shape);
    t->set_requires_grad(true);
    return t;
}

static void test_add_broadcast_split() {
    TEST_HEADER("add: gradient splits and sums over broadcast axes");
    autograd::Tape tape;
    auto a = param(std::vector<float>(8, 1.0f), {2, 2, 2});
    auto b = param({1.0f, 2.0f}, {2});
    auto loss = core::sum(&tape, core::add(&tape, a, b));
    auto grads = autograd::backward(loss, tape);

    auto ga = grads.take(a);
    auto gb = grads.take(b);
    EXPECT_TRUE(ga && gb, "both leaves have gradients");
    if (ga && gb) {
        EXPECT_TRUE(ga->shape() == a->shape(), "grad a shape");
        EXPECT_TRUE(gb->shape() == b->shape(), "grad b shape");
        expect_allclose(ga->to_vector<float>(), std::vector<float>(8, 1.0f), 1e-6, "grad a");
        expect_allclose(gb->to_vector<float>(), std::vector<float>{4.0f, 4.0f}, 1e-6, "grad b");
    }

    // B (3) against A (2,3).
    autograd::Tape t2;
    auto a2 = param(std::vector<float>{1, 2, 3, 4, 5, 6}, {2, 3});
    auto b2 = param({0.5f, -1.0f, 2.0f}, {3});
    auto c = core::add(&t2, a2, b2);
    EXPECT_TRUE(c->shape() == std::vector<size_t>({2, 3}), "C shape (2,3)");
    auto g2 = autograd::backward(core::sum(&t2, c), t2);
    expect_allclose(g2.peek(a2)->to_vector<float>(), std::vector<float>(6, 1.0f), 1e-6, "grad A (2,3)");
    expect_allclose(g2.peek(b2)->to_vector<float>(), std::vector<float>{2.0f, 2.0f, 2.0f}, 1e-6, "grad B (3)");
}

static void test_fan_out_accumulates() {
    TEST_HEADER("fan-out: contributions of every use are summed");
    autograd::Tape tape;
    auto x = param({1.0f, 2.0f, 3.0f}, {3});
    auto y = core::add(&tape, core::mul(&tape, x, 2.0), core::mul(&tape, x, 3.0));
    auto grads = autograd::backward(core::sum(&tape, y), tape);
    expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>{5.0f, 5.0f, 5.0f}, 1e-6, "d/dx (2x + 3x)");
}

static void test_self_add_keeps_intermediate() {
    TEST_HEADER("x + x: accumulation does not clobber shared gradient buffers");
    autograd::Tape tape;
    auto x = param({1.0f, 2.0f, 3.0f}, {3});
    auto h = core::add(&tape, x, x);
    auto grads = autograd::backward(core::sum(&tape, h), tape);

    expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>{2.0f, 2.0f, 2.0f}, 1e-6, "grad x");
    expect_allclose(grads.peek(h)->to_vector<float>(), std::vector<float>{1.0f, 1.0f, 1.0f}, 1e-6, "grad h unchanged");
    expect_allclose(x->to_vector<float>(), std::vector<float>{1.0f, 2.0f, 3.0f}, 1e-6, "x values unchanged");
}

static void test_tape_reuse() {
    TEST_HEADER("tape: replayed once, then rejects reuse");
    autograd::Tape tape;
    auto x = param({1.0f, 2.0f}, {2});
    auto loss = core::sum(&tape, core::square(&tape, x));
    auto grads = autograd::backward(loss, tape);
    EXPECT_TRUE(tape.consumed(), "tape consumed");
    EXPECT_TRUE(tape.empty(), "entries released after replay");
    EXPECT_THROWS(autograd::backward(loss, tape), TapeReuseError, "second backward");
    EXPECT_THROWS(core::exp(&tape, x), TapeReuseError, "recording onto a consumed tape");
    // Inference on the same inputs still works.
    EXPECT_TRUE(core::exp(nullptr, x)->numel() == 2, "untaped op after replay");
}

static void test_dead_branch() {
    TEST_HEADER("dead branch: entries that never reach the loss are skipped");
    autograd::Tape tape;
    auto x = param({0.5f, 1.5f}, {2});
    auto used = core::mul(&tape, x, 2.0);
    auto unused = core::exp(&tape, x);
    EXPECT_TRUE(tape.size() == 2, "two entries recorded");
    auto grads = autograd::backward(core::sum(&tape, used), tape);
    expect_allclose(grads.peek(x)->to_vector<float>(), std::vector<float>{2.0f, 2.0f}, 1e-6, "grad x ignores dead branch");
    EXPECT_TRUE(!grads.contains(unused), "no gradient for the dead branch");
}

static void test_root_checks() {
    TEST_HEADER("backward: root requirements");
    {
        autograd::Tape tape;
        auto x = param({1.0f, 2.0f}, {2});
        auto y = core::mul(&tape, x, 2.0);
        EXPECT_THROWS(autograd::backward(y, tape), ShapeMismatchError, "non-scalar loss");
        EXPECT_TRUE(!tape.consumed(), "failed backward leaves the tape intact");
    }
    {
        autograd::Tape tape;
        auto x = param({1.0f, 2.0f}, {2});
        auto loss = core::sum(nullptr, x);
        EXPECT_THROWS(autograd::backward(loss, tape), NonDifferentiableRootError, "untaped loss");
        EXPECT_THROWS(autograd::backward(core::sum(nullptr, x), tape), NonDifferentiableRootError, "loss without history");
    }
    {
        autograd::Tape tape, other;
        auto x = param({1.0f, 2.0f}, {2});
        auto loss = core::sum(&other, x);
        EXPECT_THROWS(autograd::backward(loss, tape), NonDifferentiableRootError, "loss recorded on another tape");
    }
    {
        autograd::Tape tape;
        EXPECT_THROWS(autograd::backward(Ref<const Tensor>(), tape), UseAfterFreeError, "null loss");
    }
}

static void test_inference_records_nothing() {
    TEST_HEADER("tape: no entries without a gradient-requesting input");
    autograd::Tape tape;
    auto x = core::from_vector(std::vector<float>{1.0f, 2.0f}, {2});
    auto y = core::sum(&tape, core::relu(&tape, x));
    EXPECT_TRUE(tape.empty(), "nothing recorded");
    EXPECT_TRUE(!y->requires_grad(), "output does not request gradients");

    auto w = param({1.0f, 1.0f}, {2});
    auto z = core::mul(&tape, x, w);
    EXPECT_TRUE(tape.size() == 1 && z->requires_grad(), "mixed inputs are recorded");
    auto grads = autograd::backward(core::sum(&tape, z), tape);
    EXPECT_TRUE(!grads.contains(x), "constant input gets no gradient");
    expect_allclose(grads.peek(w)->to_vector<float>(), std::vector<float>{1.0f, 2.0f}, 1e-6, "grad w = x");
}

static void test_store_take_peek() {
    TEST_HEADER("gradient store: take and peek");
    autograd::Tape tape;
    auto x = param({3.0f}, {1});
    auto grads = autograd::backward(core::sum(&tape, core::mul(&tape, x, 4.0)), tape);
    EXPECT_TRUE(grads.contains(x), "contains x");
    auto p = grads.peek(x);
    EXPECT_CLOSE(p->to_vector<float>()[0], 4.0f, 1e-6, "peek value");
    auto t = grads.take(x);
    EXPECT_TRUE(t && !grads.contains(x), "take removes the entry");
    EXPECT_TRUE(!grads.take(x), "second take is null");
    EXPECT_TRUE(!grads.peek(core::TensorId(0)), "unknown id peeks null");
    EXPECT_TRUE(t->device_type() == x->device_type() && t->dtype() == x->dtype(), "gradient matches tensor device and dtype");
}

static void test_handle_rules() {
    TEST_HEADER("tensor handles: identity, detach and gradient flag");
    auto x = param({1.0f, 2.0f}, {2});
    auto d = x->detach();
    EXPECT_TRUE(d->id() != x->id(), "detach gives a new identity");
    EXPECT_TRUE(!d->requires_grad(), "detached handle does not request gradients");
    EXPECT_TRUE(d->storage().buffer == x->storage().buffer, "detach shares storage");

    auto i = core::from_vector(std::vector<int32_t>{1, 2}, {2});
    EXPECT_THROWS(i->set_requires_grad(true), Error, "integer tensors cannot request gradients");
    EXPECT_THROWS(core::exp(nullptr, Ref<const Tensor>()), UseAfterFreeError, "null operand");
    EXPECT_THROWS(x->item<float>(), ShapeMismatchError, "item on two elements");
    EXPECT_THROWS(x->to_vector<double>(), Error, "to_vector dtype mismatch");
}

int main() {
    try {
        backend::DeviceManager::instance().init();

        test_add_broadcast_split();
        test_fan_out_accumulates();
        test_self_add_keeps_intermediate();
        test_tape_reuse();
        test_dead_branch();
        test_root_checks();
        test_inference_records_nothing();
        test_store_take_peek();
        test_handle_rules();

        return finish("TAPE");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
