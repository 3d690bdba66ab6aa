// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <vector>
#include <iostream>
#include <stdexcept>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/allocator.h"
#include "tapegrad/core/tensor.h"
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/autograd/driver.h"
#include "tapegrad/errors.h"
#include "tests/helpers.h"

using namespace tapegrad;
using backend::DeviceType;

static backend::Allocator& cpu_allocator() {
    return *backend::DeviceManager::require(DeviceType::CPU)->allocator();
}

static void test_deep_copy() {
    TEST_HEADER("CPU allocator: deep copy");

    std::vector<float> v{1.f, 2.f, 3.f};
    auto t = core::from_vector<float>(v, {3}, DeviceType::CPU);

    // Mutate source to ensure deep copy
    v[0] = 999.f;

    auto out = t->to_vector<float>();
    EXPECT_TRUE(out.size() == 3, "size should be 3");
    EXPECT_TRUE(out[0] == 1.f && out[1] == 2.f && out[2] == 3.f, "buffer must be a deep copy");
}

static void test_zero_length() {
    TEST_HEADER("CPU allocator: zero-length");

    std::vector<float> v;
    auto t = core::from_vector<float>(v, {0}, DeviceType::CPU);

    EXPECT_TRUE(t->numel() == 0, "numel must be 0 for empty tensor");
    EXPECT_TRUE(t->to_vector<float>().empty(), "to_vector must return empty vector");
    EXPECT_CLOSE(core::sum(nullptr, t)->item<float>(), 0.0f, 0.0, "empty sum is 0");
    EXPECT_THROWS(core::from_vector<float>(std::vector<float>{1.f, 2.f}, {3}), ShapeMismatchError, "data/shape size mismatch");
}

static void test_capacity_limit() {
    TEST_HEADER("CPU allocator: capacity limit");
    auto& alloc = cpu_allocator();
    const size_t live_before = alloc.live_buffers();
    const size_t bytes_before = alloc.bytes_in_use();

    alloc.set_capacity_limit(bytes_before + 1024);
    EXPECT_THROWS(core::zeros({1000}, DeviceType::CPU), AllocationError, "4000 bytes over a 1024 byte limit");
    EXPECT_TRUE(alloc.live_buffers() == live_before, "failed allocation is not counted");
    EXPECT_TRUE(alloc.bytes_in_use() == bytes_before, "failed allocation reserves nothing");
    {
        auto small = core::zeros({16}, DeviceType::CPU);
        EXPECT_TRUE(alloc.bytes_in_use() == bytes_before + 16 * sizeof(float), "allocation within the limit");
    }
    alloc.set_capacity_limit(0);
    auto big = core::zeros({1000}, DeviceType::CPU);
    EXPECT_TRUE(big->numel() == 1000, "unlimited again");
}

static void test_release_on_abandon() {
    TEST_HEADER("abandoned tape releases saved activations");
    auto& alloc = cpu_allocator();
    const size_t bytes_before = alloc.bytes_in_use();
    const size_t live_before = alloc.live_buffers();
    {
        autograd::Tape tape;
        auto x = core::ones({64, 64}, DeviceType::CPU);
        x->set_requires_grad(true);
        auto y = core::tanh(&tape, core::matmul(&tape, x, x));
        auto loss = core::sum(&tape, core::exp(&tape, y));
        EXPECT_TRUE(tape.size() == 4, "four entries recorded");
        EXPECT_TRUE(alloc.bytes_in_use() > bytes_before, "activations are live");
        // No backward: the tape and handles go out of scope here.
    }
    EXPECT_TRUE(alloc.bytes_in_use() == bytes_before, "every byte returned");
    EXPECT_TRUE(alloc.live_buffers() == live_before, "every buffer returned");

    {
        autograd::Tape tape;
        auto x = core::ones({32, 32}, DeviceType::CPU);
        x->set_requires_grad(true);
        auto loss = core::sum(&tape, core::sigmoid(&tape, x));
        tape.clear();
        EXPECT_TRUE(tape.empty() && !tape.consumed(), "clear drops entries without replaying");
        EXPECT_THROWS(autograd::backward(loss, tape), NonDifferentiableRootError, "cleared tape has no history");
    }
    EXPECT_TRUE(alloc.bytes_in_use() == bytes_before, "cleared tape returned every byte");
}

static void test_release_after_backward() {
    TEST_HEADER("replay releases the tape, store owns only gradients");
    auto& alloc = cpu_allocator();
    const size_t bytes_before = alloc.bytes_in_use();
    {
        autograd::Tape tape;
        auto x = core::ones({16, 16}, DeviceType::CPU);
        x->set_requires_grad(true);
        auto grads = autograd::backward(core::mean(&tape, core::square(&tape, x)), tape);
        auto g = grads.take(x);
        grads.clear();
        EXPECT_TRUE(grads.empty(), "store cleared");
        EXPECT_CLOSE(g->to_vector<float>()[0], 2.0f / 256.0f, 1e-7, "mean(square) gradient");
    }
    EXPECT_TRUE(alloc.bytes_in_use() == bytes_before, "nothing leaks after backward");
    EXPECT_TRUE(alloc.peak_bytes() >= bytes_before, "peak tracks the high water mark");
}

int main() {
    try {
        backend::DeviceManager::instance().init();

        test_deep_copy();
        test_zero_length();
        test_capacity_limit();
        test_release_on_abandon();
        test_release_after_backward();

        return finish("ALLOCATOR");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
