// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cmath>
#include <chrono>
#include <random>
#include <vector>
#include <iomanip>
#include <iostream>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/autograd/driver.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/core/tensor.h"
#include "examples/moons/moons_data.h"

using namespace tapegrad;
using core::Tensor;
using utils::Ref;

// Xavier uniform weights, requesting gradients.
static Ref<Tensor> xavier(size_t fan_in, size_t fan_out, std::mt19937& gen) {
    const float limit = std::sqrt(6.0f / static_cast<float>(fan_in + fan_out));
    std::uniform_real_distribution<float> u(-limit, limit);
    std::vector<float> w(fan_in * fan_out);
    for (auto& v : w) v = u(gen);
    auto t = core::from_vector(w, {fan_in, fan_out});
    t->set_requires_grad(true);
    return t;
}

static Ref<Tensor> bias(size_t n) {
    auto t = core::zeros({n});
    t->set_requires_grad(true);
    return t;
}

struct Layer {
    Ref<Tensor> w, b;
};

static float accuracy(const Ref<const Tensor>& out, const std::vector<float>& labels) {
    auto pv = out->to_vector<float>();
    size_t correct = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if ((pv[i] >= 0.0f ? 1.0f : -1.0f) == labels[i]) correct++;
    }
    return static_cast<float>(correct) / static_cast<float>(labels.size());
}

int main() {
    // TAPEGRAD_DEFAULT_DEVICE=blas (or cuda) runs the same loop on another backend.
    backend::DeviceManager::instance().init();
    const auto device = backend::DeviceManager::default_device_type();
    std::cout << "--- tapegrad: moons MLP on " << backend::to_string(device) << " ---" << std::endl;

    MoonsParams p; p.n_samples = 2000; p.noise = 0.15f; p.seed = 123;
    const MoonsData data = make_moons(p);
    auto xs = core::from_vector(data.points, {p.n_samples, 2});
    auto ys = core::from_vector(data.labels, {p.n_samples, 1});

    std::mt19937 gen(42);
    std::vector<Layer> layers = {
        {xavier(2, 32, gen), bias(32)},
        {xavier(32, 32, gen), bias(32)},
        {xavier(32, 1, gen), bias(1)},
    };

    const double lr = 0.1;
    const int epochs = 300;
    auto t0 = std::chrono::steady_clock::now();

    for (int e = 1; e <= epochs; ++e) {
        autograd::Tape tape;
        Ref<const Tensor> h = xs;
        for (size_t i = 0; i < layers.size(); ++i) {
            auto z = core::add(&tape, core::matmul(&tape, h, layers[i].w), layers[i].b);
            h = core::tanh(&tape, z);
        }
        auto loss = core::mean(&tape, core::square(&tape, core::sub(&tape, h, ys)));
        auto grads = autograd::backward(loss, tape);

        for (auto& l : layers) {
            l.w = core::sub(nullptr, l.w, core::mul(nullptr, grads.take(l.w), lr));
            l.b = core::sub(nullptr, l.b, core::mul(nullptr, grads.take(l.b), lr));
            l.w->set_requires_grad(true);
            l.b->set_requires_grad(true);
        }

        if (e == 1 || e % 50 == 0) {
            std::cout << "epoch " << std::setw(3) << e
                      << " loss=" << std::fixed << std::setprecision(6) << loss->item<float>()
                      << " acc=" << std::setprecision(4) << accuracy(h, data.labels) << "\n";
        }
    }

    auto t1 = std::chrono::steady_clock::now();
    std::cout << "trained " << epochs << " epochs in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count() << " ms\n";
    return 0;
}
