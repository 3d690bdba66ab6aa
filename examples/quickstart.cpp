// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <vector>
#include <iomanip>
#include <iostream>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/autograd/driver.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/core/tensor_ops.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/core/tensor.h"

using namespace tapegrad;

int main() {
    backend::DeviceManager::instance().init();

    // Data: x in R^{N,1}, y = 2x + 3
    auto x = core::from_vector<float>({0, 1, 2, 3}, {4, 1});
    auto y = core::from_vector<float>({3, 5, 7, 9}, {4, 1});

    // Trainable leaves
    auto w = core::zeros({1, 1});
    auto b = core::zeros({1});
    w->set_requires_grad(true);
    b->set_requires_grad(true);

    const double lr = 0.1;
    for (int step = 0; step < 100; ++step) {
        // One tape per forward pass.
        autograd::Tape tape;

        // Forward: yhat = x@w + b
        auto yhat = core::add(&tape, core::matmul(&tape, x, w), b);

        // Loss: mean((yhat - y)^2)
        auto loss = core::mean(&tape, core::square(&tape, core::sub(&tape, yhat, y)));

        auto grads = autograd::backward(loss, tape);

        // SGD: untaped update, then rebind the handles.
        w = core::sub(nullptr, w, core::mul(nullptr, grads.take(w), lr));
        b = core::sub(nullptr, b, core::mul(nullptr, grads.take(b), lr));
        w->set_requires_grad(true);
        b->set_requires_grad(true);

        if (step == 0 || (step + 1) % 10 == 0) {
            std::cout << "step " << step+1
                      << " loss=" << std::fixed << std::setprecision(6) << loss->item<float>() << "\n";
        }
    }

    std::cout << "w=" << w->item<float>() << " b=" << b->item<float>() << "\n";
    return 0;
}
