// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cmath>
#include <random>
#include <vector>
#include <cstdint>
#include <stdexcept>

struct MoonsParams {
    size_t n_samples = 1000; // total points, split evenly between the moons
    float radius = 1.0f;
    float dx = 1.0f;         // lower moon x offset
    float dy = 0.5f;         // lower moon y offset
    float noise = 0.1f;      // Gaussian noise stddev, 0 disables
    uint32_t seed = 42;
};

// Row-major points (n_samples, 2) and labels (n_samples, 1): +1 upper, -1 lower.
struct MoonsData {
    std::vector<float> points;
    std::vector<float> labels;
};

inline MoonsData make_moons(const MoonsParams& p) {
    if (p.radius <= 0.0f) throw std::invalid_argument("make_moons: radius must be > 0");

    MoonsData d;
    d.points.reserve(p.n_samples * 2);
    d.labels.reserve(p.n_samples);

    std::mt19937 gen(p.seed);
    std::uniform_real_distribution<float> angle(0.0f, static_cast<float>(M_PI));
    std::normal_distribution<float> jitter(0.0f, p.noise > 0.0f ? p.noise : 1.0f);
    auto noise = [&]() { return p.noise > 0.0f ? jitter(gen) : 0.0f; };

    for (size_t i = 0; i < p.n_samples; ++i) {
        const bool upper = i < p.n_samples / 2;
        const float th = angle(gen);
        const float x = upper ? p.radius * std::cos(th) : p.radius * std::cos(th) + p.dx;
        const float y = upper ? p.radius * std::sin(th) : -p.radius * std::sin(th) + p.dy;
        d.points.push_back(x + noise());
        d.points.push_back(y + noise());
        d.labels.push_back(upper ? 1.0f : -1.0f);
    }
    return d;
}
