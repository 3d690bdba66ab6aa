// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <algorithm>

static int g_fail_count = 0;

#define EXPECT_TRUE(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "[FAIL] " << msg << " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
    } \
} while(0)

#define EXPECT_CLOSE(val, exp, eps, msg) do { \
    if (std::fabs((val) - (exp)) > (eps)) { \
        std::cerr << "[FAIL] " << msg << " got=" << (val) << " expected=" << (exp) \
                  << " tol=" << (eps) << " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
    } \
} while(0)

// Passes only when `stmt` throws `ExcType` (or a subclass).
#define EXPECT_THROWS(stmt, ExcType, msg) do { \
    bool _thrown = false; \
    try { stmt; } \
    catch (const ExcType&) { _thrown = true; } \
    catch (const std::exception& _e) { \
        std::cerr << "[FAIL] " << msg << ": wrong exception: " << _e.what() \
                  << " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
        _thrown = true; \
    } \
    if (!_thrown) { \
        std::cerr << "[FAIL] " << msg << ": expected " #ExcType " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
    } \
} while(0)

#define TEST_HEADER(name) std::cout << "\n=== " << name << " ===\n"

template <typename T>
inline void expect_allclose(const std::vector<T>& a, const std::vector<T>& b, double eps, const std::string& msg) {
    EXPECT_TRUE(a.size() == b.size(), msg + " size mismatch (" + std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        EXPECT_CLOSE(static_cast<double>(a[i]), static_cast<double>(b[i]), eps, msg + " idx=" + std::to_string(i));
    }
}

// Simple random filler (deterministic)
template <typename T>
inline void fill_random(std::vector<T>& v, T lo = T(-1), T hi = T(1), unsigned seed = 123) {
    uint32_t x = seed;
    auto rnd = [&]() {
        // simple LCG for deterministic runs
        x = 1664525u * x + 1013904223u;
        return (x & 0xFFFFFFu) / double(0xFFFFFFu);
    };
    for (auto& e : v) {
        e = static_cast<T>(lo + (hi - lo) * rnd());
    }
}

inline int finish(const char* suite) {
    if (g_fail_count == 0) {
        std::cout << "\nALL " << suite << " TESTS PASSED\n";
        return 0;
    }
    std::cerr << "\n" << suite << " TESTS FAILED: " << g_fail_count << "\n";
    return 1;
}
