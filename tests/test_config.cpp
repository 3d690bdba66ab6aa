// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <atomic>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include "tapegrad/config.h"
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/cpu/thread_runtime.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/errors.h"
#include "tests/helpers.h"

using namespace tapegrad;
using backend::DeviceType;

static void clear_env() {
    for (const char* name : {"TAPEGRAD_NUM_THREADS", "TAPEGRAD_GRAIN", "TAPEGRAD_DEFAULT_DEVICE",
                             "TAPEGRAD_CPU_MEMORY_LIMIT", "TAPEGRAD_LOG_LEVEL"}) {
        unsetenv(name);
    }
}

static void test_parsers() {
    TEST_HEADER("config: value parsers");
    EXPECT_TRUE(parse_device_type("cpu") == DeviceType::CPU, "cpu");
    EXPECT_TRUE(parse_device_type("BLAS") == DeviceType::BLAS, "case insensitive");
    EXPECT_TRUE(parse_device_type("cuda") == DeviceType::CUDA, "cuda");
    EXPECT_THROWS(parse_device_type("metal"), Error, "unknown device");
    EXPECT_TRUE(parse_log_level("Debug") == utils::LogLevel::DEBUG, "debug");
    EXPECT_TRUE(parse_log_level("none") == utils::LogLevel::NONE, "none");
    EXPECT_THROWS(parse_log_level("verbose"), Error, "unknown level");
}

static void test_from_env() {
    TEST_HEADER("config: environment overrides");
    clear_env();
    RuntimeConfig defaults = RuntimeConfig::from_env();
    EXPECT_TRUE(defaults.num_threads == 0 && defaults.grain == 4096, "defaults");
    EXPECT_TRUE(defaults.default_device == DeviceType::CPU, "default device");
    EXPECT_TRUE(defaults.log_level == utils::LogLevel::WARNING, "default log level");

    setenv("TAPEGRAD_NUM_THREADS", "3", 1);
    setenv("TAPEGRAD_GRAIN", "128", 1);
    setenv("TAPEGRAD_DEFAULT_DEVICE", "blas", 1);
    setenv("TAPEGRAD_CPU_MEMORY_LIMIT", "1048576", 1);
    setenv("TAPEGRAD_LOG_LEVEL", "error", 1);
    RuntimeConfig cfg = RuntimeConfig::from_env();
    EXPECT_TRUE(cfg.num_threads == 3, "threads");
    EXPECT_TRUE(cfg.grain == 128, "grain");
    EXPECT_TRUE(cfg.default_device == DeviceType::BLAS, "device");
    EXPECT_TRUE(cfg.cpu_memory_limit == 1048576, "memory limit");
    EXPECT_TRUE(cfg.log_level == utils::LogLevel::ERROR, "log level");

    setenv("TAPEGRAD_GRAIN", "-5", 1);
    EXPECT_THROWS(RuntimeConfig::from_env(), Error, "negative grain");
    setenv("TAPEGRAD_GRAIN", "99999999999999999999999", 1);
    EXPECT_THROWS(RuntimeConfig::from_env(), Error, "grain out of range");
    clear_env();
}

static void test_init_applies_config() {
    TEST_HEADER("config: DeviceManager::init applies settings");
    RuntimeConfig cfg;
    cfg.num_threads = 2;
    cfg.grain = 64;
    cfg.default_device = DeviceType::BLAS;
    cfg.cpu_memory_limit = 1 << 20;
    cfg.log_level = utils::LogLevel::ERROR;
    backend::DeviceManager::instance().init(cfg);

    auto& rt = backend::cpu::Runtime::instance();
    EXPECT_TRUE(rt.pool.size() == 2, "thread count");
    EXPECT_TRUE(rt.grain.load() == 64, "grain");
    EXPECT_TRUE(backend::DeviceManager::default_device_type() == DeviceType::BLAS, "default device");
    EXPECT_TRUE(core::zeros({4})->device_type() == DeviceType::BLAS, "factories follow the default device");
    EXPECT_TRUE(backend::DeviceManager::require(DeviceType::CPU)->allocator()->capacity_limit() == (1u << 20), "CPU limit");
    EXPECT_TRUE(backend::DeviceManager::require(DeviceType::BLAS)->allocator()->capacity_limit() == (1u << 20), "BLAS limit");
    EXPECT_TRUE(utils::log_level() == utils::LogLevel::ERROR, "log level");

    if (!backend::DeviceManager::device(DeviceType::CUDA)) {
        EXPECT_THROWS(backend::DeviceManager::set_default_device_type(DeviceType::CUDA), Error, "unregistered default device");
    }

    backend::DeviceManager::instance().init(RuntimeConfig{});
    EXPECT_TRUE(backend::DeviceManager::default_device_type() == DeviceType::CPU, "re-init restores defaults");
}

static void test_task_group_failures() {
    TEST_HEADER("thread runtime: task failures and submit failures");
    using backend::cpu::ThreadPool;
    using backend::cpu::TaskGroup;

    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        TaskGroup tg(pool);
        tg.run([&] { std::this_thread::sleep_for(std::chrono::milliseconds(20)); done++; });
        tg.run([] { throw Error("task failed"); });
        EXPECT_THROWS(tg.wait(), Error, "task exception reaches wait()");
    }
    EXPECT_TRUE(done == 1, "sibling task still ran to completion");

    done = 0;
    {
        ThreadPool pool(1);
        TaskGroup tg(pool);
        tg.run([&] { std::this_thread::sleep_for(std::chrono::milliseconds(20)); done++; });
        pool.shutdown();
        EXPECT_THROWS(tg.run([&] { done++; }), std::runtime_error, "enqueue on a stopped pool");
        // Leaving the scope must not hang on the task that was never queued.
    }
    EXPECT_TRUE(done == 1, "only the queued task ran");

    std::atomic<int> chunks{0};
    auto& rt = backend::cpu::Runtime::instance();
    const size_t grain = rt.grain.load();
    rt.set_grain(1);
    EXPECT_THROWS(backend::cpu::parallel_for(0, 64, [&](size_t b, size_t) {
        chunks++;
        if (b == 0) throw ShapeMismatchError("chunk failed");
    }), ShapeMismatchError, "parallel_for rethrows a chunk exception");
    EXPECT_TRUE(chunks >= 1, "chunks ran before the rethrow");
    rt.set_grain(grain);
}

int main() {
    try {
        test_parsers();
        test_from_env();
        test_init_applies_config();
        test_task_group_failures();

        return finish("CONFIG");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
