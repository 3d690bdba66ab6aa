// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <string>
#include <cstddef>
#include "tapegrad/backend/device.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {

// Process-wide runtime settings, applied by DeviceManager::init().
struct RuntimeConfig {
    unsigned num_threads = 0;                           // 0 = hardware concurrency
    size_t grain = 4096;                                // parallel_for serial cutoff
    backend::DeviceType default_device = backend::DeviceType::CPU;
    size_t cpu_memory_limit = 0;                        // bytes, CPU and BLAS allocators; 0 = unlimited
    utils::LogLevel log_level = utils::LogLevel::WARNING;

    // Defaults overridden by TAPEGRAD_NUM_THREADS, TAPEGRAD_GRAIN,
    // TAPEGRAD_DEFAULT_DEVICE (cpu|blas|cuda), TAPEGRAD_CPU_MEMORY_LIMIT and
    // TAPEGRAD_LOG_LEVEL (debug|info|warning|error|none).
    // Throws Error on a malformed value.
    static RuntimeConfig from_env();
};

backend::DeviceType parse_device_type(const std::string& s);
utils::LogLevel parse_log_level(const std::string& s);

} // namespace tapegrad
