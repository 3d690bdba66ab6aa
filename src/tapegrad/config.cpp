// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include "tapegrad/config.h"
#include "tapegrad/errors.h"

namespace tapegrad {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static size_t parse_size(const char* name, const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw Error(std::string("RuntimeConfig: ") + name + " expects a non-negative integer, got '" + s + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        throw Error(std::string("RuntimeConfig: ") + name + " is out of range: '" + s + "'");
    }
}

backend::DeviceType parse_device_type(const std::string& s) {
    const std::string v = lower(s);
    if (v == "cpu")  return backend::DeviceType::CPU;
    if (v == "blas") return backend::DeviceType::BLAS;
    if (v == "cuda") return backend::DeviceType::CUDA;
    throw Error("parse_device_type: unknown device '" + s + "' (expected cpu, blas or cuda)");
}

utils::LogLevel parse_log_level(const std::string& s) {
    const std::string v = lower(s);
    if (v == "debug")   return utils::LogLevel::DEBUG;
    if (v == "info")    return utils::LogLevel::INFO;
    if (v == "warning") return utils::LogLevel::WARNING;
    if (v == "error")   return utils::LogLevel::ERROR;
    if (v == "none")    return utils::LogLevel::NONE;
    throw Error("parse_log_level: unknown level '" + s + "'");
}

RuntimeConfig RuntimeConfig::from_env() {
    RuntimeConfig cfg;
    if (const char* v = std::getenv("TAPEGRAD_NUM_THREADS")) {
        cfg.num_threads = static_cast<unsigned>(parse_size("TAPEGRAD_NUM_THREADS", v));
    }
    if (const char* v = std::getenv("TAPEGRAD_GRAIN")) {
        cfg.grain = parse_size("TAPEGRAD_GRAIN", v);
    }
    if (const char* v = std::getenv("TAPEGRAD_DEFAULT_DEVICE")) {
        cfg.default_device = parse_device_type(v);
    }
    if (const char* v = std::getenv("TAPEGRAD_CPU_MEMORY_LIMIT")) {
        cfg.cpu_memory_limit = parse_size("TAPEGRAD_CPU_MEMORY_LIMIT", v);
    }
    if (const char* v = std::getenv("TAPEGRAD_LOG_LEVEL")) {
        cfg.log_level = parse_log_level(v);
    }
    return cfg;
}

} // namespace tapegrad
