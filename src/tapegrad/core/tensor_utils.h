// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include "tapegrad/backend/device_manager.h"
#include "tapegrad/backend/transfer.h"
#include "tapegrad/backend/dtype.h"
#include "tapegrad/core/tensor.h"
#include "tapegrad/utils/vector.h"

namespace tapegrad {
namespace core {

template <typename T>
inline utils::Ref<Tensor> from_vector(const std::vector<T>& data, const std::vector<size_t>& shape, backend::DeviceType device = backend::DeviceManager::default_device_type()) {
    constexpr backend::DType dtype = backend::dtype_v<T>;
    static_assert(dtype != backend::DType::UNKNOWN, "from_vector: unsupported vector element type.");
    const size_t numel = utils::vector::numel(shape);
    if (data.size() != numel) {
        throw ShapeMismatchError("from_vector: " + std::to_string(data.size()) + " values for shape " + utils::vector::to_string(shape));
    }
    auto* dev = backend::DeviceManager::require(device);
    return Tensor::make(backend::from_host(dev, data.data(), shape, dtype), dev);
}

utils::Ref<Tensor> full(const std::vector<size_t>& shape, double fill_value, backend::DeviceType device = backend::DeviceManager::default_device_type(), backend::DType dtype = backend::DType::FLOAT32);
utils::Ref<Tensor> zeros(const std::vector<size_t>& shape, backend::DeviceType device = backend::DeviceManager::default_device_type(), backend::DType dtype = backend::DType::FLOAT32);
utils::Ref<Tensor> ones(const std::vector<size_t>& shape, backend::DeviceType device = backend::DeviceManager::default_device_type(), backend::DType dtype = backend::DType::FLOAT32);

// Like Utilities
utils::Ref<Tensor> zeros_like(const utils::Ref<const Tensor>& t);
utils::Ref<Tensor> ones_like(const utils::Ref<const Tensor>& t);
utils::Ref<Tensor> full_like(double fill_value, const utils::Ref<const Tensor>& t);

// Rank-0 scalar constant with explicit device/dtype
utils::Ref<Tensor> scalar(double value, backend::DeviceType device = backend::DeviceManager::default_device_type(), backend::DType dtype = backend::DType::FLOAT32);
// Scalar with device/dtype taken from a reference tensor
utils::Ref<Tensor> scalar_like(double value, const utils::Ref<const Tensor>& ref);

} // namespace core
} // namespace tapegrad
