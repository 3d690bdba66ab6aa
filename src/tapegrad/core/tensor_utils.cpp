// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/backend/dispatch.h"

namespace tapegrad {
namespace core {

static utils::Ref<Tensor> full_on(backend::Device* dev, const std::vector<size_t>& shape, double fill_value, backend::DType dtype) {
    auto out = backend::allocate(dev, shape, dtype);
    backend::execute(dev, backend::FillOp{fill_value}, {}, out);
    return Tensor::make(std::move(out), dev);
}

utils::Ref<Tensor> full(const std::vector<size_t>& shape, double fill_value, backend::DeviceType device, backend::DType dtype) {
    return full_on(backend::DeviceManager::require(device), shape, fill_value, dtype);
}

utils::Ref<Tensor> zeros(const std::vector<size_t>& shape, backend::DeviceType device, backend::DType dtype) {
    return full(shape, 0.0, device, dtype);
}

utils::Ref<Tensor> ones(const std::vector<size_t>& shape, backend::DeviceType device, backend::DType dtype) {
    return full(shape, 1.0, device, dtype);
}

utils::Ref<Tensor> zeros_like(const utils::Ref<const Tensor>& t) {
    return full_like(0.0, t);
}

utils::Ref<Tensor> ones_like(const utils::Ref<const Tensor>& t) {
    return full_like(1.0, t);
}

utils::Ref<Tensor> full_like(double fill_value, const utils::Ref<const Tensor>& t) {
    check_live(t, "full_like");
    return full_on(t->device(), t->shape(), fill_value, t->dtype());
}

utils::Ref<Tensor> scalar(double value, backend::DeviceType device, backend::DType dtype) {
    return full({}, value, device, dtype);
}

utils::Ref<Tensor> scalar_like(double value, const utils::Ref<const Tensor>& ref) {
    check_live(ref, "scalar_like");
    return full_on(ref->device(), {}, value, ref->dtype());
}

} // namespace core
} // namespace tapegrad
