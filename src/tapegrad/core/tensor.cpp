// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/core/tensor.h"
#include "tapegrad/backend/buffer.h"

namespace tapegrad {
namespace core {

Tensor::Tensor(backend::StorageDescriptor storage, backend::Device* device)
    : _id(next_tensor_id()), _storage(std::move(storage)), _device(device) {}

utils::Ref<Tensor> Tensor::make(backend::StorageDescriptor storage, backend::Device* device) {
    if (!device) throw Error("Tensor::make: null device");
    if (!storage.buffer) throw UseAfterFreeError("Tensor::make: descriptor has no buffer");
    if (storage.buffer->device_type() != device->type()) {
        throw BackendMismatchError(std::string("Tensor::make: buffer resides on ") + backend::to_string(storage.buffer->device_type()) +
                                   ", device is " + device->name());
    }
    return utils::Ref<Tensor>(new Tensor(std::move(storage), device));
}

void Tensor::set_requires_grad(bool rg) {
    if (rg && !backend::is_floating(dtype())) {
        throw Error(std::string("set_requires_grad: only floating point tensors can request gradients, got ") + backend::to_string(dtype()));
    }
    _requires_grad = rg;
}

utils::Ref<Tensor> Tensor::detach() const {
    check_live("detach");
    return make(_storage, _device);
}

void Tensor::check_live(const char* caller) const {
    if (!_storage.buffer) {
        throw UseAfterFreeError(std::string(caller) + ": tensor " + std::to_string(_id) + " has no buffer");
    }
}

void check_live(const utils::Ref<const Tensor>& t, const char* caller) {
    if (!t) throw UseAfterFreeError(std::string(caller) + ": null tensor handle");
    t->check_live(caller);
}

} // namespace core
} // namespace tapegrad
