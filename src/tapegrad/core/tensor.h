// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <string>
#include "tapegrad/backend/device.h"
#include "tapegrad/backend/dtype.h"
#include "tapegrad/backend/storage.h"
#include "tapegrad/backend/transfer.h"
#include "tapegrad/core/tensor_id.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/ref.h"

namespace tapegrad {
namespace core {

// Eager tensor handle: an identity, a layout over a backend buffer, and the
// requests-gradient flag. Always held through utils::Ref.
class Tensor : public utils::RefCounted {
public:
    // Factory methods
    static utils::Ref<Tensor> make(backend::StorageDescriptor storage, backend::Device* device);

    // Properties
    TensorId id() const noexcept { return _id; }
    const std::vector<size_t>& shape() const noexcept { return _storage.shape; }
    const std::vector<size_t>& strides() const noexcept { return _storage.strides; }
    size_t numel() const noexcept { return _storage.numel(); }
    size_t rank() const noexcept { return _storage.rank(); }
    backend::DType dtype() const noexcept { return _storage.dtype; }
    backend::Device* device() const noexcept { return _device; }
    backend::DeviceType device_type() const noexcept { return _device->type(); }
    bool is_contiguous() const noexcept { return _storage.is_contiguous; }
    const backend::StorageDescriptor& storage() const noexcept { return _storage; }

    // Grad
    bool requires_grad() const noexcept { return _requires_grad; }
    // Only FLOAT32/FLOAT64 tensors may request gradients.
    void set_requires_grad(bool rg);

    // New handle (new identity) over the same storage, not requesting gradients.
    utils::Ref<Tensor> detach() const;

    // IO
    template<typename T> T item() const;
    template<typename T> std::vector<T> to_vector() const;

    // Memory
    void check_live(const char* caller) const;

private:
    Tensor(backend::StorageDescriptor storage, backend::Device* device);

    TensorId _id;
    backend::StorageDescriptor _storage;
    backend::Device* _device;
    bool _requires_grad = false;
};

// Throws UseAfterFreeError for a null handle or a tensor without a buffer.
void check_live(const utils::Ref<const Tensor>& t, const char* caller);

template<typename T>
T Tensor::item() const {
    check_live("item");
    if (numel() != 1) throw ShapeMismatchError("item(): tensor must hold exactly one element, shape " + utils::vector::to_string(shape()));
    if (backend::dtype_v<T> != dtype()) {
        throw Error(std::string("item(): dtype mismatch, tensor is ") + backend::to_string(dtype()));
    }
    T result{};
    backend::read_to_host(_storage, &result);
    return result;
}

template<typename T>
std::vector<T> Tensor::to_vector() const {
    check_live("to_vector");
    if (backend::dtype_v<T> != dtype()) {
        throw Error(std::string("to_vector(): dtype mismatch, tensor is ") + backend::to_string(dtype()));
    }
    std::vector<T> host(numel());
    if (host.empty()) return host;
    backend::read_to_host(_storage, host.data());
    return host;
}

} // namespace core
} // namespace tapegrad
