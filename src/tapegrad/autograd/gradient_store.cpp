// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/autograd/gradient_store.h"
#include "tapegrad/backend/dispatch.h"
#include "tapegrad/backend/transfer.h"
#include "tapegrad/backend/buffer.h"
#include "tapegrad/errors.h"

namespace tapegrad {
namespace autograd {

void GradientStore::accumulate(core::TensorId id, const utils::Ref<const core::Tensor>& delta) {
    core::check_live(delta, "GradientStore::accumulate");

    auto it = _grads.find(id);
    if (it == _grads.end()) {
        // Own handle over a dense buffer. Sharing the buffer with the caller
        // is fine: later additions check the buffer's use count.
        auto dense = backend::materialize(delta->storage());
        _grads.emplace(id, core::Tensor::make(std::move(dense), delta->device()));
        return;
    }

    utils::Ref<core::Tensor>& stored = it->second;
    if (stored->shape() != delta->shape()) {
        throw ShapeMismatchError("GradientStore::accumulate: gradient " + std::to_string(id), stored->shape(), delta->shape());
    }
    if (stored->device() != delta->device()) {
        throw BackendMismatchError(std::string("GradientStore::accumulate: stored gradient on ") + stored->device()->name() +
                                   ", contribution on " + delta->device()->name());
    }
    if (stored->dtype() != delta->dtype()) {
        throw Error(std::string("GradientStore::accumulate: dtype mismatch ") + backend::to_string(stored->dtype()) +
                    " vs " + backend::to_string(delta->dtype()));
    }

    backend::Device* dev = stored->device();
    const backend::StorageDescriptor& acc = stored->storage();
    const bool exclusive = stored->use_count() == 1 && acc.buffer.use_count() == 1;
    if (exclusive) {
        backend::StorageDescriptor out = acc;
        backend::execute(dev, backend::BinaryOp{backend::BinaryOpType::ADD}, {&acc, &delta->storage()}, out);
        return;
    }
    // Copy-on-write: the stored buffer is visible elsewhere.
    auto out = backend::allocate(dev, acc.shape, acc.dtype);
    backend::execute(dev, backend::BinaryOp{backend::BinaryOpType::ADD}, {&acc, &delta->storage()}, out);
    stored = core::Tensor::make(std::move(out), dev);
}

utils::Ref<core::Tensor> GradientStore::take(core::TensorId id) {
    auto it = _grads.find(id);
    if (it == _grads.end()) return nullptr;
    utils::Ref<core::Tensor> g = std::move(it->second);
    _grads.erase(it);
    return g;
}

utils::Ref<core::Tensor> GradientStore::take(const utils::Ref<const core::Tensor>& t) {
    if (!t) throw UseAfterFreeError("GradientStore::take: null tensor handle");
    return take(t->id());
}

utils::Ref<const core::Tensor> GradientStore::peek(core::TensorId id) const {
    auto it = _grads.find(id);
    if (it == _grads.end()) return nullptr;
    return it->second;
}

utils::Ref<const core::Tensor> GradientStore::peek(const utils::Ref<const core::Tensor>& t) const {
    if (!t) throw UseAfterFreeError("GradientStore::peek: null tensor handle");
    return peek(t->id());
}

bool GradientStore::contains(const utils::Ref<const core::Tensor>& t) const {
    if (!t) throw UseAfterFreeError("GradientStore::contains: null tensor handle");
    return contains(t->id());
}

std::vector<core::TensorId> GradientStore::ids() const {
    std::vector<core::TensorId> out;
    out.reserve(_grads.size());
    for (const auto& kv : _grads) out.push_back(kv.first);
    return out;
}

} // namespace autograd
} // namespace tapegrad
