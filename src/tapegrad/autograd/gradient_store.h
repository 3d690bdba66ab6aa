// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <vector>
#include <unordered_map>
#include "tapegrad/core/tensor.h"
#include "tapegrad/core/tensor_id.h"

namespace tapegrad {
namespace autograd {

// TensorId -> dense gradient of the same shape, dtype and device.
class GradientStore {
public:
    GradientStore() = default;
    GradientStore(const GradientStore&) = delete;
    GradientStore& operator=(const GradientStore&) = delete;
    GradientStore(GradientStore&&) = default;
    GradientStore& operator=(GradientStore&&) = default;

    // Sums `delta` into the gradient of `id`. The first contribution is kept
    // as is (materialized when it is a view). Later ones are added in place
    // when the stored buffer is not shared, otherwise into a fresh buffer.
    void accumulate(core::TensorId id, const utils::Ref<const core::Tensor>& delta);

    // Removes and returns the gradient; null when absent.
    utils::Ref<core::Tensor> take(core::TensorId id);
    utils::Ref<core::Tensor> take(const utils::Ref<const core::Tensor>& t);

    // Read-only access; null when absent.
    utils::Ref<const core::Tensor> peek(core::TensorId id) const;
    utils::Ref<const core::Tensor> peek(const utils::Ref<const core::Tensor>& t) const;

    bool contains(core::TensorId id) const { return _grads.count(id) != 0; }
    bool contains(const utils::Ref<const core::Tensor>& t) const;
    size_t size() const noexcept { return _grads.size(); }
    bool empty() const noexcept { return _grads.empty(); }
    void clear() noexcept { _grads.clear(); }
    std::vector<core::TensorId> ids() const;

private:
    std::unordered_map<core::TensorId, utils::Ref<core::Tensor>> _grads;
};

} // namespace autograd
} // namespace tapegrad
