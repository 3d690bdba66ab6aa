// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/autograd/driver.h"
#include "tapegrad/core/tensor_utils.h"
#include "tapegrad/errors.h"

namespace tapegrad {
namespace autograd {

GradientStore backward(const utils::Ref<const core::Tensor>& loss, Tape& tape) {
    core::check_live(loss, "backward");
    if (tape.consumed()) {
        throw TapeReuseError("backward: tape was already replayed");
    }
    if (!loss->requires_grad() || !tape.has_recorded(loss->id())) {
        throw NonDifferentiableRootError("backward: tensor " + std::to_string(loss->id()) + " has no recorded history on this tape");
    }
    if (loss->rank() != 0) {
        throw ShapeMismatchError("backward: loss must be rank 0, got shape " + utils::vector::to_string(loss->shape()));
    }

    GradientStore store;
    store.accumulate(loss->id(), core::scalar_like(1.0, loss));
    tape.replay(store);
    return store;
}

} // namespace autograd
} // namespace tapegrad
