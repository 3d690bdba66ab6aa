// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include "tapegrad/autograd/gradient_store.h"
#include "tapegrad/autograd/tape.h"
#include "tapegrad/core/tensor.h"

namespace tapegrad {
namespace autograd {

// Seeds d(loss)/d(loss) = 1 and replays `tape`, consuming it.
// Throws, in order of checking:
//   UseAfterFreeError          loss is null or has no buffer
//   TapeReuseError             tape already consumed
//   NonDifferentiableRootError loss does not request gradients or was not
//                              produced on this tape
//   ShapeMismatchError         loss is not rank 0
GradientStore backward(const utils::Ref<const core::Tensor>& loss, Tape& tape);

} // namespace autograd
} // namespace tapegrad
