// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include "tapegrad/autograd/backward_op.h"
#include "tapegrad/core/tensor.h"
#include "tapegrad/core/tensor_id.h"

namespace tapegrad {
namespace autograd {

class GradientStore;

struct TapeEntry {
    const char* name = "";
    std::vector<core::TensorId> inputs;
    std::vector<bool> needs_grad;
    std::vector<std::vector<size_t>> input_shapes;
    std::vector<backend::Device*> input_devices;
    core::TensorId output = 0;
    std::vector<size_t> output_shape;
    backend::Device* device = nullptr;
    BackwardOp backward;
};

// Records one forward pass; replayed once, in reverse, by backward().
// Not thread safe: one tape per forward pass.
class Tape {
public:
    Tape() = default;
    Tape(const Tape&) = delete;
    Tape& operator=(const Tape&) = delete;
    Tape(Tape&&) = default;
    Tape& operator=(Tape&&) = default;

    // Appends an entry when any input requests gradients and marks `output`
    // as requesting gradients. Returns false (and records nothing) otherwise.
    // Throws TapeReuseError on a consumed tape, UseAfterFreeError on a dead
    // input or output.
    bool record(const char* name, const std::vector<utils::Ref<const core::Tensor>>& inputs,
                const utils::Ref<core::Tensor>& output, BackwardOp backward);

    // Reverse sweep. Consumes the tape.
    void replay(GradientStore& store);

    // Drops every entry and its saved state without replaying.
    void clear();

    size_t size() const noexcept { return _entries.size(); }
    bool empty() const noexcept { return _entries.empty(); }
    bool consumed() const noexcept { return _consumed; }
    bool has_recorded(core::TensorId id) const { return _outputs.count(id) != 0; }

private:
    std::vector<TapeEntry> _entries;
    std::unordered_set<core::TensorId> _outputs;
    bool _consumed = false;
};

// True when `tape` is non-null and any input requests gradients. Operations
// check this before building saved state.
bool should_record(const Tape* tape, const std::vector<utils::Ref<const core::Tensor>>& inputs);

} // namespace autograd
} // namespace tapegrad
