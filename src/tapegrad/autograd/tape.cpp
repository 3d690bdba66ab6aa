// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#include "tapegrad/autograd/tape.h"
#include "tapegrad/autograd/gradient_store.h"
#include "tapegrad/errors.h"
#include "tapegrad/utils/log.h"

namespace tapegrad {
namespace autograd {

bool should_record(const Tape* tape, const std::vector<utils::Ref<const core::Tensor>>& inputs) {
    if (!tape) return false;
    for (const auto& t : inputs) {
        if (t && t->requires_grad()) return true;
    }
    return false;
}

bool Tape::record(const char* name, const std::vector<utils::Ref<const core::Tensor>>& inputs,
                  const utils::Ref<core::Tensor>& output, BackwardOp backward) {
    if (_consumed) {
        throw TapeReuseError(std::string("Tape::record(") + name + "): tape was already replayed");
    }
    for (const auto& t : inputs) core::check_live(t, name);
    core::check_live(output, name);

    bool any = false;
    for (const auto& t : inputs) any = any || t->requires_grad();
    if (!any) return false;

    TapeEntry e;
    e.name = name;
    e.inputs.reserve(inputs.size());
    e.needs_grad.reserve(inputs.size());
    e.input_shapes.reserve(inputs.size());
    e.input_devices.reserve(inputs.size());
    for (const auto& t : inputs) {
        e.inputs.push_back(t->id());
        e.needs_grad.push_back(t->requires_grad());
        e.input_shapes.push_back(t->shape());
        e.input_devices.push_back(t->device());
    }
    e.output = output->id();
    e.output_shape = output->shape();
    e.device = output->device();
    e.backward = std::move(backward);

    output->set_requires_grad(true);
    _outputs.insert(e.output);
    _entries.push_back(std::move(e));
    return true;
}

void Tape::replay(GradientStore& store) {
    if (_consumed) {
        throw TapeReuseError("Tape::replay: tape was already replayed");
    }
    _consumed = true;
    std::vector<TapeEntry> entries = std::move(_entries);
    _entries.clear();
    _outputs.clear();

    size_t visited = 0;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        const TapeEntry& e = *it;
        utils::Ref<const core::Tensor> grad_out = store.peek(e.output);
        if (!grad_out) continue; // dead branch
        ++visited;

        auto contributions = compute_gradients(e, grad_out);
        for (size_t i = 0; i < e.inputs.size(); ++i) {
            if (!e.needs_grad[i]) continue;
            const auto& g = contributions[i];
            if (!g) continue;
            if (g->shape() != e.input_shapes[i]) {
                throw ShapeMismatchError(std::string("Tape::replay(") + e.name + "): gradient for input " + std::to_string(i),
                                         g->shape(), e.input_shapes[i]);
            }
            if (g->device() != e.input_devices[i]) {
                throw BackendMismatchError(std::string("Tape::replay(") + e.name + "): gradient on " + g->device()->name() +
                                           ", input on " + e.input_devices[i]->name());
            }
            store.accumulate(e.inputs[i], g);
        }
    }
    TAPEGRAD_LOG_DEBUG("tape replay: " << entries.size() << " entries, " << visited << " reached, "
                       << store.size() << " gradients");
}

void Tape::clear() {
    _entries.clear();
    _outputs.clear();
}

} // namespace autograd
} // namespace tapegrad
