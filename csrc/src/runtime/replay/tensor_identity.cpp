// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/tensor_identity.h"

namespace replay {
namespace {

void bind(TensorBindings& b, std::int64_t node_id, const TensorRef& ref) {
    auto& shapes = b.ShapesById[ref.Id];
    ReplaySlot slot = 0;
    for (const auto& [shape, existing] : shapes) {
        if (shape == ref.Shape) {
            slot = existing;
            break;
        }
    }
    if (slot == 0) {
        slot = ++b.NumSlots;
        shapes.emplace_back(ref.Shape, slot);
        b.SlotShapes[slot] = ref.Shape;
    }
    b.Bindings[NodeTensorKey{node_id, ref.Id}] = slot;
}

} // namespace

std::optional<ReplaySlot> TensorBindings::slot_for(std::int64_t node_id, const TensorId& id) const {
    auto it = Bindings.find(NodeTensorKey{node_id, id});
    if (it == Bindings.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TensorBindings::multi_shape_ids() const {
    std::size_t count = 0;
    for (const auto& [id, shapes] : ShapesById) {
        if (shapes.size() > 1) {
            ++count;
        }
    }
    return count;
}

TensorBindings resolve_tensor_identities(const ReplaySubgraph& subgraph) {
    TensorBindings b;

    for (const TraceNode* node : subgraph.Nodes) {
        for (const auto& ref : node->input_tensors()) {
            if (subgraph.is_tracked(ref.Id)) {
                bind(b, node->Id, ref);
            }
        }
        for (const auto& ref : node->output_tensors()) {
            if (subgraph.is_tracked(ref.Id)) {
                bind(b, node->Id, ref);
            }
        }
    }

    std::unordered_set<ReplaySlot> produced;
    for (const TraceNode* node : subgraph.Nodes) {
        for (const auto& ref : node->input_tensors()) {
            if (auto slot = b.slot_for(node->Id, ref.Id); slot && !produced.contains(*slot)) {
                b.Instantiate.insert(*slot);
            }
        }
        for (const auto& ref : node->output_tensors()) {
            if (auto slot = b.slot_for(node->Id, ref.Id)) {
                produced.insert(*slot);
            }
        }
    }
    return b;
}

} // namespace replay
