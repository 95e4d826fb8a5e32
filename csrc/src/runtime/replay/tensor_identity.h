// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Assignment of replay buffer slots to trace tensor identifiers.
//
// A trace identifier names a storage, not a tensor: the same identifier can be
// recorded with different shapes over the course of a run. Every distinct
// (identifier, shape) pair gets its own slot, and every (node, identifier)
// reference is bound to the slot of the shape it was recorded with.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_IDENTITY_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_IDENTITY_H

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "runtime/replay/replay_types.h"
#include "runtime/replay/subgraph_extractor.h"

namespace replay {

struct TensorBindings {
    std::unordered_map<NodeTensorKey, ReplaySlot, NodeTensorKeyHash> Bindings;
    std::unordered_map<ReplaySlot, std::vector<long>> SlotShapes;
    //! Every shape an identifier was seen with, in order of first appearance.
    std::unordered_map<TensorId, std::vector<std::pair<std::vector<long>, ReplaySlot>>, TensorIdHash> ShapesById;
    //! Slots read before any qualified node produces them.
    std::unordered_set<ReplaySlot> Instantiate;
    int NumSlots = 0;

    //! Slot of @p id as referenced by @p node_id, nullopt if the reference is untracked.
    [[nodiscard]] std::optional<ReplaySlot> slot_for(std::int64_t node_id, const TensorId& id) const;
    [[nodiscard]] bool needs_instantiation(ReplaySlot slot) const { return Instantiate.contains(slot); }

    //! Number of identifiers recorded with more than one shape.
    [[nodiscard]] std::size_t multi_shape_ids() const;
    [[nodiscard]] std::size_t total_ids() const { return ShapesById.size(); }
};

/**
 * @brief Mints slots for all tracked tensors of @p subgraph and classifies them.
 *
 * Identifiers with a zero dependency count are ignored. Within a node, inputs
 * are visited before outputs, so if a node references one identifier with two
 * shapes, its output shape owns the binding.
 */
TensorBindings resolve_tensor_identities(const ReplaySubgraph& subgraph);

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_IDENTITY_H
