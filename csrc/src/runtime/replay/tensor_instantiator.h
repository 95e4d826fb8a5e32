// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_INSTANTIATOR_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_INSTANTIATOR_H

#include <cstddef>
#include <string>
#include <vector>

#include "runtime/replay/subgraph_extractor.h"
#include "runtime/replay/tensor_generators.h"
#include "runtime/replay/tensor_identity.h"
#include "runtime/replay/tensor_registry.h"

namespace replay {

struct InstantiationStats {
    std::size_t Materialized = 0;
    std::size_t NullBound = 0;      ///< slots whose element type has no generator
    std::size_t Bytes = 0;
    std::vector<std::string> Warnings;
};

//! Operators whose tensor inputs are always materialized up front and never
//! replaced by the outputs of their producers.
bool is_always_eager(const TraceNode& node);

/**
 * @brief Fills the permanent registry with synthetic buffers.
 *
 * Walks the qualified nodes in replay order and materializes every input slot
 * that is not yet bound and either needs instantiation or belongs to an
 * always-eager operator. Also records unchangeable and host-resident slots and
 * rewrites the offsets of aten::embedding_bag into a uniform bag layout.
 */
InstantiationStats instantiate_tensors(const ReplaySubgraph& subgraph, const TensorBindings& bindings,
                                       TensorRegistry& registry, TensorGenerator& generator, TensorAllocator& allocator);

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_INSTANTIATOR_H
