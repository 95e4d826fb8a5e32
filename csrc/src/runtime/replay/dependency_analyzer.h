// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_DEPENDENCY_ANALYZER_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_DEPENDENCY_ANALYZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "runtime/replay/subgraph_extractor.h"

namespace replay {

//! A tensor consumed by the replayed subgraph but produced by an operator
//! nested inside a qualified node, outside that node's own inputs and outputs.
struct LeakedTensor {
    TensorId Id;
    std::int64_t Producer = 0;      ///< nested operator that produced it
    std::int64_t Ancestor = 0;      ///< nearest qualified ancestor of the producer
    std::size_t Bytes = 0;
};

struct LeakReport {
    std::vector<LeakedTensor> Tensors;
    std::size_t Bytes = 0;

    [[nodiscard]] double mib() const { return static_cast<double>(Bytes) / (1024.0 * 1024.0); }
};

//! Operators named "aten::*_backward" and autograd engine scopes.
bool is_backward_node(const TraceNode& node);

/**
 * @brief Breadth-first scan of the whole tree for tensors that leak out of qualified nodes.
 *
 * Skip-listed and backward nodes are excluded together with their subtrees.
 * Nodes without a qualified ancestor are ignored. Diagnostic only: the result
 * does not influence slot assignment.
 */
LeakReport analyze_dependencies(const ExecutionGraph& graph, const ReplaySubgraph& subgraph,
                                const std::vector<std::string>& skip_names);

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_DEPENDENCY_ANALYZER_H
