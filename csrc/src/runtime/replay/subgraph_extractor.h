// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Selection of the replayable operator nodes of a trace.
//
// A node qualifies if it is an operator call whose name does not match the skip
// list. Qualified nodes are collected without descending into them, so the
// operators they dispatched internally are not replayed a second time.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_SUBGRAPH_EXTRACTOR_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_SUBGRAPH_EXTRACTOR_H

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "trace/execution_graph.h"

namespace replay {

class OperatorBuilder;

using TensorIdSet = std::unordered_set<TensorId, TensorIdHash>;

struct ReplaySubgraph {
    //! Qualified nodes in ascending id order; this is the replay order.
    std::vector<const TraceNode*> Nodes;
    //! Number of qualified consumers per tensor identifier.
    std::unordered_map<TensorId, int, TensorIdHash> Dependencies;
    //! Identifiers touched by the inputs and outputs of each qualified node.
    std::unordered_map<std::int64_t, TensorIdSet> TopTensors;
    std::unordered_set<std::int64_t> QualifiedIds;

    [[nodiscard]] int dependency_count(const TensorId& id) const;
    [[nodiscard]] bool is_tracked(const TensorId& id) const { return dependency_count(id) > 0; }
    [[nodiscard]] bool is_qualified(std::int64_t node_id) const { return QualifiedIds.contains(node_id); }
};

//! Data loading markers and in-place storage mutation.
const std::vector<std::string>& default_skip_node_names();

//! True if any entry of @p skip_names is a substring of @p name.
bool matches_skip_list(std::string_view name, const std::vector<std::string>& skip_names);

/**
 * @brief Depth-first selection of the qualified nodes of @p graph.
 *
 * Children are visited in recorded order. Skip-listed nodes are neither
 * collected nor descended into. For every qualified node, @p builder (if not
 * null) binds its callable.
 *
 * @throws TraceError with node context if a node is malformed or cannot be built.
 */
ReplaySubgraph extract_subgraph(const ExecutionGraph& graph, const std::vector<std::string>& skip_names,
                                OperatorBuilder* builder);

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_SUBGRAPH_EXTRACTOR_H
