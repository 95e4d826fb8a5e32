// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/dependency_analyzer.h"

#include <deque>
#include <functional>
#include <numeric>

#include "trace/element_types.h"

namespace replay {
namespace {

const TraceNode* nearest_qualified_ancestor(const ExecutionGraph& graph, const ReplaySubgraph& subgraph,
                                            const TraceNode& node) {
    for (const TraceNode* p = graph.parent_of(node); p; p = graph.parent_of(*p)) {
        if (subgraph.is_qualified(p->Id)) {
            return p;
        }
    }
    return nullptr;
}

std::size_t estimated_bytes(const TensorRef& ref) {
    std::size_t elem_bytes = static_cast<std::size_t>(ref.Id.ElemBytes);
    if (const ElementTypeInfo* info = find_element_type(ref.ElemType)) {
        elem_bytes = get_dtype_size(info->DType);
    }
    // shapeless tensors count as empty
    if (ref.Shape.empty()) {
        return 0;
    }
    const long numel = std::accumulate(ref.Shape.begin(), ref.Shape.end(), 1l, std::multiplies<>());
    return static_cast<std::size_t>(numel) * elem_bytes;
}

} // namespace

bool is_backward_node(const TraceNode& node) {
    std::string_view name = node.Name;
    if (name.starts_with("autograd::engine::evaluate_function")) {
        return true;
    }
    return name.starts_with("aten::") && name.find("_backward") != std::string_view::npos;
}

LeakReport analyze_dependencies(const ExecutionGraph& graph, const ReplaySubgraph& subgraph,
                                const std::vector<std::string>& skip_names) {
    LeakReport report;
    TensorIdSet seen;

    std::deque<const TraceNode*> queue = {&graph.root()};
    while (!queue.empty()) {
        const TraceNode* node = queue.front();
        queue.pop_front();

        if (matches_skip_list(node->Name, skip_names) || is_backward_node(*node)) {
            continue;
        }

        if (node->is_operator() && !subgraph.is_qualified(node->Id)) {
            if (const TraceNode* ancestor = nearest_qualified_ancestor(graph, subgraph, *node)) {
                const TensorIdSet& top = subgraph.TopTensors.at(ancestor->Id);
                for (const auto& ref : node->output_tensors()) {
                    if (!subgraph.is_tracked(ref.Id) || top.contains(ref.Id) || seen.contains(ref.Id)) {
                        continue;
                    }
                    seen.insert(ref.Id);
                    const std::size_t bytes = estimated_bytes(ref);
                    report.Tensors.push_back(LeakedTensor{ref.Id, node->Id, ancestor->Id, bytes});
                    report.Bytes += bytes;
                }
            }
        }

        for (std::int64_t child : node->Children) {
            queue.push_back(&graph.node(child));
        }
    }
    return report;
}

} // namespace replay
