// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/subgraph_extractor.h"

#include <algorithm>

#include <fmt/core.h>

#include "runtime/replay/operator_builder.h"

namespace replay {

int ReplaySubgraph::dependency_count(const TensorId& id) const {
    auto it = Dependencies.find(id);
    return it == Dependencies.end() ? 0 : it->second;
}

const std::vector<std::string>& default_skip_node_names() {
    static const std::vector<std::string> names = {"DataLoader", "aten::set_"};
    return names;
}

bool matches_skip_list(std::string_view name, const std::vector<std::string>& skip_names) {
    return std::any_of(skip_names.begin(), skip_names.end(), [name](const std::string& skip) {
        return name.find(skip) != std::string_view::npos;
    });
}

namespace {

void record_qualified(ReplaySubgraph& sg, const TraceNode& node, OperatorBuilder* builder) {
    TensorIdSet& top = sg.TopTensors[node.Id];
    for (const auto& ref : node.input_tensors()) {
        top.insert(ref.Id);
        sg.Dependencies[ref.Id] += 1;
    }
    for (const auto& ref : node.output_tensors()) {
        top.insert(ref.Id);
    }
    if (builder) {
        builder->build(node);
    }
    sg.Nodes.push_back(&node);
    sg.QualifiedIds.insert(node.Id);
}

} // namespace

ReplaySubgraph extract_subgraph(const ExecutionGraph& graph, const std::vector<std::string>& skip_names,
                                OperatorBuilder* builder) {
    ReplaySubgraph sg;

    std::vector<const TraceNode*> stack = {&graph.root()};
    while (!stack.empty()) {
        const TraceNode* node = stack.back();
        stack.pop_back();

        if (matches_skip_list(node->Name, skip_names)) {
            continue;
        }
        if (node->is_operator()) {
            try {
                record_qualified(sg, *node, builder);
            } catch (const std::exception& e) {
                throw TraceError(fmt::format("graph parse error at node {} ({}): {}", node->Id, node->Name, e.what()));
            }
            continue;
        }
        for (auto it = node->Children.rbegin(); it != node->Children.rend(); ++it) {
            stack.push_back(&graph.node(*it));
        }
    }

    std::sort(sg.Nodes.begin(), sg.Nodes.end(), [](const TraceNode* a, const TraceNode* b) { return a->Id < b->Id; });
    return sg;
}

} // namespace replay
