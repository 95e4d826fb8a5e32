// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/tensor_instantiator.h"

#include <algorithm>
#include <map>

#include <fmt/core.h>

#include "runtime/ops/split_embedding.h"
#include "trace/element_types.h"

namespace replay {
namespace {

constexpr std::string_view kEmbeddingBag = "aten::embedding_bag";
constexpr std::string_view kPinMemory = "aten::pin_memory";

long first_dim(const std::vector<long>& shape) {
    return shape.empty() ? 1 : shape.front();
}

// Offsets of aten::embedding_bag must be non-decreasing; random or all-ones
// content is not. Rewrite them as bags of equal size.
void patch_embedding_bag_offsets(const TraceNode& node, const TensorBindings& bindings, TensorRegistry& registry) {
    const TensorRef* indices = nullptr;
    const TensorRef* offsets = nullptr;
    const auto refs = node.input_tensors();
    for (const auto& ref : refs) {
        if (ref.ArgIndex == 1 && ref.ListIndex < 0) indices = &ref;
        if (ref.ArgIndex == 2 && ref.ListIndex < 0) offsets = &ref;
    }
    if (!indices || !offsets) {
        return;
    }
    auto slot = bindings.slot_for(node.Id, offsets->Id);
    if (!slot || !registry.has_permanent(*slot) || !registry.permanent(*slot)) {
        return;
    }

    Tensor& t = *registry.permanent(*slot);
    const long num_offsets = first_dim(offsets->Shape);
    if (num_offsets <= 0) {
        return;
    }
    const double nnz = static_cast<double>(first_dim(indices->Shape)) / static_cast<double>(num_offsets);
    const long n = std::min(num_offsets, static_cast<long>(t.nelem()));
    if (t.DType == ETensorDType::INT64) {
        std::int64_t* off = t.get<std::int64_t>();
        for (long i = 0; i < n; ++i) off[i] = static_cast<std::int64_t>(i * nnz);
    } else if (t.DType == ETensorDType::INT32) {
        std::int32_t* off = t.get<std::int32_t>();
        for (long i = 0; i < n; ++i) off[i] = static_cast<std::int32_t>(i * nnz);
    }
}

} // namespace

bool is_always_eager(const TraceNode& node) {
    return node.Name == kEmbeddingBag || split_embedding_forward_variant(node.Name).has_value();
}

InstantiationStats instantiate_tensors(const ReplaySubgraph& subgraph, const TensorBindings& bindings,
                                       TensorRegistry& registry, TensorGenerator& generator, TensorAllocator& allocator) {
    InstantiationStats stats;
    auto monitor = allocator.with_context("permanent_registry");

    for (const TraceNode* node : subgraph.Nodes) {
        const bool eager = is_always_eager(*node);
        std::map<int, TensorPtr> structured;
        if (split_embedding_forward_variant(node->Name)) {
            structured = generator.split_embedding_inputs(allocator, *node);
        }

        const auto refs = node->input_tensors();
        for (std::size_t i = 0; i < refs.size(); ++i) {
            const TensorRef& ref = refs[i];
            auto slot = bindings.slot_for(node->Id, ref.Id);
            if (!slot || registry.has_permanent(*slot)) {
                continue;
            }
            if (!eager && !bindings.needs_instantiation(*slot)) {
                continue;
            }

            TensorPtr t;
            if (auto it = structured.find(ref.ArgIndex); it != structured.end() && ref.ListIndex < 0) {
                t = it->second;
            } else {
                t = generator.generate(allocator, ref.ElemType, ref.Shape, "instantiated");
            }

            if (!t) {
                if (ref.ElemType != kUninitializedElemType) {
                    stats.Warnings.push_back(fmt::format("no generator for element type '{}' (node {}, tensor {}), bound to null",
                                                         ref.ElemType, node->Id, to_string(ref.Id)));
                }
                ++stats.NullBound;
                registry.bind_permanent(*slot, nullptr);
                continue;
            }

            stats.Bytes += t->bytes();
            ++stats.Materialized;
            registry.bind_permanent(*slot, std::move(t));
            if (eager) {
                registry.mark_unchangeable(*slot);
            }
            if (node->Name == kPinMemory && i == 0) {
                registry.mark_host_resident(*slot);
            }
        }

        if (node->Name == kEmbeddingBag) {
            patch_embedding_bag_offsets(*node, bindings, registry);
        }
    }
    return stats;
}

} // namespace replay
