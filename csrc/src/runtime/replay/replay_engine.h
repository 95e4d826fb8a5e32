// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Single-stream execution of the qualified nodes against the working registry.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_ENGINE_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_ENGINE_H

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "runtime/replay/arg_patches.h"
#include "runtime/replay/operator_builder.h"
#include "runtime/replay/subgraph_extractor.h"
#include "runtime/replay/tensor_identity.h"
#include "runtime/replay/tensor_registry.h"

namespace replay {

//! Change of the allocator counters across one node invocation.
struct MemoryDelta {
    std::int64_t Node = 0;
    std::string Name;
    long long Allocated = 0;
    long long Reserved = 0;
};

class ReplayEngine {
public:
    //! Called after every executed node with its resolved arguments and normalized results.
    using NodeObserver = std::function<void(const TraceNode&, const std::vector<OpValue>& inputs,
                                            const std::vector<TensorPtr>& outputs)>;

    ReplayEngine(const ReplaySubgraph& subgraph, const TensorBindings& bindings, const OperatorBuilder& builder,
                 const ArgPatchTable& patches, TensorRegistry& registry, OpContext& ctx);

    //! Executes every qualified node once, in ascending id order.
    void run_pass();

    //! @throws ReplayError naming the node if argument resolution or invocation fails.
    void run_node(const TraceNode& node);

    //! Arguments of @p node resolved against the current working registry.
    std::vector<OpValue> resolve_inputs(const TraceNode& node) const;

    void set_profile_memory(bool enable) { mProfileMemory = enable; }
    //! Emit one NVTX range per operator.
    void set_annotate(bool enable) { mAnnotate = enable; }
    void set_observer(NodeObserver observer) { mObserver = std::move(observer); }

    //! Latest memory delta per node, only recorded with memory profiling enabled.
    const std::unordered_map<std::int64_t, MemoryDelta>& memory_deltas() const { return mMemoryDeltas; }
    std::size_t num_nodes() const { return mSubgraph.Nodes.size(); }

private:
    std::vector<TensorPtr> normalize_outputs(std::vector<OpValue>& results) const;
    void write_back(const TraceNode& node, const std::vector<TensorPtr>& outputs);
    void sample_memory(const TraceNode& node);

    const ReplaySubgraph& mSubgraph;
    const TensorBindings& mBindings;
    const OperatorBuilder& mBuilder;
    const ArgPatchTable& mPatches;
    TensorRegistry& mRegistry;
    OpContext& mCtx;

    bool mProfileMemory = false;
    bool mAnnotate = false;
    NodeObserver mObserver;

    std::unordered_map<std::int64_t, MemoryDelta> mMemoryDeltas;
    long long mCurrentAllocated = 0;
    long long mCurrentReserved = 0;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_ENGINE_H
