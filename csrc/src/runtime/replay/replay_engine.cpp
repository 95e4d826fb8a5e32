// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/replay_engine.h"

#include <algorithm>
#include <limits>
#include <map>
#include <memory>
#include <optional>

#include <fmt/core.h>

#include "runtime/ops/split_embedding.h"
#include "utilities/gpu_info.h"
#include "utilities/utils.h"

namespace replay {
namespace {

OpValue to_op_value(const TraceValue& v) {
    struct Visitor {
        OpValue operator()(std::monostate) const { return {}; }
        OpValue operator()(bool b) const { return b; }
        OpValue operator()(std::int64_t i) const { return i; }
        OpValue operator()(double d) const { return d; }
        OpValue operator()(const std::string& s) const {
            if (s == "<None>" || s == "<Generator>") return {};
            if (s == "inf") return std::numeric_limits<double>::infinity();
            if (s == "-inf") return -std::numeric_limits<double>::infinity();
            return s;
        }
        OpValue operator()(const TraceValue::ListPtr& l) const {
            auto out = std::make_shared<OpList>();
            if (l) {
                out->reserve(l->size());
                for (const auto& item : *l) {
                    out->push_back(to_op_value(item));
                }
            }
            return out;
        }
    };
    return std::visit(Visitor{}, v.value);
}

} // namespace

ReplayEngine::ReplayEngine(const ReplaySubgraph& subgraph, const TensorBindings& bindings, const OperatorBuilder& builder,
                           const ArgPatchTable& patches, TensorRegistry& registry, OpContext& ctx) :
    mSubgraph(subgraph), mBindings(bindings), mBuilder(builder), mPatches(patches), mRegistry(registry), mCtx(ctx) {
}

void ReplayEngine::run_pass() {
    for (const TraceNode* node : mSubgraph.Nodes) {
        run_node(*node);
    }
}

std::vector<OpValue> ReplayEngine::resolve_inputs(const TraceNode& node) const {
    // tensor arguments by position; list arguments keep their element order
    std::map<int, std::vector<TensorPtr>> tensors;
    for (const auto& ref : node.input_tensors()) {
        TensorPtr value;
        if (auto slot = mBindings.slot_for(node.Id, ref.Id)) {
            value = mRegistry.get(*slot);
        }
        tensors[ref.ArgIndex].push_back(std::move(value));
    }

    auto tensor_at = [&](int idx) -> TensorPtr {
        auto it = tensors.find(idx);
        return it == tensors.end() || it->second.empty() ? nullptr : it->second.front();
    };

    std::vector<OpValue> args;
    if (split_embedding_forward_variant(node.Name)) {
        // absent per-sample weights resolve to None
        for (int idx : split_embedding_call_args()) {
            args.emplace_back(tensor_at(idx));
        }
        return args;
    }

    args.reserve(node.Inputs.size());
    for (std::size_t idx = 0; idx < node.Inputs.size(); ++idx) {
        const int arg = static_cast<int>(idx);
        if (node.is_tensor_input(idx)) {
            args.emplace_back(tensor_at(arg));
        } else if (node.is_tensor_list_input(idx)) {
            auto it = tensors.find(arg);
            args.emplace_back(it == tensors.end() ? TensorList{} : it->second);
        } else {
            args.push_back(to_op_value(node.Inputs[idx]));
        }
    }
    return args;
}

void ReplayEngine::run_node(const TraceNode& node) {
    const OpCallable* callable = mBuilder.callable(node.Id);
    if (!callable) {
        return;
    }

    std::optional<NvtxRange> range;
    if (mAnnotate) {
        range.emplace(node.Name.c_str());
    }

    try {
        std::vector<OpValue> args = resolve_inputs(node);
        mPatches.apply(node.Name, mCtx, args);

        std::vector<OpValue> results = callable->Fn(mCtx, args);
        std::vector<TensorPtr> outputs;
        if (callable->OutputCount > 0) {
            outputs = normalize_outputs(results);
            write_back(node, outputs);
        }
        if (mObserver) {
            mObserver(node, args, outputs);
        }
    } catch (const std::exception& e) {
        throw ReplayError(fmt::format("node {} ({}): {}", node.Id, node.Name, e.what()));
    }

    if (mProfileMemory) {
        sample_memory(node);
    }
}

std::vector<TensorPtr> ReplayEngine::normalize_outputs(std::vector<OpValue>& results) const {
    std::vector<TensorPtr> outputs;
    for (auto& r : results) {
        if (auto* t = std::get_if<TensorPtr>(&r.value)) {
            if (*t) {
                outputs.push_back(std::move(*t));
            }
        } else if (auto* list = std::get_if<TensorList>(&r.value)) {
            for (auto& item : *list) {
                outputs.push_back(std::move(item));
            }
        }
    }
    return outputs;
}

void ReplayEngine::write_back(const TraceNode& node, const std::vector<TensorPtr>& outputs) {
    const auto refs = node.output_tensors();
    const std::size_t n = std::min(refs.size(), outputs.size());
    for (std::size_t i = 0; i < n; ++i) {
        auto slot = mBindings.slot_for(node.Id, refs[i].Id);
        if (!slot || mRegistry.is_unchangeable(*slot) || mBindings.needs_instantiation(*slot)) {
            continue;
        }
        mRegistry.set(*slot, outputs[i]);
    }
}

void ReplayEngine::sample_memory(const TraceNode& node) {
    long long allocated = 0;
    long long reserved = 0;
    if (mCtx.Device >= 0) {
        CUDA_CHECK(cudaStreamSynchronize(mCtx.Stream));
        allocated = static_cast<long long>(mCtx.Allocator.live_bytes(EAllocationType::ON_DEVICE));
        reserved = static_cast<long long>(get_mem_reserved());
    } else {
        allocated = static_cast<long long>(mCtx.Allocator.live_bytes(EAllocationType::ON_HOST));
        reserved = allocated + static_cast<long long>(mCtx.Allocator.live_bytes(EAllocationType::PINNED));
    }
    mMemoryDeltas[node.Id] = MemoryDelta{node.Id, node.Name, allocated - mCurrentAllocated, reserved - mCurrentReserved};
    mCurrentAllocated = allocated;
    mCurrentReserved = reserved;
}

} // namespace replay
