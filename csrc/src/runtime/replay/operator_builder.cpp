// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/operator_builder.h"

#include <fmt/core.h>

#include "runtime/replay/replay_types.h"
#include "trace/execution_graph.h"

namespace replay {

OperatorBuilder::OperatorBuilder(const OperatorLibrary& library, OpContext& ctx, unsigned long long seed, bool skip_missing) :
    mLibrary(library), mCtx(ctx), mSeed(seed), mSkipMissing(skip_missing) {
}

void OperatorBuilder::build(const TraceNode& node) {
    if (mCallables.contains(node.Id)) {
        return;
    }

    if (split_embedding_forward_variant(node.Name)) {
        SplitEmbeddingConfig config = split_embedding_config(node);
        // tables of different nodes must not share their random init
        auto bags = std::make_shared<SplitEmbeddingBags>(config, mCtx, mSeed + static_cast<unsigned long long>(node.Id));
        mCallables[node.Id] = bags->forward_callable();
        mBackwardStack.push_back(bags->backward_callable());
        mSplitEmbeddings.push_back(std::move(bags));
        return;
    }

    if (split_embedding_backward_variant(node.Name)) {
        if (mBackwardStack.empty()) {
            throw TraceError(fmt::format("{} has no preceding split embedding forward call", node.Name));
        }
        mCallables[node.Id] = std::move(mBackwardStack.back());
        mBackwardStack.pop_back();
        return;
    }

    if (auto found = mLibrary.lookup(node.Name, node.OpSchema)) {
        mCallables[node.Id] = std::move(*found);
        return;
    }

    mMissing.insert(node.Name);
    if (!mSkipMissing) {
        mCallables[node.Id] = missing_callable(node);
    }
}

const OpCallable* OperatorBuilder::callable(std::int64_t node_id) const {
    auto it = mCallables.find(node_id);
    if (it == mCallables.end() || !it->second) {
        return nullptr;
    }
    return &it->second;
}

OpCallable OperatorBuilder::missing_callable(const TraceNode& node) const {
    std::string message = node.OpSchema.empty()
        ? fmt::format("no implementation for operator {}", node.Name)
        : fmt::format("no implementation for operator {} ({})", node.Name, node.OpSchema);
    return OpCallable{
        [message](OpContext&, std::vector<OpValue>&) -> std::vector<OpValue> {
            throw ReplayError(message);
        },
        0,
        node.Name};
}

} // namespace replay
