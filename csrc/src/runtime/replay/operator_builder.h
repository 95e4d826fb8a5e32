// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Binds a callable and its declared output arity to every qualified node.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_OPERATOR_BUILDER_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_OPERATOR_BUILDER_H

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "runtime/ops/op_library.h"
#include "runtime/ops/split_embedding.h"

namespace replay {

struct TraceNode;

/**
 * @brief Selects the callable of each qualified node and caches it by node id.
 *
 * Split-embedding forward nodes get a freshly constructed SplitEmbeddingBags
 * object; its backward entry is pushed onto a stack and handed to the next
 * split-embedding backward node (strict LIFO). All other nodes are resolved
 * through the operator library. A library miss binds a callable that raises
 * when executed, or, with @p skip_missing, no callable at all.
 */
class OperatorBuilder {
public:
    OperatorBuilder(const OperatorLibrary& library, OpContext& ctx, unsigned long long seed, bool skip_missing);

    //! @throws TraceError when a split-embedding backward node has no pending forward.
    void build(const TraceNode& node);

    //! Cached callable of @p node_id, nullptr if the node is skipped or was never built.
    const OpCallable* callable(std::int64_t node_id) const;

    std::size_t size() const { return mCallables.size(); }
    //! Backward entries still waiting for their backward node.
    std::size_t pending_backward() const { return mBackwardStack.size(); }
    //! Operator names without an implementation in the library.
    const std::set<std::string>& missing_operators() const { return mMissing; }
    //! Split-embedding objects created so far, in trace order.
    const std::vector<std::shared_ptr<SplitEmbeddingBags>>& split_embeddings() const { return mSplitEmbeddings; }

private:
    OpCallable missing_callable(const TraceNode& node) const;

    const OperatorLibrary& mLibrary;
    OpContext& mCtx;
    unsigned long long mSeed;
    bool mSkipMissing;

    std::unordered_map<std::int64_t, OpCallable> mCallables;
    std::vector<OpCallable> mBackwardStack;
    std::vector<std::shared_ptr<SplitEmbeddingBags>> mSplitEmbeddings;
    std::set<std::string> mMissing;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_OPERATOR_BUILDER_H
