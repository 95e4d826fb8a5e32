// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Batched multi-table embedding lookup with a fused optimizer update.
//
// Recorded as a forward operator (fbgemm::split_embedding_codegen_lookup_<optimizer>_function)
// followed, later in the trace, by an autograd backward node
// (CppNode<SplitLookupFunction_<optimizer>_Op>) whose only effect is the update
// of the tables owned by the forward object.

#ifndef TRACE_REPLAY_SRC_RUNTIME_OPS_SPLIT_EMBEDDING_H
#define TRACE_REPLAY_SRC_RUNTIME_OPS_SPLIT_EMBEDDING_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kernels/kernels.h"
#include "runtime/ops/op_library.h"

namespace replay {

struct TraceNode;

enum class ETableOptimizer {
    SGD,
    ADAGRAD
};

const char* table_optimizer_to_str(ETableOptimizer opt);

//! Optimizer variant of a split-embedding forward node, nullopt if @p name is not one.
std::optional<ETableOptimizer> split_embedding_forward_variant(std::string_view name);
//! Optimizer variant of a split-embedding backward node, nullopt if @p name is not one.
std::optional<ETableOptimizer> split_embedding_backward_variant(std::string_view name);

// input positions of the recorded forward call
namespace split_embedding_args {
constexpr int kDevWeights = 0;
constexpr int kWeightsOffsets = 1;
constexpr int kDOffsets = 2;
constexpr int kTotalD = 3;
constexpr int kMaxD = 4;
constexpr int kIndices = 5;
constexpr int kOffsets = 6;
constexpr int kPoolingMode = 7;
constexpr int kIndiceWeights = 8;
constexpr int kLearningRate = 9;
}

//! Positions of the recorded inputs that the replayed forward call consumes.
const std::vector<int>& split_embedding_call_args();

/// @brief Table geometry derived from a recorded forward node.
///
/// All tables are assumed to have the same number of rows (E) and columns (D);
/// the recorded shapes only pin down the totals.
struct SplitEmbeddingConfig {
    ETableOptimizer Optimizer = ETableOptimizer::SGD;
    EPoolingMode Pooling = EPoolingMode::SUM;
    int T = 1;          ///< number of tables
    int D = 1;          ///< columns per table
    long E = 1;         ///< rows per table
    int B = 1;          ///< bags per table (batch size)
    long N = 0;         ///< total number of indices
    long L = 0;         ///< indices per bag (pooling factor)
    bool Weighted = false;
    float LearningRate = 0.01f;
    float Eps = 1e-8f;

    [[nodiscard]] int total_D() const { return T * D; }
};

//! @throws std::invalid_argument if the node's recorded inputs are inconsistent.
SplitEmbeddingConfig split_embedding_config(const TraceNode& node);

/**
 * @brief Owns the tables of one recorded split-embedding call and provides its
 * paired forward and backward callables.
 *
 * The forward entry takes (indices, offsets, per_sample_weights-or-None) and returns
 * the pooled [B, total_D] output; it remembers its inputs so that the backward entry,
 * which receives the output gradient as its first argument, can update the tables.
 */
class SplitEmbeddingBags : public std::enable_shared_from_this<SplitEmbeddingBags> {
public:
    SplitEmbeddingBags(const SplitEmbeddingConfig& config, OpContext& ctx, unsigned long long seed);

    OpCallable forward_callable();
    OpCallable backward_callable();

    std::vector<OpValue> forward(OpContext& ctx, std::vector<OpValue>& args);
    std::vector<OpValue> backward(OpContext& ctx, std::vector<OpValue>& args);

    const SplitEmbeddingConfig& config() const { return mConfig; }
    const Tensor& weights() const { return *mWeights; }

private:
    SplitEmbeddingLayout layout(const Tensor& indices, const Tensor& offsets, const Tensor* per_sample_weights) const;
    //! @throws std::invalid_argument if the offsets are malformed or an index is not below E.
    void check_inputs(OpContext& ctx, const TensorPtr& indices, const TensorPtr& offsets);

    SplitEmbeddingConfig mConfig;
    TensorPtr mWeights;
    TensorPtr mMomentum;
    TensorPtr mWeightsOffsets;
    TensorPtr mDOffsets;

    // inputs of the most recent forward call
    TensorPtr mLastIndices;
    TensorPtr mLastOffsets;
    TensorPtr mLastPerSampleWeights;

    // inputs already validated; index tensors are never modified in place
    std::weak_ptr<Tensor> mCheckedIndices;
    std::weak_ptr<Tensor> mCheckedOffsets;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_OPS_SPLIT_EMBEDDING_H
