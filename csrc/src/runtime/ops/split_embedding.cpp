// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/split_embedding.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>

#include <fmt/core.h>

#include "trace/execution_graph.h"

namespace replay {
namespace {

constexpr std::string_view kForwardPrefix = "fbgemm::split_embedding_codegen_lookup_";
constexpr std::string_view kForwardSuffix = "_function";
constexpr std::string_view kBackwardPrefix = "CppNode<SplitLookupFunction_";
constexpr std::string_view kBackwardSuffix = "_Op>";

std::optional<ETableOptimizer> parse_optimizer(std::string_view name) {
    if (name == "sgd") return ETableOptimizer::SGD;
    if (name == "adagrad") return ETableOptimizer::ADAGRAD;
    return std::nullopt;
}

std::optional<ETableOptimizer> match_variant(std::string_view name, std::string_view prefix, std::string_view suffix) {
    if (!name.starts_with(prefix) || !name.ends_with(suffix) || name.size() <= prefix.size() + suffix.size()) {
        return std::nullopt;
    }
    return parse_optimizer(name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
}

long shape_numel(const std::vector<long>& shape) {
    return std::accumulate(shape.begin(), shape.end(), 1l, std::multiplies<>());
}

EAllocationType table_placement(const OpContext& ctx) {
    return ctx.Device < 0 ? EAllocationType::ON_HOST : EAllocationType::ON_DEVICE;
}

// Fills a host staging buffer with @p fill and copies it into @p dst.
template<typename T, typename Fill>
void upload(OpContext& ctx, Tensor& dst, Fill&& fill) {
    if (dst.is_host()) {
        fill(dst.get<T>());
        return;
    }
    TensorPtr staging = ctx.Allocator.allocate(dst.DType, "split_embedding.staging", EAllocationType::ON_HOST, dst.shape());
    fill(staging->get<T>());
    copy_tensor(dst, *staging, ctx.Stream);
    CUDA_CHECK(cudaStreamSynchronize(ctx.Stream));
}

} // namespace

const char* table_optimizer_to_str(ETableOptimizer opt) {
    switch (opt) {
        case ETableOptimizer::SGD: return "sgd";
        case ETableOptimizer::ADAGRAD: return "adagrad";
    }
    return "unknown";
}

std::optional<ETableOptimizer> split_embedding_forward_variant(std::string_view name) {
    return match_variant(name, kForwardPrefix, kForwardSuffix);
}

std::optional<ETableOptimizer> split_embedding_backward_variant(std::string_view name) {
    return match_variant(name, kBackwardPrefix, kBackwardSuffix);
}

const std::vector<int>& split_embedding_call_args() {
    static const std::vector<int> args = {
        split_embedding_args::kIndices,
        split_embedding_args::kOffsets,
        split_embedding_args::kIndiceWeights,
    };
    return args;
}

/**
 * @brief Derives the table geometry of a recorded forward call.
 *
 * T comes from the length of weights_offsets, D from total_D / T, E from the size of
 * dev_weights, B from the number of offsets and L from the number of indices per bag.
 */
SplitEmbeddingConfig split_embedding_config(const TraceNode& node) {
    namespace a = split_embedding_args;

    auto variant = split_embedding_forward_variant(node.Name);
    if (!variant) {
        throw std::invalid_argument(fmt::format("{} is not a split embedding forward call", node.Name));
    }

    std::map<int, std::vector<long>> shapes;
    for (const auto& ref : node.input_tensors()) {
        if (ref.ListIndex < 0) {
            shapes[ref.ArgIndex] = ref.Shape;
        }
    }
    for (int required : {a::kDevWeights, a::kWeightsOffsets, a::kIndices, a::kOffsets}) {
        if (!shapes.contains(required)) {
            throw std::invalid_argument(fmt::format("{}: missing tensor input {}", node.Name, required));
        }
    }

    SplitEmbeddingConfig cfg;
    cfg.Optimizer = *variant;
    cfg.T = narrow<int>(shape_numel(shapes[a::kWeightsOffsets]));
    if (cfg.T < 1) {
        throw std::invalid_argument(fmt::format("{}: no tables", node.Name));
    }

    long total_D = 0;
    if (static_cast<std::size_t>(a::kTotalD) < node.Inputs.size()) {
        if (const auto* v = std::get_if<std::int64_t>(&node.Inputs[a::kTotalD].value)) {
            total_D = *v;
        }
    }
    if (total_D < cfg.T || total_D % cfg.T != 0) {
        throw std::invalid_argument(fmt::format("{}: total_D {} is not a multiple of the table count {}", node.Name, total_D, cfg.T));
    }
    cfg.D = narrow<int>(total_D / cfg.T);
    cfg.E = std::max(1l, shape_numel(shapes[a::kDevWeights]) / total_D);

    const long num_offsets = shape_numel(shapes[a::kOffsets]);
    cfg.B = narrow<int>((num_offsets - 1) / cfg.T);
    if (cfg.B < 1) {
        throw std::invalid_argument(fmt::format("{}: {} offsets do not describe any bag for {} tables", node.Name, num_offsets, cfg.T));
    }
    cfg.N = shape_numel(shapes[a::kIndices]);
    cfg.L = cfg.N / (static_cast<long>(cfg.T) * cfg.B);

    if (static_cast<std::size_t>(a::kPoolingMode) < node.Inputs.size()) {
        if (const auto* v = std::get_if<std::int64_t>(&node.Inputs[a::kPoolingMode].value)) {
            cfg.Pooling = static_cast<EPoolingMode>(*v);
        }
    }
    if (cfg.Pooling != EPoolingMode::SUM && cfg.Pooling != EPoolingMode::MEAN) {
        throw std::invalid_argument(fmt::format("{}: unsupported pooling mode {}", node.Name, static_cast<int>(cfg.Pooling)));
    }
    cfg.Weighted = shapes.contains(a::kIndiceWeights);

    if (static_cast<std::size_t>(a::kLearningRate) < node.Inputs.size()) {
        const auto& lr = node.Inputs[a::kLearningRate].value;
        if (const auto* d = std::get_if<double>(&lr)) {
            cfg.LearningRate = static_cast<float>(*d);
        } else if (const auto* i = std::get_if<std::int64_t>(&lr)) {
            cfg.LearningRate = static_cast<float>(*i);
        }
    }
    return cfg;
}

SplitEmbeddingBags::SplitEmbeddingBags(const SplitEmbeddingConfig& config, OpContext& ctx, unsigned long long seed) :
    mConfig(config) {
    const EAllocationType kind = table_placement(ctx);
    const long rows = static_cast<long>(mConfig.T) * mConfig.E;
    const int D = mConfig.D;
    const long E = mConfig.E;
    const int T = mConfig.T;

    auto monitor = ctx.Allocator.with_context(fmt::format("split_embedding_{}", table_optimizer_to_str(mConfig.Optimizer)));
    mWeights = ctx.Allocator.allocate(ETensorDType::FP32, "split_embedding.weights", kind, {rows, D});
    mWeightsOffsets = ctx.Allocator.allocate(ETensorDType::INT64, "split_embedding.weights_offsets", kind, {T});
    mDOffsets = ctx.Allocator.allocate(ETensorDType::INT32, "split_embedding.D_offsets", kind, {T + 1});

    upload<float>(ctx, *mWeights, [&](float* w) {
        std::mt19937_64 gen(seed);
        std::uniform_real_distribution<float> dist(-0.01f, 0.01f);
        for (long i = 0; i < rows * D; ++i) w[i] = dist(gen);
    });
    upload<std::int64_t>(ctx, *mWeightsOffsets, [&](std::int64_t* off) {
        for (int t = 0; t < T; ++t) off[t] = static_cast<std::int64_t>(t) * E * D;
    });
    upload<int>(ctx, *mDOffsets, [&](int* off) {
        for (int t = 0; t <= T; ++t) off[t] = t * D;
    });

    if (mConfig.Optimizer == ETableOptimizer::ADAGRAD) {
        mMomentum = ctx.Allocator.allocate(ETensorDType::FP32, "split_embedding.momentum", kind, {rows, D});
        upload<float>(ctx, *mMomentum, [&](float* m) {
            std::fill(m, m + rows * D, 0.f);
        });
    }
}

OpCallable SplitEmbeddingBags::forward_callable() {
    auto self = shared_from_this();
    return OpCallable{
        [self](OpContext& ctx, std::vector<OpValue>& args) { return self->forward(ctx, args); },
        1,
        fmt::format("split_embedding_{}.forward", table_optimizer_to_str(mConfig.Optimizer))};
}

OpCallable SplitEmbeddingBags::backward_callable() {
    auto self = shared_from_this();
    return OpCallable{
        [self](OpContext& ctx, std::vector<OpValue>& args) { return self->backward(ctx, args); },
        0,
        fmt::format("split_embedding_{}.backward", table_optimizer_to_str(mConfig.Optimizer))};
}

SplitEmbeddingLayout SplitEmbeddingBags::layout(const Tensor& indices, const Tensor& offsets, const Tensor* per_sample_weights) const {
    return SplitEmbeddingLayout{
        mWeightsOffsets->get<std::int64_t>(),
        mDOffsets->get<int>(),
        indices.get<std::int64_t>(),
        offsets.get<std::int64_t>(),
        per_sample_weights ? per_sample_weights->get<float>() : nullptr,
        mConfig.T,
        mConfig.B,
        mConfig.total_D(),
        mConfig.Pooling};
}

void SplitEmbeddingBags::check_inputs(OpContext& ctx, const TensorPtr& indices, const TensorPtr& offsets) {
    if (mCheckedIndices.lock() == indices && mCheckedOffsets.lock() == offsets) {
        return;
    }
    check_offsets(read_index_values(ctx, *offsets), static_cast<long>(indices->nelem()), "split_embedding.forward");
    check_index_range(read_index_values(ctx, *indices), mConfig.E, "split_embedding.forward");
    mCheckedIndices = indices;
    mCheckedOffsets = offsets;
}

std::vector<OpValue> SplitEmbeddingBags::forward(OpContext& ctx, std::vector<OpValue>& args) {
    TensorPtr indices = index_tensor_arg(ctx, args, 0, "split_embedding.forward");
    TensorPtr offsets = index_tensor_arg(ctx, args, 1, "split_embedding.forward");
    TensorPtr psw = optional_tensor_arg(args, 2, "split_embedding.forward");

    if (static_cast<long>(offsets->nelem()) != static_cast<long>(mConfig.T) * mConfig.B + 1) {
        throw std::invalid_argument(fmt::format("split_embedding.forward: expected {} offsets, got {}",
                                                static_cast<long>(mConfig.T) * mConfig.B + 1, offsets->nelem()));
    }
    for (const Tensor* t : {indices.get(), offsets.get(), psw.get()}) {
        if (t && t->is_host() != mWeights->is_host()) {
            throw std::invalid_argument("split_embedding.forward: inputs and tables on different devices");
        }
    }
    if (psw && psw->nelem() != indices->nelem()) {
        throw std::invalid_argument(fmt::format("split_embedding.forward: {} per-sample weights for {} indices",
                                                psw->nelem(), indices->nelem()));
    }
    check_inputs(ctx, indices, offsets);

    TensorPtr out = ctx.Allocator.allocate(ETensorDType::FP32, "split_embedding.output",
                                           mWeights->is_host() ? EAllocationType::ON_HOST : EAllocationType::ON_DEVICE,
                                           {mConfig.B, mConfig.total_D()});
    const SplitEmbeddingLayout l = layout(*indices, *offsets, psw.get());
    if (mWeights->is_host()) {
        split_embedding_forward_cpu(out->get<float>(), mWeights->get<float>(), l);
    } else {
        split_embedding_forward(out->get<float>(), mWeights->get<float>(), l, ctx.Stream);
    }

    mLastIndices = indices;
    mLastOffsets = offsets;
    mLastPerSampleWeights = psw;
    return {out};
}

std::vector<OpValue> SplitEmbeddingBags::backward(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& grad = tensor_arg(args, 0, "split_embedding.backward");
    if (!mLastIndices || !mLastOffsets) {
        throw std::logic_error("split_embedding.backward: called before forward");
    }
    if (static_cast<long>(grad->nelem()) != static_cast<long>(mConfig.B) * mConfig.total_D()) {
        throw std::invalid_argument(fmt::format("split_embedding.backward: gradient {} does not match output [{}, {}]",
                                                shape_to_string(grad->shape()), mConfig.B, mConfig.total_D()));
    }
    TensorPtr g = move_to_placement(ctx, grad, mWeights->is_host());

    const SplitEmbeddingLayout l = layout(*mLastIndices, *mLastOffsets, mLastPerSampleWeights.get());
    if (mConfig.Optimizer == ETableOptimizer::SGD) {
        if (mWeights->is_host()) {
            split_embedding_backward_sgd_cpu(mWeights->get<float>(), g->get<float>(), l, mConfig.LearningRate);
        } else {
            split_embedding_backward_sgd(mWeights->get<float>(), g->get<float>(), l, mConfig.LearningRate, ctx.Stream);
        }
    } else {
        if (mWeights->is_host()) {
            split_embedding_backward_adagrad_cpu(mWeights->get<float>(), mMomentum->get<float>(), g->get<float>(), l,
                                                 mConfig.LearningRate, mConfig.Eps);
        } else {
            split_embedding_backward_adagrad(mWeights->get<float>(), mMomentum->get<float>(), g->get<float>(), l,
                                             mConfig.LearningRate, mConfig.Eps, ctx.Stream);
        }
    }
    return {};
}

} // namespace replay
