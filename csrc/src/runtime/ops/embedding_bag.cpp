// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <cstring>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"

namespace replay {
namespace {

/**
 * aten::embedding_bag(weight, indices, offsets, scale_grad_by_freq, mode, sparse,
 *                     per_sample_weights, include_last_offset, padding_idx)
 *
 * Returns (output[B, D], offset2bag[N], bag_size[B], max_indices[B]). Only sum and mean
 * pooling are supported; max_indices is all zeros. Indices and offsets may be int64 or int32.
 * With include_last_offset the last offset closes the last bag, and indices past it are ignored.
 */
std::vector<OpValue> embedding_bag(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& weight = tensor_arg(args, 0, "aten::embedding_bag");
    TensorPtr indices = index_tensor_arg(ctx, args, 1, "aten::embedding_bag");
    TensorPtr offsets = index_tensor_arg(ctx, args, 2, "aten::embedding_bag");
    const auto mode = static_cast<EPoolingMode>(int_arg(args, 4, 0, "aten::embedding_bag"));
    TensorPtr per_sample_weights = optional_tensor_arg(args, 6, "aten::embedding_bag");
    const bool include_last_offset = bool_arg(args, 7, false, "aten::embedding_bag");

    if (mode != EPoolingMode::SUM && mode != EPoolingMode::MEAN) {
        throw std::invalid_argument(fmt::format("aten::embedding_bag: unsupported pooling mode {}", static_cast<int>(mode)));
    }
    if (per_sample_weights && mode != EPoolingMode::SUM) {
        throw std::invalid_argument("aten::embedding_bag: per_sample_weights require sum pooling");
    }
    if (weight->Rank != 2 || weight->DType != ETensorDType::FP32) {
        throw std::invalid_argument(fmt::format("aten::embedding_bag: weight must be a 2D fp32 tensor, got {} {}",
                                                dtype_to_str(weight->DType), shape_to_string(weight->shape())));
    }
    for (const Tensor* t : {indices.get(), offsets.get(), per_sample_weights.get()}) {
        if (t && t->is_host() != weight->is_host()) {
            throw std::invalid_argument(fmt::format("aten::embedding_bag: weight on {} but indices/offsets on {}",
                                                    weight->is_host() ? "host" : "device", t->is_host() ? "host" : "device"));
        }
    }

    const long N = static_cast<long>(indices->nelem());
    const long num_offsets = static_cast<long>(offsets->nelem());
    if (include_last_offset && num_offsets < 1) {
        throw std::invalid_argument("aten::embedding_bag: include_last_offset requires at least one offset");
    }
    const int B = narrow<int>(num_offsets - (include_last_offset ? 1 : 0));
    const int D = narrow<int>(weight->Sizes[1]);

    const auto offset_values = read_index_values(ctx, *offsets);
    check_offsets(offset_values, N, "aten::embedding_bag");
    check_index_range(read_index_values(ctx, *indices), weight->Sizes[0], "aten::embedding_bag");
    const long last = include_last_offset ? static_cast<long>(offset_values[B]) : N;

    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, {B, D}, *weight, "aten::embedding_bag");
    TensorPtr offset2bag = allocate_output(ctx, ETensorDType::INT64, {N}, *weight, "aten::embedding_bag.offset2bag");
    TensorPtr bag_size = allocate_output(ctx, ETensorDType::INT64, {B}, *weight, "aten::embedding_bag.bag_size");
    TensorPtr max_indices = allocate_output(ctx, ETensorDType::INT64, {B}, *weight, "aten::embedding_bag.max_indices");

    const float* psw = per_sample_weights ? per_sample_weights->get<float>() : nullptr;
    if (weight->is_host()) {
        std::memset(offset2bag->Data, 0, offset2bag->bytes());
        embedding_bag_forward_cpu(out->get<float>(), offset2bag->get<std::int64_t>(), bag_size->get<std::int64_t>(),
                                  weight->get<float>(), indices->get<std::int64_t>(), offsets->get<std::int64_t>(),
                                  psw, B, last, D, mode);
        std::memset(max_indices->Data, 0, max_indices->bytes());
    } else {
        CUDA_CHECK(cudaMemsetAsync(offset2bag->Data, 0, offset2bag->bytes(), ctx.Stream));
        embedding_bag_forward(out->get<float>(), offset2bag->get<std::int64_t>(), bag_size->get<std::int64_t>(),
                              weight->get<float>(), indices->get<std::int64_t>(), offsets->get<std::int64_t>(),
                              psw, B, last, D, mode, ctx.Stream);
        CUDA_CHECK(cudaMemsetAsync(max_indices->Data, 0, max_indices->bytes(), ctx.Stream));
    }
    return {out, offset2bag, bag_size, max_indices};
}

} // namespace

void register_embedding_bag_ops(OperatorLibrary& lib) {
    lib.add("aten::embedding_bag", embedding_bag, 4);
    lib.add("aten::_embedding_bag", embedding_bag, 4);
}

} // namespace replay
