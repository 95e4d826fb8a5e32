// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"

namespace replay {
namespace {

void require_rank(const Tensor& t, int rank, const char* op, const char* what) {
    if (t.Rank != rank) {
        throw std::invalid_argument(fmt::format("{}: {} must have rank {}, got shape {}", op, what, rank, shape_to_string(t.shape())));
    }
}

std::vector<OpValue> mm(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& a = tensor_arg(args, 0, "aten::mm");
    const TensorPtr& b = tensor_arg(args, 1, "aten::mm");
    require_rank(*a, 2, "aten::mm", "self");
    require_rank(*b, 2, "aten::mm", "mat2");
    if (a->Sizes[1] != b->Sizes[0]) {
        throw std::invalid_argument(fmt::format("aten::mm: shapes {} and {} cannot be multiplied",
                                                shape_to_string(a->shape()), shape_to_string(b->shape())));
    }
    const int M = narrow<int>(a->Sizes[0]);
    const int K = narrow<int>(a->Sizes[1]);
    const int N = narrow<int>(b->Sizes[1]);
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, {M, N}, *a, "aten::mm");
    matmul(*out, *a, *b, M, N, K, false, 1.f, 0.f, ctx.Cublas, ctx.Stream);
    return {out};
}

std::vector<OpValue> addmm(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& bias = tensor_arg(args, 0, "aten::addmm");
    const TensorPtr& a = tensor_arg(args, 1, "aten::addmm");
    const TensorPtr& b = tensor_arg(args, 2, "aten::addmm");
    const double beta = number_arg(args, 3, 1.0, "aten::addmm");
    const double alpha = number_arg(args, 4, 1.0, "aten::addmm");
    require_rank(*a, 2, "aten::addmm", "mat1");
    require_rank(*b, 2, "aten::addmm", "mat2");
    if (a->Sizes[1] != b->Sizes[0]) {
        throw std::invalid_argument(fmt::format("aten::addmm: shapes {} and {} cannot be multiplied",
                                                shape_to_string(a->shape()), shape_to_string(b->shape())));
    }
    const int M = narrow<int>(a->Sizes[0]);
    const int K = narrow<int>(a->Sizes[1]);
    const int N = narrow<int>(b->Sizes[1]);
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, {M, N}, *a, "aten::addmm");
    if (beta != 0.0) {
        broadcast_fill(*out, *bias, ctx.Stream);
    }
    matmul(*out, *a, *b, M, N, K, false, static_cast<float>(alpha), static_cast<float>(beta), ctx.Cublas, ctx.Stream);
    return {out};
}

std::vector<OpValue> linear(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& input = tensor_arg(args, 0, "aten::linear");
    const TensorPtr& weight = tensor_arg(args, 1, "aten::linear");
    TensorPtr bias = optional_tensor_arg(args, 2, "aten::linear");
    require_rank(*weight, 2, "aten::linear", "weight");
    if (input->Rank < 1 || input->Sizes[input->Rank - 1] != weight->Sizes[1]) {
        throw std::invalid_argument(fmt::format("aten::linear: input {} does not match weight {}",
                                                shape_to_string(input->shape()), shape_to_string(weight->shape())));
    }
    const int K = narrow<int>(weight->Sizes[1]);
    const int N = narrow<int>(weight->Sizes[0]);
    const int M = narrow<int>(input->nelem() / K);

    std::vector<long> out_shape = input->shape();
    out_shape.back() = N;
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, out_shape, *input, "aten::linear");
    float beta = 0.f;
    if (bias) {
        broadcast_fill(*out, *bias, ctx.Stream);
        beta = 1.f;
    }
    matmul(*out, *input, *weight, M, N, K, true, 1.f, beta, ctx.Cublas, ctx.Stream);
    return {out};
}

std::vector<OpValue> t(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::t");
    if (self->Rank > 2) {
        throw std::invalid_argument(fmt::format("aten::t: expects a tensor with <= 2 dimensions, got {}", shape_to_string(self->shape())));
    }
    if (self->Rank < 2) {
        TensorPtr out = allocate_output(ctx, self->DType, self->shape(), *self, "aten::t");
        copy_tensor(*out, *self, ctx.Stream);
        return {out};
    }
    const int rows = narrow<int>(self->Sizes[0]);
    const int cols = narrow<int>(self->Sizes[1]);
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, {cols, rows}, *self, "aten::t");
    transpose(*out, *self, rows, cols, ctx.Cublas, ctx.Stream);
    return {out};
}

} // namespace

void register_matmul_ops(OperatorLibrary& lib) {
    lib.add("aten::mm", mm, 1);
    lib.add("aten::addmm", addmm, 1);
    lib.add("aten::linear", linear, 1);
    lib.add("aten::t", t, 1);
}

} // namespace replay
