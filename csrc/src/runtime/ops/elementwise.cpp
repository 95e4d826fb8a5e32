// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <stdexcept>

#include "kernels/kernels.h"

namespace replay {
namespace {

// Orders two tensor operands so that the second one broadcasts over the first.
std::pair<TensorPtr, TensorPtr> broadcast_order(const TensorPtr& a, const TensorPtr& b, bool commutative, const char* op) {
    if (b->nelem() <= a->nelem()) {
        return {a, b};
    }
    if (!commutative) {
        throw std::invalid_argument(std::string(op) + ": left operand smaller than right operand");
    }
    return {b, a};
}

std::vector<OpValue> add(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::add");
    const double alpha = number_arg(args, 2, 1.0, "aten::add");

    if (args.size() > 1 && args[1].is_number()) {
        const double other = number_arg(args, 1, 0.0, "aten::add");
        TensorPtr out = allocate_output(ctx, ETensorDType::FP32, self->shape(), *self, "aten::add");
        add_scalar(*out, *self, static_cast<float>(alpha * other), ctx.Stream);
        return {out};
    }

    const TensorPtr& other = tensor_arg(args, 1, "aten::add");
    auto [big, small] = broadcast_order(self, other, alpha == 1.0, "aten::add");
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, big->shape(), *big, "aten::add");
    add_broadcast(*out, *big, *small, static_cast<float>(alpha), ctx.Stream);
    return {out};
}

std::vector<OpValue> mul(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::mul");

    if (args.size() > 1 && args[1].is_number()) {
        const double other = number_arg(args, 1, 1.0, "aten::mul");
        TensorPtr out = allocate_output(ctx, ETensorDType::FP32, self->shape(), *self, "aten::mul");
        mul_scalar(*out, *self, static_cast<float>(other), ctx.Stream);
        return {out};
    }

    const TensorPtr& other = tensor_arg(args, 1, "aten::mul");
    auto [big, small] = broadcast_order(self, other, true, "aten::mul");
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, big->shape(), *big, "aten::mul");
    mul_broadcast(*out, *big, *small, ctx.Stream);
    return {out};
}

std::vector<OpValue> relu(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::relu");
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, self->shape(), *self, "aten::relu");
    relu_forward(*out, *self, ctx.Stream);
    return {out};
}

std::vector<OpValue> threshold_backward_op(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& grad = tensor_arg(args, 0, "aten::threshold_backward");
    const TensorPtr& self = tensor_arg(args, 1, "aten::threshold_backward");
    const double threshold = number_arg(args, 2, 0.0, "aten::threshold_backward");
    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, grad->shape(), *grad, "aten::threshold_backward");
    threshold_backward(*out, *grad, *self, static_cast<float>(threshold), ctx.Stream);
    return {out};
}

} // namespace

void register_elementwise_ops(OperatorLibrary& lib) {
    lib.add("aten::add", add, 1);
    lib.add("aten::mul", mul, 1);
    lib.add("aten::relu", relu, 1);
    lib.add("aten::threshold_backward", threshold_backward_op, 1);
}

} // namespace replay
