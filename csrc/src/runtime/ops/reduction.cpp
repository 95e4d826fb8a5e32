// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"

namespace replay {
namespace {

/**
 * aten::sum(self, dtype=None) and aten::sum.dim_IntList(self, dim, keepdim=False, dtype=None).
 *
 * The reduced dims must form one contiguous range, so that the input can be viewed as
 * [outer, reduce, inner].
 */
std::vector<OpValue> sum(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::sum");
    const int rank = self->Rank;

    std::vector<std::int64_t> dims;
    bool keepdim = false;
    const bool dim_form = args.size() >= 3 || (args.size() == 2 && std::holds_alternative<OpValue::ListPtr>(args[1].value));
    if (dim_form) {
        dims = int_list_arg(args, 1, "aten::sum");
        keepdim = bool_arg(args, 2, false, "aten::sum");
    }
    if (dims.empty()) {
        for (int d = 0; d < rank; ++d) dims.push_back(d);
    }
    for (auto& d : dims) {
        if (d < -rank || d >= std::max(rank, 1)) {
            throw std::invalid_argument(fmt::format("aten::sum: dim {} out of range for shape {}", d, shape_to_string(self->shape())));
        }
        if (d < 0) d += rank;
    }
    std::sort(dims.begin(), dims.end());
    dims.erase(std::unique(dims.begin(), dims.end()), dims.end());

    std::vector<long> out_shape;
    long outer = 1, reduce = 1, inner = 1;
    if (rank > 0) {
        if (dims.back() - dims.front() + 1 != static_cast<std::int64_t>(dims.size())) {
            throw std::invalid_argument("aten::sum: reduction over non-contiguous dims is not supported");
        }
        for (int d = 0; d < rank; ++d) {
            const long size = self->Sizes[d];
            if (d < dims.front()) {
                outer *= size;
            } else if (d > dims.back()) {
                inner *= size;
            } else {
                reduce *= size;
                if (keepdim) out_shape.push_back(1);
                continue;
            }
            out_shape.push_back(size);
        }
    }

    TensorPtr out = allocate_output(ctx, ETensorDType::FP32, out_shape, *self, "aten::sum");
    sum_reduce(*out, *self, outer, reduce, inner, ctx.Stream);
    return {out};
}

} // namespace

void register_reduction_ops(OperatorLibrary& lib) {
    lib.add("aten::sum", sum, 1);
}

} // namespace replay
