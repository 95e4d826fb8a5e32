// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <string_view>

namespace replay {
namespace {

enum class ETarget { Unchanged, Host, Device };

ETarget find_target_device(const std::vector<OpValue>& args) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto* s = std::get_if<std::string>(&args[i].value);
        if (!s) continue;
        std::string_view dev = *s;
        if (dev.starts_with("cuda")) return ETarget::Device;
        if (dev.starts_with("cpu")) return ETarget::Host;
    }
    return ETarget::Unchanged;
}

// aten::to only changes placement; dtype conversions are not performed.
std::vector<OpValue> to(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::to");
    ETarget target = find_target_device(args);
    if (target == ETarget::Device && ctx.Device < 0) {
        target = ETarget::Host;
    }
    const bool to_host = target == ETarget::Host;
    if (target == ETarget::Unchanged || to_host == self->is_host()) {
        return {self};
    }
    TensorPtr out = ctx.Allocator.allocate(self->DType, "aten::to",
                                           to_host ? EAllocationType::ON_HOST : EAllocationType::ON_DEVICE, self->shape());
    copy_tensor(*out, *self, ctx.Stream);
    return {out};
}

std::vector<OpValue> pin_memory(OpContext& ctx, std::vector<OpValue>& args) {
    const TensorPtr& self = tensor_arg(args, 0, "aten::pin_memory");
    const EAllocationType kind = ctx.Device < 0 ? EAllocationType::ON_HOST : EAllocationType::PINNED;
    TensorPtr out = ctx.Allocator.allocate(self->DType, "aten::pin_memory", kind, self->shape());
    copy_tensor(*out, *self, ctx.Stream);
    return {out};
}

} // namespace


TensorPtr move_to_placement(OpContext& ctx, const TensorPtr& t, bool host) {
    if (!t || t->is_host() == host) {
        return t;
    }
    TensorPtr out = ctx.Allocator.allocate(t->DType, "move", host ? EAllocationType::ON_HOST : EAllocationType::ON_DEVICE, t->shape());
    copy_tensor(*out, *t, ctx.Stream);
    return out;
}

void register_data_movement_ops(OperatorLibrary& lib) {
    lib.add("aten::to", to, 1);
    lib.add("aten::_to_copy", to, 1);
    lib.add("aten::pin_memory", pin_memory, 1);
}

} // namespace replay
