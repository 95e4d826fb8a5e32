// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/arg_patches.h"

#include <memory>

namespace replay {
namespace {

// A recorded mask may refer to gradients that are undefined in replay.
void force_full_output_mask(OpContext&, std::vector<OpValue>& args) {
    if (args.empty()) {
        return;
    }
    auto mask = std::make_shared<OpList>(OpList{true, true, true});
    args.back() = OpValue{std::move(mask)};
}

void align_operand_placement(OpContext& ctx, std::vector<OpValue>& args) {
    if (args.size() < 2) {
        return;
    }
    const auto* a = std::get_if<TensorPtr>(&args[0].value);
    auto* b = std::get_if<TensorPtr>(&args[1].value);
    if (!a || !b || !*a || !*b) {
        return;
    }
    if ((*a)->is_host() != (*b)->is_host()) {
        *b = move_to_placement(ctx, *b, (*a)->is_host());
    }
}

} // namespace

void ArgPatchTable::add(const std::string& op_name, ArgPatch patch) {
    mPatches[op_name] = std::move(patch);
}

void ArgPatchTable::apply(const std::string& op_name, OpContext& ctx, std::vector<OpValue>& args) const {
    if (auto it = mPatches.find(op_name); it != mPatches.end()) {
        it->second(ctx, args);
    }
}

ArgPatchTable ArgPatchTable::with_defaults() {
    ArgPatchTable table;
    table.add("aten::convolution_backward", force_full_output_mask);
    table.add("aten::mul", align_operand_placement);
    return table;
}

} // namespace replay
