// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/tensor_registry.h"

#include <stdexcept>

#include <fmt/core.h>

namespace replay {

void TensorRegistry::bind_permanent(ReplaySlot slot, TensorPtr tensor) {
    mPermanent[slot] = std::move(tensor);
}

const TensorPtr& TensorRegistry::permanent(ReplaySlot slot) const {
    auto it = mPermanent.find(slot);
    if (it == mPermanent.end()) {
        throw std::out_of_range(fmt::format("slot {} is not in the permanent registry", slot));
    }
    return it->second;
}

std::size_t TensorRegistry::permanent_bytes() const {
    std::size_t total = 0;
    for (const auto& [slot, t] : mPermanent) {
        if (t) {
            total += t->bytes();
        }
    }
    return total;
}

void TensorRegistry::reset(OpContext& ctx) {
    mWorking.clear();
    auto monitor = ctx.Allocator.with_context("working_registry");
    for (const auto& [slot, t] : mPermanent) {
        if (!t || ctx.Device < 0 || is_host_resident(slot)) {
            mWorking[slot] = t;
            continue;
        }
        mWorking[slot] = move_to_placement(ctx, t, false);
    }
    if (ctx.Device >= 0) {
        CUDA_CHECK(cudaStreamSynchronize(ctx.Stream));
    }
}

TensorPtr TensorRegistry::get(ReplaySlot slot) const {
    auto it = mWorking.find(slot);
    if (it == mWorking.end()) {
        return nullptr;
    }
    return it->second;
}

void TensorRegistry::set(ReplaySlot slot, TensorPtr tensor) {
    mWorking[slot] = std::move(tensor);
}

} // namespace replay
