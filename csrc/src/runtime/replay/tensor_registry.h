// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tensor Registry - slot-indexed buffers used during replay.
//
// The permanent registry holds one canonical, host-resident buffer per
// instantiated slot and is built once. The working registry holds the live
// values read and replaced by the replay engine; it is rebuilt from the
// permanent one by reset(), which places copies on the replay device.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_REGISTRY_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_REGISTRY_H

#include <cstddef>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include "runtime/ops/op_library.h"
#include "runtime/replay/replay_types.h"

namespace replay {

class TensorRegistry {
public:
    TensorRegistry() = default;

    // permanent registry

    [[nodiscard]] bool has_permanent(ReplaySlot slot) const { return mPermanent.contains(slot); }
    //! Binds @p slot to @p tensor; a null handle records a slot that could not be materialized.
    void bind_permanent(ReplaySlot slot, TensorPtr tensor);
    //! @throws std::out_of_range if @p slot was never bound.
    const TensorPtr& permanent(ReplaySlot slot) const;
    [[nodiscard]] std::size_t permanent_size() const { return mPermanent.size(); }
    //! Bytes held by the non-null permanent buffers.
    [[nodiscard]] std::size_t permanent_bytes() const;

    //! Unchangeable slots are never overwritten by operator results.
    void mark_unchangeable(ReplaySlot slot) { mUnchangeable.insert(slot); }
    [[nodiscard]] bool is_unchangeable(ReplaySlot slot) const { return mUnchangeable.contains(slot); }
    [[nodiscard]] std::size_t num_unchangeable() const { return mUnchangeable.size(); }

    //! Host-resident slots stay in host memory when the working registry is rebuilt.
    void mark_host_resident(ReplaySlot slot) { mHostResident.insert(slot); }
    [[nodiscard]] bool is_host_resident(ReplaySlot slot) const { return mHostResident.contains(slot); }
    [[nodiscard]] std::size_t num_host_resident() const { return mHostResident.size(); }

    // working registry

    /**
     * @brief Discards the working registry and rebuilds it from the permanent one.
     *
     * For device replay (ctx.Device >= 0) every buffer except the host-resident
     * ones is copied to the device. Host buffers are shared, not copied.
     */
    void reset(OpContext& ctx);

    //! Current value of @p slot, nullptr if unbound or bound to null.
    [[nodiscard]] TensorPtr get(ReplaySlot slot) const;
    void set(ReplaySlot slot, TensorPtr tensor);
    [[nodiscard]] bool contains(ReplaySlot slot) const { return mWorking.contains(slot); }
    [[nodiscard]] std::size_t size() const { return mWorking.size(); }

private:
    std::map<ReplaySlot, TensorPtr> mPermanent;
    std::unordered_map<ReplaySlot, TensorPtr> mWorking;
    std::unordered_set<ReplaySlot> mUnchangeable;
    std::unordered_set<ReplaySlot> mHostResident;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_REGISTRY_H
