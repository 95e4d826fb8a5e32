// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_TYPES_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_TYPES_H

#include <cstdint>
#include <stdexcept>

#include "trace/execution_graph.h"

namespace replay {

/// Raised when a node cannot be executed during replay. The message always
/// names the offending node.
class ReplayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! Handle of one concrete replay buffer. Slots are minted from 1 upwards.
using ReplaySlot = int;

//! A tensor identifier as seen by a particular node.
struct NodeTensorKey {
    std::int64_t Node = 0;
    TensorId Tensor;

    bool operator==(const NodeTensorKey&) const = default;
};

struct NodeTensorKeyHash {
    std::size_t operator()(const NodeTensorKey& key) const noexcept {
        std::size_t h = TensorIdHash{}(key.Tensor);
        return h ^ (std::hash<std::int64_t>{}(key.Node) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
    }
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_TYPES_H
