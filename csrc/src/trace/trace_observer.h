// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Capture of executed replay operators into a trace file that the loader can
// read back (diagnostics only).

#ifndef TRACE_REPLAY_SRC_TRACE_TRACE_OBSERVER_H
#define TRACE_REPLAY_SRC_TRACE_TRACE_OBSERVER_H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "runtime/ops/op_library.h"
#include "trace/execution_graph.h"

namespace replay {

/**
 * @brief Records operator invocations while active.
 *
 * Every recorded invocation becomes an operator node below a single root.
 * Tensors are identified by their data pointer, so a buffer that is reused
 * keeps its identifier across nodes.
 */
class TraceObserver {
public:
    TraceObserver();

    void start() { mActive = true; }
    void stop() { mActive = false; }
    [[nodiscard]] bool active() const { return mActive; }

    void record(const TraceNode& node, const std::vector<OpValue>& inputs, const std::vector<TensorPtr>& outputs);

    [[nodiscard]] std::size_t num_recorded() const { return mNodes.size() - 1; }
    [[nodiscard]] nlohmann::json to_json() const;
    //! @throws std::runtime_error if the file cannot be written.
    void write(const std::string& path) const;

private:
    struct Encoded {
        nlohmann::json Value;
        nlohmann::json Shape;
        std::string Type;
    };

    Encoded encode(const OpValue& v);
    Encoded encode_tensor(const TensorPtr& t);
    std::int64_t tensor_id(const Tensor& t);

    bool mActive = false;
    std::vector<nlohmann::json> mNodes;
    std::unordered_map<const std::byte*, std::int64_t> mTensorIds;
    std::int64_t mNextNodeId = 2;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_TRACE_TRACE_OBSERVER_H
