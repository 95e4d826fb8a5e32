// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Owns everything needed to replay one trace: the device context, the operator
// bindings, the slot assignment, the registries and the engine.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_SESSION_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_SESSION_H

#include <memory>
#include <string>
#include <vector>

#include "benchmark/replay_options.h"
#include "runtime/replay/dependency_analyzer.h"
#include "runtime/replay/replay_engine.h"
#include "runtime/replay/tensor_instantiator.h"

namespace replay {

class ReplaySession {
public:
    /**
     * @brief Runs every analysis phase for @p graph and fills the registries.
     *
     * The graph must outlive the session. For device replay, the stream and the
     * cuBLAS handle are created on options.Device.
     *
     * @throws TraceError if the graph cannot be replayed.
     */
    ReplaySession(const ExecutionGraph& graph, const ReplayOptions& options);
    ~ReplaySession() noexcept;

    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    //! Rebuilds the working registry from the permanent one.
    void reset_registry();

    ReplayEngine& engine() { return *mEngine; }
    OpContext& context() { return mCtx; }
    TensorAllocator& allocator() { return mAllocator; }

    const ExecutionGraph& graph() const { return mGraph; }
    const ReplaySubgraph& subgraph() const { return mSubgraph; }
    const LeakReport& leaks() const { return mLeaks; }
    const TensorBindings& bindings() const { return mBindings; }
    const TensorRegistry& registry() const { return mRegistry; }
    const InstantiationStats& instantiation() const { return mInstantiation; }
    const OperatorBuilder& builder() const { return *mBuilder; }
    const std::vector<std::string>& skip_names() const { return mSkipNames; }

private:
    const ExecutionGraph& mGraph;
    std::vector<std::string> mSkipNames;

    //! Stream and cuBLAS handle of a device replay, released after every member declared below.
    struct DeviceHandles {
        cudaStream_t Stream = nullptr;
        cublasHandle_t Cublas = nullptr;

        DeviceHandles() = default;
        DeviceHandles(const DeviceHandles&) = delete;
        DeviceHandles& operator=(const DeviceHandles&) = delete;
        ~DeviceHandles() noexcept;
    };

    TensorAllocator mAllocator;
    DeviceHandles mDevice;
    OpContext mCtx;

    OperatorLibrary mLibrary;
    ArgPatchTable mPatches;
    std::unique_ptr<OperatorBuilder> mBuilder;

    ReplaySubgraph mSubgraph;
    LeakReport mLeaks;
    TensorBindings mBindings;
    TensorRegistry mRegistry;
    InstantiationStats mInstantiation;
    std::unique_ptr<ReplayEngine> mEngine;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_REPLAY_SESSION_H
