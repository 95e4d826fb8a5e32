// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/replay_session.h"

#include <cstdio>

#include <cublas_v2.h>

#include "utilities/utils.h"

namespace replay {
namespace {

std::vector<std::string> skip_list(const ReplayOptions& options) {
    std::vector<std::string> names = default_skip_node_names();
    names.insert(names.end(), options.ExtraSkipNodes.begin(), options.ExtraSkipNodes.end());
    return names;
}

} // namespace

ReplaySession::ReplaySession(const ExecutionGraph& graph, const ReplayOptions& options) :
    mGraph(graph),
    mSkipNames(skip_list(options)),
    mCtx{mAllocator, options.Device, nullptr, nullptr},
    mLibrary(OperatorLibrary::with_builtins()),
    mPatches(ArgPatchTable::with_defaults()) {
    if (!options.host_replay()) {
        CUDA_CHECK(cudaSetDevice(options.Device));
        mDevice.Stream = create_named_stream("replay");
        CUBLAS_CHECK(cublasCreate(&mDevice.Cublas));
        CUBLAS_CHECK(cublasSetStream(mDevice.Cublas, mDevice.Stream));
        mCtx.Stream = mDevice.Stream;
        mCtx.Cublas = mDevice.Cublas;
    }

    mBuilder = std::make_unique<OperatorBuilder>(mLibrary, mCtx, options.Seed, options.SkipMissingOps);
    mSubgraph = extract_subgraph(mGraph, mSkipNames, mBuilder.get());
    mLeaks = analyze_dependencies(mGraph, mSubgraph, mSkipNames);
    mBindings = resolve_tensor_identities(mSubgraph);

    TensorGenerator generator(options.Seed);
    mInstantiation = instantiate_tensors(mSubgraph, mBindings, mRegistry, generator, mAllocator);
    reset_registry();

    mEngine = std::make_unique<ReplayEngine>(mSubgraph, mBindings, *mBuilder, mPatches, mRegistry, mCtx);
}

ReplaySession::~ReplaySession() noexcept {
    // buffers held by the engine and the builder have to go before the stream
    mEngine.reset();
    mBuilder.reset();
}

ReplaySession::DeviceHandles::~DeviceHandles() noexcept {
    if (Cublas) {
        if (cublasDestroy(Cublas) != CUBLAS_STATUS_SUCCESS) {
            fprintf(stderr, "WARNING: failed to destroy cuBLAS handle\n");
        }
    }
    if (Stream) {
        if (cudaError_t err = cudaStreamDestroy(Stream); err != cudaSuccess) {
            fprintf(stderr, "WARNING: failed to destroy stream: %s\n", cudaGetErrorString(err));
        }
    }
}

void ReplaySession::reset_registry() {
    mRegistry.reset(mCtx);
}

} // namespace replay
