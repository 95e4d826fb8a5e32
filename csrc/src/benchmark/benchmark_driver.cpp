// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "benchmark/benchmark_driver.h"

#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>

#include <cuda_profiler_api.h>
#include <cuda_runtime.h>
#include <fmt/core.h>

#include "benchmark/logging.h"
#include "runtime/replay/replay_session.h"
#include "trace/trace_observer.h"
#include "utilities/utils.h"

namespace replay {
namespace {

//! Timing event destroyed on scope exit.
struct ScopedEvent {
    explicit ScopedEvent(const char* name) : Event(create_named_event(name, true)) {}
    ScopedEvent(const ScopedEvent&) = delete;
    ScopedEvent& operator=(const ScopedEvent&) = delete;
    ~ScopedEvent() noexcept {
        if (cudaError_t err = cudaEventDestroy(Event); err != cudaSuccess) {
            fprintf(stderr, "WARNING: failed to destroy event: %s\n", cudaGetErrorString(err));
        }
    }

    cudaEvent_t Event;
};

} // namespace

BenchmarkDriver::BenchmarkDriver(ReplaySession& session, const ReplayOptions& options, ReplayRunLogger& logger) :
    mSession(session), mOptions(options), mLogger(logger) {
}

double BenchmarkDriver::timed_pass() {
    ReplayEngine& engine = mSession.engine();
    OpContext& ctx = mSession.context();

    if (ctx.Device < 0) {
        auto start = std::chrono::steady_clock::now();
        engine.run_pass();
        auto duration = std::chrono::steady_clock::now() - start;
        return std::chrono::duration<double, std::milli>(duration).count();
    }

    ScopedEvent start("pass_start");
    ScopedEvent stop("pass_stop");
    CUDA_CHECK(cudaEventRecord(start.Event, ctx.Stream));
    engine.run_pass();
    CUDA_CHECK(cudaEventRecord(stop.Event, ctx.Stream));
    CUDA_CHECK(cudaStreamSynchronize(ctx.Stream));
    float ms = 0.f;
    CUDA_CHECK(cudaEventElapsedTime(&ms, start.Event, stop.Event));
    return ms;
}

BenchmarkResult BenchmarkDriver::run() {
    ReplayEngine& engine = mSession.engine();
    const bool on_device = mSession.context().Device >= 0;

    engine.set_profile_memory(mOptions.ProfileMemory);
    engine.set_annotate(mOptions.ProfileReplay);

    std::unique_ptr<TraceObserver> observer;
    if (mOptions.capture_trace()) {
        observer = std::make_unique<TraceObserver>();
        engine.set_observer([obs = observer.get()](const TraceNode& node, const std::vector<OpValue>& inputs,
                                                   const std::vector<TensorPtr>& outputs) {
            obs->record(node, inputs, outputs);
        });
    }

    BenchmarkResult result;
    const int total = mOptions.WarmupIters + mOptions.Iters;
    for (int iter = 0; iter < total; ++iter) {
        const bool warmup = iter < mOptions.WarmupIters;
        const bool first_measured = iter == mOptions.WarmupIters;

        if (first_measured) {
            if (mOptions.ProfileReplay && on_device) {
                CUDA_CHECK(cudaProfilerStart());
            }
            if (observer) {
                observer->start();
            }
        }

        double ms = 0.0;
        {
            std::optional<NvtxRange> range;
            if (mOptions.ProfileReplay) {
                range.emplace("replay_pass", iter);
            }
            ms = timed_pass();
        }

        if (first_measured && observer) {
            observer->stop();
            engine.set_observer(nullptr);
            observer->write(mOptions.CaptureTracePath);
            mLogger.log_message(fmt::format("Captured {} operators into {}", observer->num_recorded(), mOptions.CaptureTracePath));
        }

        mLogger.log_pass(iter, warmup, ms);
        if (!warmup) {
            result.TotalMs += ms;
            result.PassMs.push_back(ms);
            ++result.Iters;
        }

        if (mOptions.ResetRegistry) {
            mSession.reset_registry();
        }
    }

    if (mOptions.ProfileReplay && on_device && mOptions.Iters > 0) {
        CUDA_CHECK(cudaProfilerStop());
    }
    if (mOptions.ProfileMemory) {
        mLogger.log_memory(engine.memory_deltas(), kMemoryReportSize);
        mLogger.log_allocations(mSession.allocator());
    }
    mLogger.log_summary(result.Iters, result.TotalMs);
    return result;
}

} // namespace replay
