// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_BENCHMARK_BENCHMARK_DRIVER_H
#define TRACE_REPLAY_SRC_BENCHMARK_BENCHMARK_DRIVER_H

#include <vector>

#include "benchmark/replay_options.h"

class ReplayRunLogger;

namespace replay {

class ReplaySession;

struct BenchmarkResult {
    int Iters = 0;
    double TotalMs = 0.0;
    std::vector<double> PassMs;     ///< measured passes only

    [[nodiscard]] double mean_ms() const { return Iters > 0 ? TotalMs / Iters : 0.0; }
};

//! Number of per-node memory deltas reported with memory profiling.
constexpr int kMemoryReportSize = 100;

/**
 * @brief Timed warmup + measurement loop over full replay passes.
 *
 * Device replay is timed with CUDA events around each pass, host replay with
 * a steady clock. Each pass ends with a stream synchronization.
 */
class BenchmarkDriver {
public:
    BenchmarkDriver(ReplaySession& session, const ReplayOptions& options, ReplayRunLogger& logger);

    BenchmarkResult run();

private:
    double timed_pass();

    ReplaySession& mSession;
    const ReplayOptions& mOptions;
    ReplayRunLogger& mLogger;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_BENCHMARK_BENCHMARK_DRIVER_H
