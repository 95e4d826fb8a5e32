// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_BENCHMARK_REPLAY_OPTIONS_H
#define TRACE_REPLAY_SRC_BENCHMARK_REPLAY_OPTIONS_H

#include <string>
#include <vector>

// Replay/benchmark options used by the CLI.
struct ReplayOptions {
    std::string InputPath;
    int WarmupIters = 5;
    int Iters = 30;

    // Wrap the measured passes in a CUDA profiler capture range with per-op NVTX ranges.
    bool ProfileReplay = false;
    // Record per-node allocator deltas and report the largest ones.
    bool ProfileMemory = false;
    // Reference trace written during the first measured pass when profiling.
    std::string CaptureTracePath = "/tmp/replay_eg.json";

    int Device = 0;                 ///< CUDA ordinal, -1 replays on the host
    unsigned long long Seed = 42;

    std::vector<std::string> ExtraSkipNodes;
    bool SkipMissingOps = false;
    // Rebuild the working registry from the permanent one after every pass.
    bool ResetRegistry = false;

    std::string LogFile = "replay-log.json";

    [[nodiscard]] bool host_replay() const { return Device < 0; }
    [[nodiscard]] bool capture_trace() const { return ProfileReplay && !CaptureTracePath.empty(); }
};

#endif //TRACE_REPLAY_SRC_BENCHMARK_REPLAY_OPTIONS_H
