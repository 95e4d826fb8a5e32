// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "benchmark/benchmark_driver.h"
#include "benchmark/logging.h"
#include "benchmark/replay_options.h"
#include "runtime/replay/replay_session.h"
#include "trace/execution_graph.h"
#include "utilities/gpu_info.h"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

struct ReplayRunner {
    ReplayOptions Options;

    /// Verbosity flags; -v and -q are mutually exclusive.
    bool Verbose = false;
    bool Quiet = false;

    void load_replay_config(int argc, const char** argv);
    void launch_replay(int argc, const char** argv);

    ReplayRunLogger::EVerbosity verbosity() const {
        if (Quiet) return ReplayRunLogger::QUIET;
        if (Verbose) return ReplayRunLogger::VERBOSE;
        return ReplayRunLogger::DEFAULT;
    }
};

void ReplayRunner::load_replay_config(int argc, const char** argv) {
    CLI::App app{"Replays a recorded execution trace and times its operators"};

    app.add_option("--input", Options.InputPath, "Execution trace (JSON) to replay")->required()->check(CLI::ExistingFile);
    app.add_option("-w,--warmup", Options.WarmupIters, "Number of warmup passes")->check(CLI::NonNegativeNumber);
    app.add_option("--iter", Options.Iters, "Number of measured passes")->check(CLI::NonNegativeNumber);
    app.add_flag("-p,--profile-replay", Options.ProfileReplay, "Annotate passes and operators with NVTX ranges, open a CUDA profiler capture range and capture a reference trace");
    app.add_flag("-m,--profile-memory", Options.ProfileMemory, "Record allocated and reserved memory deltas per operator");
    app.add_option("--capture-trace", Options.CaptureTracePath, "Where to write the reference trace captured with --profile-replay");
    app.add_option("--device", Options.Device, "CUDA device to replay on; -1 replays on the host")->check(CLI::Range(-1, 1024));
    app.add_option("--seed", Options.Seed, "Seed for the synthetic tensor contents");
    app.add_option("--skip-node", Options.ExtraSkipNodes, "Additional node name (substring) to skip, may be repeated");
    app.add_flag("--skip-missing-ops", Options.SkipMissingOps, "Skip operators without an implementation instead of failing");
    app.add_flag("--reset-registry", Options.ResetRegistry, "Rebuild the working tensors from the synthetic inputs after every pass");
    app.add_option("--log-file", Options.LogFile, "JSON log file");
    auto verbose = app.add_flag("-v,--verbose", Verbose, "Print per-pass timings and details");
    app.add_flag("-q,--quiet", Quiet, "Only print the final timing")->excludes(verbose);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!Options.host_replay()) {
        const auto gpus = SystemInfo::get_gpu_info();
        if (Options.Device >= static_cast<int>(gpus.size())) {
            throw std::runtime_error(fmt::format("CUDA device {} requested but {} device(s) are available; use --device -1 for host replay",
                                                 Options.Device, gpus.size()));
        }
    }
}

void ReplayRunner::launch_replay(int argc, const char** argv) {
    ReplayRunLogger logger(Options.LogFile, verbosity());
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"input", Options.InputPath},
        {"warmup", static_cast<std::int64_t>(Options.WarmupIters)},
        {"iter", static_cast<std::int64_t>(Options.Iters)},
        {"profile_replay", Options.ProfileReplay},
        {"profile_memory", Options.ProfileMemory},
        {"capture_trace", Options.CaptureTracePath},
        {"device", static_cast<std::int64_t>(Options.Device)},
        {"seed", static_cast<std::int64_t>(Options.Seed)},
        {"skip_missing_ops", Options.SkipMissingOps},
        {"reset_registry", Options.ResetRegistry},
    });
    logger.log_gpu_model(Options.Device);

    replay::ExecutionGraph graph = [&]() {
        auto section = logger.log_section_start(fmt::format("Loading trace {}", Options.InputPath));
        return replay::ExecutionGraph::load(Options.InputPath);
    }();

    std::unique_ptr<replay::ReplaySession> session;
    {
        auto section = logger.log_section_start("Preparing replay");
        session = std::make_unique<replay::ReplaySession>(graph, Options);
    }
    logger.log_graph(*session);
    logger.log_leaks(session->leaks());
    for (const auto& warning : session->instantiation().Warnings) {
        logger.log_warning(warning);
    }

    replay::BenchmarkDriver driver(*session, Options, logger);
    driver.run();
}

int main(int argc, const char** argv) {
    try {
        ReplayRunner runner;
        runner.load_replay_config(argc, argv);
        runner.launch_replay(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
