// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "benchmark/benchmark_driver.h"
#include "benchmark/logging.h"
#include "benchmark/replay_options.h"
#include "runtime/replay/replay_session.h"
#include "testing/utilities/test_config.h"
#include "testing/utilities/test_utils.h"
#include "utilities/utils.h"

using namespace replay;
using testing_utils::TraceBuilder;
using testing_utils::tensor;
using testing_utils::scalar;

namespace {

ExecutionGraph small_model() {
    TraceBuilder b;
    b.label(2, 1, "## forward ##")
     .op(3, 2, "aten::linear", {tensor(10, {8, 16}), tensor(11, {4, 16}), tensor(12, {4})}, {tensor(13, {8, 4})})
     .op(4, 3, "aten::t", {tensor(11, {4, 16})}, {tensor(14, {16, 4})})
     .op(5, 3, "aten::addmm", {tensor(12, {4}), tensor(10, {8, 16}), tensor(14, {16, 4})}, {tensor(13, {8, 4})})
     .op(6, 2, "aten::relu", {tensor(13, {8, 4})}, {tensor(15, {8, 4})})
     .op(7, 2, "aten::sum", {tensor(15, {8, 4})}, {tensor(16, {})})
     .label(8, 1, "## backward ##")
     .op(9, 8, "aten::threshold_backward", {tensor(17, {8, 4}), tensor(15, {8, 4}), scalar(0, "Int")}, {tensor(18, {8, 4})})
     .op(10, 8, "aten::mm", {tensor(18, {8, 4}), tensor(11, {4, 16})}, {tensor(19, {8, 16})})
     .op(11, 8, "aten::sum", {tensor(19, {8, 16})}, {tensor(20, {})});
    return b.graph();
}

nlohmann::json read_json(const std::filesystem::path& path) {
    std::ifstream f(path);
    REQUIRE(f.is_open());
    return nlohmann::json::parse(f);
}

std::vector<nlohmann::json> entries_of(const nlohmann::json& log, const std::string& kind) {
    std::vector<nlohmann::json> out;
    for (const auto& e : log) {
        if (e["log"] == kind) out.push_back(e);
    }
    return out;
}

} // namespace

TEST_CASE("BenchmarkDriver: warmup and measured passes on the host", "[benchmark]") {
    const auto dir = std::filesystem::temp_directory_path() / "trace_replay_test_benchmark";
    std::filesystem::remove_all(dir);

    auto graph = small_model();
    ReplayOptions options;
    options.Device = -1;
    options.WarmupIters = 2;
    options.Iters = testing_config::get_test_config().Iters;
    options.ProfileMemory = true;
    options.LogFile = (dir / "replay-log.json").string();

    BenchmarkResult result;
    {
        ReplayRunLogger logger(options.LogFile, ReplayRunLogger::SILENT);
        ReplaySession session(graph, options);
        logger.log_graph(session);
        logger.log_leaks(session.leaks());

        BenchmarkDriver driver(session, options, logger);
        result = driver.run();
    }

    REQUIRE(result.Iters == options.Iters);
    REQUIRE(result.PassMs.size() == static_cast<std::size_t>(options.Iters));
    for (double ms : result.PassMs) {
        REQUIRE(ms >= 0.0);
    }
    REQUIRE(result.mean_ms() >= 0.0);

    auto log = read_json(options.LogFile);
    REQUIRE(log.is_array());
    auto passes = entries_of(log, "pass");
    REQUIRE(passes.size() == static_cast<std::size_t>(options.WarmupIters + options.Iters));
    REQUIRE(passes[0]["warmup"] == true);
    REQUIRE(passes.back()["warmup"] == false);
    REQUIRE(entries_of(log, "summary").size() == 1);
    REQUIRE(entries_of(log, "summary")[0]["iterations"] == options.Iters);
    REQUIRE_FALSE(entries_of(log, "memory").empty());

    bool host_peak = false;
    bool registry_context = false;
    for (const auto& entry : entries_of(log, "allocations")) {
        if (entry.contains("kind") && entry["kind"] == "host") {
            host_peak = entry["peak"].get<long long>() > 0;
        }
        if (entry.contains("context") && entry["context"] == "permanent_registry") {
            registry_context = entry["total"].get<long long>() > 0;
        }
    }
    REQUIRE(host_peak);
    REQUIRE(registry_context);

    auto graph_entry = entries_of(log, "graph");
    REQUIRE(graph_entry.size() == 1);
    REQUIRE(graph_entry[0]["qualified"] == 6);
    REQUIRE(graph_entry[0]["missing_ops"] == 0);
}

TEST_CASE("BenchmarkDriver: profiling captures a reference trace of one pass", "[benchmark]") {
    const auto dir = std::filesystem::temp_directory_path() / "trace_replay_test_capture";
    std::filesystem::remove_all(dir);

    auto graph = small_model();
    ReplayOptions options;
    options.Device = -1;
    options.WarmupIters = 1;
    options.Iters = 2;
    options.ProfileReplay = true;
    options.ResetRegistry = true;
    options.CaptureTracePath = (dir / "capture" / "replay_eg.json").string();
    options.LogFile = (dir / "replay-log.json").string();
    REQUIRE(options.capture_trace());

    {
        ReplayRunLogger logger(options.LogFile, ReplayRunLogger::SILENT);
        ReplaySession session(graph, options);
        BenchmarkDriver driver(session, options, logger);
        auto result = driver.run();
        REQUIRE(result.Iters == 2);
    }

    REQUIRE(std::filesystem::exists(options.CaptureTracePath));
    auto captured = ExecutionGraph::load(options.CaptureTracePath);
    // every qualified node of exactly one pass, plus the root
    REQUIRE(captured.size() == 7);
    REQUIRE(captured.node(2).Name == "aten::linear");

    auto log = read_json(options.LogFile);
    auto infos = entries_of(log, "info");
    REQUIRE(infos.size() == 1);
    REQUIRE(infos[0]["message"].get<std::string>().find("Captured 6 operators") != std::string::npos);
}

TEST_CASE("BenchmarkDriver: a failing pass propagates its error", "[benchmark]") {
    TraceBuilder b;
    b.op(2, 1, "aten::relu", {tensor(10, {4})}, {tensor(11, {4})})
     .op(3, 1, "my_ext::mystery_op", {tensor(11, {4})}, {tensor(12, {4})}, "my_ext::mystery_op(Tensor self) -> Tensor");
    auto graph = b.graph();
    const auto log_file = (std::filesystem::temp_directory_path() / "trace_replay_test_failing_pass.json").string();

    auto run_failing = [&graph, &log_file](int device) {
        ReplayOptions options;
        options.Device = device;
        options.WarmupIters = 0;
        options.Iters = 2;
        ReplayRunLogger logger(log_file, ReplayRunLogger::SILENT);
        ReplaySession session(graph, options);
        BenchmarkDriver driver(session, options, logger);
        try {
            driver.run();
            FAIL("expected a ReplayError");
        } catch (const ReplayError& e) {
            REQUIRE(std::string(e.what()).find("node 3 (my_ext::mystery_op)") != std::string::npos);
        }
    };

    SECTION("host") {
        run_failing(-1);
    }

    SECTION("device") {
        if (!cuda_device_available()) {
            SKIP("no CUDA device available");
        }
        const int device = testing_config::get_test_config().Device;
        for (int i = 0; i < 64; ++i) {
            run_failing(device);
        }

        // the device keeps working after the failed timed passes
        auto good = small_model();
        ReplayOptions options;
        options.Device = device;
        options.WarmupIters = 0;
        options.Iters = 1;
        ReplayRunLogger logger(log_file, ReplayRunLogger::SILENT);
        ReplaySession session(good, options);
        BenchmarkDriver driver(session, options, logger);
        REQUIRE(driver.run().Iters == 1);
    }
}

TEST_CASE("ReplayRunLogger: every line keeps the file a valid JSON array", "[benchmark]") {
    const auto path = std::filesystem::temp_directory_path() / "trace_replay_test_logger.json";
    std::vector<std::string> lines;
    {
        ReplayRunLogger logger(path.string(), ReplayRunLogger::SILENT);
        logger.set_callback([&lines](std::string_view line) { lines.emplace_back(line); });
        REQUIRE(read_json(path).empty());

        const char* argv[] = {"trace-replay", "--input", "trace.json"};
        logger.log_cmd(3, argv);
        REQUIRE(read_json(path).size() == 1);

        {
            auto section = logger.log_section_start("Loading trace");
        }
        logger.log_warning("something odd");
        logger.log_pass(0, true, 1.5);
        logger.log_summary(0, 0.0);
    }

    auto log = read_json(path);
    REQUIRE(log.size() == lines.size());
    REQUIRE(log[0]["cmd"].size() == 3);
    REQUIRE(log[0]["cmd"][1] == "--input");
    REQUIRE(entries_of(log, "warning")[0]["message"] == "something odd");
    REQUIRE(entries_of(log, "summary")[0]["mean_ms"] == 0.0);
}

TEST_CASE("format_bytes picks a readable unit", "[benchmark]") {
    REQUIRE(format_bytes(512).find(" B") != std::string::npos);
    REQUIRE(format_bytes(64 * 1024).find("KiB") != std::string::npos);
    REQUIRE(format_bytes(-64ll * 1024 * 1024).find("MiB") != std::string::npos);
}
