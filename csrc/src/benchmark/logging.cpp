// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <cuda_runtime.h>

#include "runtime/replay/replay_session.h"
#include "utilities/allocator.h"
#include "utilities/gpu_info.h"
#include "utilities/utils.h"

/**
 * @brief Create a logger that writes a JSON array to @p file_name.
 *
 * Ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log.
 * @param verbosity Verbosity level controlling stdout printing.
 */
ReplayRunLogger::ReplayRunLogger(const std::string& file_name, EVerbosity verbosity) :
    mFileName(file_name), mVerbosity(verbosity)
{
    auto log_path = std::filesystem::path(mFileName).parent_path();
    if (!log_path.empty()) {
        std::filesystem::create_directories(log_path);
    }
    mLogFile.open(mFileName, std::fstream::out);
    mLogFile << "[\n";
    mLogFile << "\n]\n";
}

ReplayRunLogger::~ReplayRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

std::string format_bytes(long long bytes) {
    const long long mag = bytes < 0 ? -bytes : bytes;
    if (mag < 10 * 1024) {
        return fmt::format("{:7d}  B", bytes);
    } else if (mag < 10 * 1024 * 1024) {
        return fmt::format("{:7.1f} KiB", static_cast<double>(bytes) / 1024.0);
    } else {
        return fmt::format("{:7.1f} MiB", static_cast<double>(bytes) / 1024.0 / 1024.0);
    }
}

/**
 * @brief Log the command line used to start the run.
 *
 * Writes a JSON line containing argv as an array of strings.
 */
void ReplayRunLogger::log_cmd(int argc, const char** argv)
{
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += fmt::format("\"{}\"", argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options.
 *
 * Each option is written as a JSON log line; with verbose output they are also printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void ReplayRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    if(mVerbosity >= 1) {
        printf("[Options]\n");
    }
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": "{}"}})",
                                     std::chrono::system_clock::now(), name, v));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if(mVerbosity >= 1) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
    if(mVerbosity >= 1) {
        printf("\n");
    }
}

/**
 * @brief Log the model and state of the replay device.
 *
 * For host replay (@p device < 0) only the CUDA versions are recorded.
 */
void ReplayRunLogger::log_gpu_model(int device)
{
    const int driver_version = SystemInfo::get_cuda_driver_version();
    const int runtime_version = SystemInfo::get_cuda_runtime_version();
    if (device < 0) {
        log_line(fmt::format(R"(  {{"log": "gpu-model", "time": "{}", "step": 0, "id": -1, "name": "host", "cuda_driver": {}, "cuda_runtime": {}}})",
                             std::chrono::system_clock::now(), driver_version, runtime_version));
        if(mVerbosity >= 0) {
            printf("[System]\n  Replaying on the host\n\n");
        }
        return;
    }

    cudaDeviceProp prop;
    std::size_t mem_free = 0;
    std::size_t mem_total = 0;
    CUDA_CHECK(cudaGetDeviceProperties(&prop, device));
    CUDA_CHECK(cudaMemGetInfo(&mem_free, &mem_total));
    const std::size_t mem_reserved = get_mem_reserved();

    log_line(fmt::format(
        R"(  {{"log": "gpu-model", "time": "{}", "step": 0, "id": {}, "name": "{}", "sm_count": {}, "major": {}, "minor": {}, "memory": {}, "free": {}, "reserved": {}, "cuda_driver": {}, "cuda_runtime": {}}})",
        std::chrono::system_clock::now(), device, prop.name, prop.multiProcessorCount, prop.major, prop.minor,
        prop.totalGlobalMem, mem_free, mem_reserved, driver_version, runtime_version));

    if(mVerbosity >= 0) {
        printf("[System]\n");
        printf("  Device %d: %s\n", device, prop.name);
        printf("  CUDA version: driver %d, runtime %d\n", driver_version, runtime_version);
        printf("  Memory: %zu MiB / %zu MiB\n", (mem_total - mem_free) / 1024 / 1024, mem_total / 1024 / 1024);
        printf("\n");
    }
}

/**
 * @brief Log the outcome of the analysis phases: node selection, slot assignment and instantiation.
 */
void ReplayRunLogger::log_graph(const replay::ReplaySession& session)
{
    const auto& sg = session.subgraph();
    const auto& b = session.bindings();
    const auto& reg = session.registry();
    const auto& inst = session.instantiation();
    const auto& builder = session.builder();

    log_line(fmt::format(
        R"(  {{"log": "graph", "time": "{}", "step": 0, "nodes": {}, "qualified": {}, "tracked_ids": {}, "multi_shape_ids": {}, "slots": {}, "instantiate": {}, "materialized": {}, "null_bound": {}, "unchangeable": {}, "host_resident": {}, "permanent_bytes": {}, "missing_ops": {}}})",
        std::chrono::system_clock::now(), session.graph().size(), sg.Nodes.size(), b.total_ids(), b.multi_shape_ids(),
        b.NumSlots, b.Instantiate.size(), inst.Materialized, inst.NullBound, reg.num_unchangeable(), reg.num_host_resident(),
        reg.permanent_bytes(), builder.missing_operators().size()));

    if(mVerbosity >= 0) {
        printf("[Graph]\n");
        printf("  nodes       : %zu (%zu replayed)\n", session.graph().size(), sg.Nodes.size());
        printf("  tensors     : %zu identifiers, %zu with more than one shape\n", b.total_ids(), b.multi_shape_ids());
        printf("  slots       : %d (%zu instantiated up front)\n", b.NumSlots, b.Instantiate.size());
        printf("  registry    : %zu buffers, %s\n", reg.permanent_size(),
               format_bytes(static_cast<long long>(reg.permanent_bytes())).c_str());
        if(!builder.missing_operators().empty()) {
            printf("  missing ops : %zu\n", builder.missing_operators().size());
            if(mVerbosity >= 1) {
                for(const auto& name : builder.missing_operators()) {
                    printf("    %s\n", name.c_str());
                }
            }
        }
        printf("\n");
    }
}

void ReplayRunLogger::log_leaks(const replay::LeakReport& leaks)
{
    log_line(fmt::format(R"(  {{"log": "leaks", "time": "{}", "step": 0, "tensors": {}, "bytes": {}}})",
                         std::chrono::system_clock::now(), leaks.Tensors.size(), leaks.Bytes));
    if(mVerbosity >= 0) {
        printf("Additional allocated %zu tensors with total size of %.3f MiB\n", leaks.Tensors.size(), leaks.mib());
    }
    if(mVerbosity >= 1) {
        for(const auto& t : leaks.Tensors) {
            printf("  %s produced by node %ld inside node %ld: %s\n", replay::to_string(t.Id).c_str(),
                   static_cast<long>(t.Producer), static_cast<long>(t.Ancestor),
                   format_bytes(static_cast<long long>(t.Bytes)).c_str());
        }
    }
}

void ReplayRunLogger::log_pass(int pass, bool warmup, double duration_ms)
{
    log_line(fmt::format(R"(  {{"log": "pass", "time": "{}", "step": {}, "warmup": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), pass, warmup, duration_ms));
    if(mVerbosity >= 1) {
        printf("[%s] pass %4d | %10.3f ms\n", warmup ? "W" : "T", pass, duration_ms);
    }
}

void ReplayRunLogger::log_summary(int iters, double total_ms)
{
    const double mean_ms = iters > 0 ? total_ms / iters : 0.0;
    log_line(fmt::format(R"(  {{"log": "summary", "time": "{}", "step": {}, "iterations": {}, "total_ms": {}, "mean_ms": {}}})",
                         std::chrono::system_clock::now(), iters, iters, total_ms, mean_ms));
    if(mVerbosity >= -1) {
        printf("Replay time: %.3f ms total, %.3f ms per pass over %d passes\n", total_ms, mean_ms, iters);
    }
}

void ReplayRunLogger::log_memory(const std::unordered_map<std::int64_t, replay::MemoryDelta>& deltas, int top_n)
{
    std::vector<replay::MemoryDelta> sorted;
    sorted.reserve(deltas.size());
    for(const auto& [id, d] : deltas) {
        sorted.push_back(d);
    }
    const std::size_t n = std::min(sorted.size(), static_cast<std::size_t>(std::max(top_n, 0)));

    auto report = [&](const char* kind, auto key) {
        std::partial_sort(sorted.begin(), sorted.begin() + n, sorted.end(),
                          [&](const replay::MemoryDelta& a, const replay::MemoryDelta& b) { return key(a) > key(b); });
        if(mVerbosity >= 0) {
            printf("%s memory (B):\n", kind);
        }
        for(std::size_t i = 0; i < n; ++i) {
            const auto& d = sorted[i];
            log_line(fmt::format(R"(  {{"log": "memory", "time": "{}", "step": 0, "kind": "{}", "node": {}, "name": "{}", "bytes": {}}})",
                                 std::chrono::system_clock::now(), kind, d.Node, d.Name, key(d)));
            if(mVerbosity >= 0) {
                printf("  %8ld %-40s %lld\n", static_cast<long>(d.Node), d.Name.c_str(), key(d));
            }
        }
    };
    report("allocated", [](const replay::MemoryDelta& d) { return d.Allocated; });
    report("reserved", [](const replay::MemoryDelta& d) { return d.Reserved; });
}

void ReplayRunLogger::log_allocations(const TensorAllocator& allocator)
{
    for(EAllocationType kind : {EAllocationType::ON_DEVICE, EAllocationType::PINNED, EAllocationType::ON_HOST}) {
        log_line(fmt::format(R"(  {{"log": "allocations", "time": "{}", "step": 0, "kind": "{}", "live": {}, "peak": {}, "total": {}}})",
                             std::chrono::system_clock::now(), allocation_type_to_str(kind), allocator.live_bytes(kind),
                             allocator.peak_bytes(kind), allocator.total_allocation(kind)));
    }
    const auto contexts = allocator.get_context_stats();
    for(const auto& [ctx, bytes] : contexts) {
        log_line(fmt::format(R"(  {{"log": "allocations", "time": "{}", "step": 0, "context": "{}", "total": {}}})",
                             std::chrono::system_clock::now(), ctx, bytes));
    }
    if(mVerbosity >= 1) {
        printf("%ld allocations, peak %s on device, %s on host\n", allocator.num_allocations(),
               format_bytes(static_cast<long long>(allocator.peak_bytes(EAllocationType::ON_DEVICE))).c_str(),
               format_bytes(static_cast<long long>(allocator.peak_bytes(EAllocationType::ON_HOST))).c_str());
        for(const auto& [ctx, bytes] : contexts) {
            printf("  %-32s %s\n", ctx.c_str(), format_bytes(static_cast<long long>(bytes)).c_str());
        }
    }
}

/**
 * @brief Append one JSON object line to the log file (and emit callback if set).
 *
 * The file is maintained as a valid JSON array by seeking near the end and
 * overwriting the array closing tokens. The caller should pass a complete JSON
 * object (no trailing comma).
 *
 * @param line JSON object line to append.
 */
void ReplayRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

void ReplayRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void ReplayRunLogger::log_message(const std::string& msg) {
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": 0, "message": "{}"}})",
                         std::chrono::system_clock::now(), msg ));
}

void ReplayRunLogger::log_warning(const std::string& msg) {
    if(mVerbosity >= -1) {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "step": 0, "message": "{}"}})",
                         std::chrono::system_clock::now(), msg ));
}

/**
 * @brief Begin a timed logging section.
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction.
 */
ReplayRunLogger::RAII_Section ReplayRunLogger::log_section_start(const std::string& info) {
    mSectionInfo = info;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void ReplayRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": 0, "message": "{}", "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionInfo, milliseconds ));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
