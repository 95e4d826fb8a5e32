// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_BENCHMARK_LOGGING_H
#define TRACE_REPLAY_SRC_BENCHMARK_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

class TensorAllocator;

namespace replay {
class ReplaySession;
struct LeakReport;
struct MemoryDelta;
}

class ReplayRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    ReplayRunLogger(const std::string& file_name, EVerbosity verbosity);
    ~ReplayRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_gpu_model(int device);
    void log_graph(const replay::ReplaySession& session);
    void log_leaks(const replay::LeakReport& leaks);
    void log_pass(int pass, bool warmup, double duration_ms);
    void log_summary(int iters, double total_ms);
    //! Reports the @p top_n largest allocated and reserved deltas.
    void log_memory(const std::unordered_map<std::int64_t, replay::MemoryDelta>& deltas, int top_n);
    //! Live, peak and cumulative bytes per allocation kind, and the bytes attributed to each allocator context.
    void log_allocations(const TensorAllocator& allocator);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(ReplayRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        ReplayRunLogger* mLogger;

        friend class ReplayRunLogger;
    };

    void log_message(const std::string& msg);
    void log_warning(const std::string& msg);
    RAII_Section log_section_start(const std::string& info);
    void log_section_end();

    EVerbosity verbosity() const { return mVerbosity; }
private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    EVerbosity mVerbosity;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    std::chrono::steady_clock::time_point mSectionStart;
};

//! Fixed-width human readable byte count ("  512  B", "   64.0 KiB", ...).
std::string format_bytes(long long bytes);

#endif //TRACE_REPLAY_SRC_BENCHMARK_LOGGING_H
