// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_UTILITIES_ALLOCATOR_H
#define TRACE_REPLAY_SRC_UTILITIES_ALLOCATOR_H

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "tensor.h"

enum class EAllocationType : int {
    ON_DEVICE,  // cudaMalloc
    PINNED,     // cudaHostAlloc(Mapped)
    ON_HOST     // new[]
};

const char* allocation_type_to_str(EAllocationType kind);

/**
 * @brief Allocates tensors as shared owning handles and keeps byte statistics.
 *
 * Every handle returned by allocate() frees its memory when the last copy is
 * dropped. Statistics are shared with the handles, so they stay valid (and
 * keep being updated) even if handles outlive the allocator.
 */
class TensorAllocator {
public:
    TensorAllocator();
    ~TensorAllocator() noexcept;
    TensorAllocator(TensorAllocator&&) noexcept ;
    TensorAllocator(const TensorAllocator&) = delete;
    TensorAllocator& operator=(TensorAllocator&&) noexcept ;
    TensorAllocator& operator=(const TensorAllocator&) = delete;

    void print_stats() const;

    TensorPtr allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::vector<long>& shape);
    TensorPtr allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::initializer_list<long>& shape);

    //! Bytes currently held by live handles of the given kind.
    std::size_t live_bytes(EAllocationType kind) const;
    //! Largest value live_bytes(kind) has reached.
    std::size_t peak_bytes(EAllocationType kind) const;
    //! Cumulative bytes ever allocated with the given kind.
    std::size_t total_allocation(EAllocationType kind) const;
    long num_allocations() const;

    void set_context(const std::string& ctx);
    const std::string& get_context() const;

    class AllocationMonitor {
    public:
        AllocationMonitor(const std::string& name, TensorAllocator*);
        AllocationMonitor(const AllocationMonitor&) = delete;
        AllocationMonitor& operator=(const AllocationMonitor&) = delete;
        AllocationMonitor(AllocationMonitor&& other) noexcept;
        AllocationMonitor& operator=(AllocationMonitor&& other) noexcept;
        ~AllocationMonitor() noexcept;
    private:
        std::string mName;
        TensorAllocator* mAllocator;
        std::string mParent;
        bool mActive = true;
    };

    [[nodiscard]] AllocationMonitor with_context(const std::string& ctx) { return AllocationMonitor(ctx, this); }

    /**
     * @brief Get cumulative allocation statistics per context.
     * @return Vector of (context, bytes) pairs sorted by size descending.
     */
    std::vector<std::pair<std::string, std::size_t>> get_context_stats() const;

    struct sAllocStats;
private:
    template<typename Container>
    TensorPtr allocate_impl(ETensorDType dtype, const char* name, EAllocationType kind, const Container& shape);

    std::shared_ptr<sAllocStats> m_Stats;
};

#endif //TRACE_REPLAY_SRC_UTILITIES_ALLOCATOR_H
