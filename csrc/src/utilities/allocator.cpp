// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "allocator.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <iostream>
#include <numeric>
#include <unordered_map>

#include <cuda_runtime.h>
#include <fmt/core.h>

TensorAllocator::TensorAllocator(TensorAllocator&&) noexcept = default;
TensorAllocator& TensorAllocator::operator=(TensorAllocator&&) noexcept = default;

const char* allocation_type_to_str(EAllocationType kind) {
    switch (kind) {
        case EAllocationType::ON_DEVICE: return "device";
        case EAllocationType::PINNED: return "pinned";
        case EAllocationType::ON_HOST: return "host";
    }
    return "unknown";
}

struct sTotalAllocations {
    long ON_DEVICE = 0;
    long PINNED = 0;
    long ON_HOST = 0;

    /**
     * @brief Access the byte counter for a given allocation kind.
     *
     * @param kind Allocation type to access.
     * @return Reference to the counter corresponding to @p kind.
     * @throws std::logic_error If @p kind is not a recognized allocation type.
     */
    long& operator[](EAllocationType kind)
    {
        switch (kind) {
            case EAllocationType::ON_DEVICE: return ON_DEVICE;
            case EAllocationType::PINNED: return PINNED;
            case EAllocationType::ON_HOST: return ON_HOST;
            default: throw std::logic_error("Unknown allocation type");
        }
    }

    long operator[](EAllocationType kind) const {
        return const_cast<sTotalAllocations&>(*this)[kind];
    }
};

struct TensorAllocator::sAllocStats
{
    std::string Context = "";
    sTotalAllocations Live;
    sTotalAllocations Peak;
    sTotalAllocations Total;
    long NumAllocations = 0;
    std::unordered_map<std::string, sTotalAllocations> ContextStats;
};

namespace {

/**
 * @brief Allocate raw storage on the requested memory kind.
 *
 * @param bytes Number of bytes to allocate.
 * @param kind Allocation kind (device, pinned, or host).
 * @param device [out] CUDA ordinal for device allocations, -1 for host allocations.
 * @return Pointer to the new storage.
 * @throws cuda_error On CUDA allocation failures (e.g., out-of-memory).
 */
std::byte* allocate_raw(std::size_t bytes, EAllocationType kind, int& device) {
    std::byte* ptr = nullptr;
    device = -1;
    if(kind == EAllocationType::ON_DEVICE) {
        CUDA_CHECK(cudaGetDevice(&device));
        CUDA_CHECK(cudaMalloc(reinterpret_cast<void**>(&ptr), bytes));
    } else if(kind == EAllocationType::PINNED) {
        CUDA_CHECK(cudaHostAlloc(reinterpret_cast<void**>(&ptr), bytes, cudaHostAllocMapped));
    } else {
        ptr = new std::byte[bytes];
    }
    return ptr;
}

/**
 * @brief Release storage obtained from allocate_raw().
 *
 * Never throws: CUDA errors are reported on stderr and cleared, because this runs
 * inside shared_ptr deleters, possibly during stack unwinding.
 */
void free_raw(std::byte* ptr, EAllocationType kind, std::size_t bytes) noexcept {
    if (ptr == nullptr) return;
    switch (kind) {
        case EAllocationType::ON_DEVICE: {
            const cudaError_t st = cudaFree(ptr);
            if (st != cudaSuccess) {
                fprintf(stderr, "WARNING: Cuda error when freeing device allocation %p [size %zu]: %s\n",
                        static_cast<void*>(ptr), bytes, cudaGetErrorString(st));
                fflush(stderr);
                (void)cudaGetLastError();
            }
            break;
        }
        case EAllocationType::PINNED: {
            const cudaError_t st = cudaFreeHost(ptr);
            if (st != cudaSuccess) {
                fprintf(stderr, "WARNING: Cuda error when freeing host allocation %p [size %zu]: %s\n",
                        static_cast<void*>(ptr), bytes, cudaGetErrorString(st));
                fflush(stderr);
                (void)cudaGetLastError();
            }
            break;
        }
        case EAllocationType::ON_HOST:
            delete[] ptr;
            break;
    }
}

} // namespace

TensorPtr TensorAllocator::allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, kind, shape);
}

TensorPtr TensorAllocator::allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, kind, shape);
}

/**
 * @brief Implementation helper for allocate() overloads.
 *
 * Allocates storage, wraps it into a shared handle whose deleter frees the memory and
 * updates the live-byte statistics, and records per-context statistics.
 *
 * @tparam Container Container type providing .size() and iteration over dimension sizes.
 * @param dtype Tensor element type.
 * @param name Logical name used for stats and error reporting.
 * @param kind Allocation kind.
 * @param shape Tensor dimensions.
 * @return Allocated tensor handle.
 * @throws std::runtime_error On CUDA OOM (with enriched message) or if the rank is too large.
 */
template<typename Container>
TensorPtr TensorAllocator::allocate_impl(ETensorDType dtype, const char* name, EAllocationType kind, const Container& shape) {
    if(shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Tensor rank too large for `{}`", name ? name : "<unnamed>"));
    }

    const long nelem = std::accumulate(std::begin(shape), std::end(shape), 1l, std::multiplies<>());
    const std::size_t bytes = narrow<std::size_t>(nelem) * get_dtype_size(dtype);
    const char* safe_name = name ? name : "<unnamed>";

    int device = -1;
    std::byte* ptr = nullptr;
    try {
        // zero-sized tensors still get a distinct, valid pointer
        ptr = allocate_raw(std::max<std::size_t>(bytes, 1), kind, device);
    } catch (const cuda_error& error) {
        if(error.code == cudaErrorMemoryAllocation) {
            print_stats();
            std::vector<long> dims(std::begin(shape), std::end(shape));
            throw std::runtime_error(fmt::format(
                "Cuda OOM when allocating tensor {} of shape {} with dtype {} in context {}.",
                safe_name, shape_to_string(dims), dtype_to_str(dtype), m_Stats->Context));
        }
        throw;
    }

    Tensor view = Tensor::from_pointer(ptr, device, dtype, shape);

    auto stats = m_Stats;
    stats->Live[kind] += narrow<long>(bytes);
    stats->Peak[kind] = std::max(stats->Peak[kind], stats->Live[kind]);
    stats->Total[kind] += narrow<long>(bytes);
    stats->NumAllocations += 1;
    if (!stats->Context.empty()) {
        stats->ContextStats[stats->Context][kind] += narrow<long>(bytes);
    }

    return TensorPtr(new Tensor(view), [stats, kind, bytes](Tensor* t) {
        free_raw(t->Data, kind, bytes);
        stats->Live[kind] -= static_cast<long>(bytes);
        delete t;
    });
}

/**
 * @brief Construct a TensorAllocator with empty allocation statistics.
 */
TensorAllocator::TensorAllocator() : m_Stats(std::make_shared<sAllocStats>()) {
}

/**
 * @brief Destructor. Memory is owned by the handles, so nothing is freed here.
 */
TensorAllocator::~TensorAllocator() noexcept = default;

/**
 * @brief Print a summary of allocations per context.
 */
void TensorAllocator::print_stats() const {
    std::cerr << "\n=== allocations (live device " << live_bytes(EAllocationType::ON_DEVICE) / 1024 / 1024
              << " MiB, peak " << peak_bytes(EAllocationType::ON_DEVICE) / 1024 / 1024 << " MiB) ===\n";
    for (const auto& [ctx, bytes] : get_context_stats()) {
        if (bytes >= 1024 * 1024 * 20) {
            std::cerr << "  " << ctx << ": " << bytes / 1024 / 1024 << " MiB\n";
        } else {
            std::cerr << "  " << ctx << ": " << bytes / 1024 << " KiB\n";
        }
    }
    std::cerr << "\n";
}

std::size_t TensorAllocator::live_bytes(EAllocationType kind) const {
    return static_cast<std::size_t>(m_Stats->Live[kind]);
}

std::size_t TensorAllocator::peak_bytes(EAllocationType kind) const {
    return static_cast<std::size_t>(m_Stats->Peak[kind]);
}

std::size_t TensorAllocator::total_allocation(EAllocationType kind) const {
    return static_cast<std::size_t>(m_Stats->Total[kind]);
}

long TensorAllocator::num_allocations() const {
    return m_Stats->NumAllocations;
}

/**
 * @brief Set the current allocation context name.
 *
 * The context name is used to attribute subsequent allocations to a logical "segment" for reporting.
 *
 * @param ctx New context name.
 */
void TensorAllocator::set_context(const std::string& ctx) {
    m_Stats->Context = ctx;
}

const std::string& TensorAllocator::get_context() const {
    return m_Stats->Context;
}

/**
 * @brief RAII helper that sets an allocator context for the lifetime of the monitor.
 *
 * On construction, saves the previous context and sets the allocator context to @p name.
 *
 * @param name Context name to set while the monitor is alive.
 * @param alloc Allocator whose context should be managed.
 */
TensorAllocator::AllocationMonitor::AllocationMonitor(const std::string& name, TensorAllocator* alloc) :
    mName(name), mAllocator(alloc), mParent(alloc->get_context()) {
    alloc->set_context(mName);
}

TensorAllocator::AllocationMonitor::AllocationMonitor(AllocationMonitor&& other) noexcept
    : mName(std::move(other.mName)),
      mAllocator(other.mAllocator),
      mParent(std::move(other.mParent)),
      mActive(other.mActive) {
    other.mAllocator = nullptr;
    other.mActive = false;
}

TensorAllocator::AllocationMonitor& TensorAllocator::AllocationMonitor::operator=(AllocationMonitor&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    if (mActive && mAllocator) {
        mAllocator->set_context(mParent);
    }
    mName = std::move(other.mName);
    mParent = std::move(other.mParent);
    mAllocator = other.mAllocator;
    mActive = other.mActive;
    other.mAllocator = nullptr;
    other.mActive = false;
    return *this;
}

/**
 * @brief Destructor; restores the allocator's previous context if still active.
 *
 * Never throws. If improper nesting is detected (current allocator context differs from mName),
 * it prints a warning and still restores the parent.
 */
TensorAllocator::AllocationMonitor::~AllocationMonitor() noexcept {
    if (!mActive || !mAllocator) {
        return;
    }
    if (mAllocator->get_context() != mName) {
        fprintf(stderr,
                "WARNING: AllocationMonitor improper nesting: expected ctx='%s' but got ctx='%s' (restoring parent='%s')\n",
                mName.c_str(), mAllocator->get_context().c_str(), mParent.c_str());
        fflush(stderr);
    }
    mAllocator->set_context(mParent);
}

std::vector<std::pair<std::string, std::size_t>> TensorAllocator::get_context_stats() const {
    std::vector<std::pair<std::string, std::size_t>> result;
    result.reserve(m_Stats->ContextStats.size());
    for (const auto& [name, allocs] : m_Stats->ContextStats) {
        result.emplace_back(name, static_cast<std::size_t>(allocs.ON_DEVICE + allocs.PINNED + allocs.ON_HOST));
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.second > b.second; });
    return result;
}
