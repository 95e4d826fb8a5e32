// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_UTILITIES_TENSOR_H
#define TRACE_REPLAY_SRC_UTILITIES_TENSOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <driver_types.h>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on memory that is associated
//! with a specific data type and shape.
//! Device is the CUDA ordinal for device memory and -1 for host (pageable or pinned) memory.
struct Tensor {
    ETensorDType DType;
    std::array<long, MAX_TENSOR_DIM> Sizes;
    std::byte* Data = nullptr;
    int Rank = 0;
    int Device = -1;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }
    [[nodiscard]] bool is_host() const { return Device < 0; }

    [[nodiscard]] std::vector<long> shape() const {
        return std::vector<long>(Sizes.begin(), Sizes.begin() + Rank);
    }

    template<class TargetType>
    [[nodiscard]] constexpr const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] constexpr TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, int device, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank, device};
    }
};

//! Shared, owning handle to a tensor. The deleter installed by the allocator
//! releases the underlying memory once the last handle goes away.
using TensorPtr = std::shared_ptr<Tensor>;

std::string shape_to_string(const std::vector<long>& shape);

//! Copies the contents of @p src into @p dst (same dtype and element count),
//! across any combination of host and device memory. Copies into host memory
//! are complete when the function returns.
void copy_tensor(Tensor& dst, const Tensor& src, cudaStream_t stream);

#endif //TRACE_REPLAY_SRC_UTILITIES_TENSOR_H
