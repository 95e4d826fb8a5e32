// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

#include <cuda_runtime.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

std::string shape_to_string(const std::vector<long>& shape) {
    return fmt::format("[{}]", fmt::join(shape, ", "));
}

/**
 * @brief Copy tensor contents between host and/or device buffers.
 *
 * Host-to-host copies use memcpy and never touch the CUDA runtime, so host-only
 * replays work without a device. All other directions go through
 * cudaMemcpyAsync on @p stream; if the destination lives on the host the
 * stream is synchronized before returning so the caller can read the data.
 *
 * @param dst Destination tensor; must have the same dtype and element count as @p src.
 * @param src Source tensor.
 * @param stream CUDA stream for device transfers.
 *
 * @throws std::logic_error If dtype or element count differ.
 * @throws cuda_error On CUDA failures.
 */
void copy_tensor(Tensor& dst, const Tensor& src, cudaStream_t stream) {
    if (dst.DType != src.DType || dst.nelem() != src.nelem()) {
        throw std::logic_error(fmt::format("copy_tensor: mismatch between {} {} and {} {}",
                                           dtype_to_str(dst.DType), shape_to_string(dst.shape()),
                                           dtype_to_str(src.DType), shape_to_string(src.shape())));
    }
    if (src.bytes() == 0) return;

    if (dst.is_host() && src.is_host()) {
        std::memcpy(dst.Data, src.Data, src.bytes());
        return;
    }

    CUDA_CHECK(cudaMemcpyAsync(dst.Data, src.Data, src.bytes(), cudaMemcpyDefault, stream));
    if (dst.is_host()) {
        CUDA_CHECK(cudaStreamSynchronize(stream));
    }
}
