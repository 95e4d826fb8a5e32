// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "gpu_info.h"

#include <cuda_runtime.h>

#include "utils.h"

std::size_t get_mem_reserved() {
    std::size_t free = 0;
    std::size_t total = 0;
    CUDA_CHECK(cudaMemGetInfo(&free, &total));
    return total - free;
}

int SystemInfo::get_cuda_driver_version() {
    int version = 0;
    CUDA_CHECK(cudaDriverGetVersion(&version));
    return version;
}

int SystemInfo::get_cuda_runtime_version() {
    int version = 0;
    CUDA_CHECK(cudaRuntimeGetVersion(&version));
    return version;
}

/**
 * @brief Enumerate the visible CUDA devices.
 *
 * Returns an empty list (instead of throwing) when no driver or device is present,
 * so host-only replays can still report their environment.
 */
std::vector<GPUInfo> SystemInfo::get_gpu_info() {
    std::vector<GPUInfo> result;
    if (!cuda_device_available()) {
        return result;
    }
    int count = 0;
    CUDA_CHECK(cudaGetDeviceCount(&count));
    for (int i = 0; i < count; ++i) {
        cudaDeviceProp props;
        CUDA_CHECK(cudaGetDeviceProperties(&props, i));
        result.push_back(GPUInfo{i, props.name, props.totalGlobalMem, props.major, props.minor});
    }
    return result;
}
