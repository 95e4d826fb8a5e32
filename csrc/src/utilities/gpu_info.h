// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_UTILITIES_GPU_INFO_H
#define TRACE_REPLAY_SRC_UTILITIES_GPU_INFO_H

#include <cstddef>
#include <string>
#include <vector>

//! Bytes held by the CUDA context on the current device (total minus free).
std::size_t get_mem_reserved();

struct GPUInfo {
    int device_id;
    std::string name;
    std::size_t total_memory;
    int compute_capability_major;
    int compute_capability_minor;
};

class SystemInfo {
public:
    static int get_cuda_driver_version();
    static int get_cuda_runtime_version();
    static std::vector<GPUInfo> get_gpu_info();
};

#endif //TRACE_REPLAY_SRC_UTILITIES_GPU_INFO_H
