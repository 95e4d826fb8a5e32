// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_UTILITIES_UTILS_H
#define TRACE_REPLAY_SRC_UTILITIES_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <cublas_v2.h>
#include <driver_types.h>

#ifndef __CUDACC__
#define HOST_DEVICE
#else
#define HOST_DEVICE __host__ __device__
#endif

/// This exception will be thrown for reported cuda errors
class cuda_error : public std::runtime_error {
public:
    cuda_error(cudaError_t err, const std::string& arg) :
            std::runtime_error(arg), code(err){};

    cudaError_t code;
};

/// Check `status`; if it isn't `cudaSuccess`, throw the corresponding `cuda_error`
void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line);

#define CUDA_CHECK(status) cuda_throw_on_error(status, #status, __FILE__, __LINE__)

/// Check cuBLAS status; throws std::runtime_error on failure
void cublas_throw_on_error(cublasStatus_t status, const char* statement, const char* file, int line);

#define CUBLAS_CHECK(status) cublas_throw_on_error(status, #status, __FILE__, __LINE__)

template<std::integral T>
constexpr T HOST_DEVICE div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
// NVTX utils

class NvtxRange {
public:
    explicit NvtxRange(const char* s) noexcept;
    NvtxRange(const std::string& base_str, int number);
    ~NvtxRange() noexcept;
};

cudaStream_t create_named_stream(const char* name);
cudaEvent_t create_named_event(const char* name, bool timing=false);

//! Returns true if a CUDA device can be selected in this process.
bool cuda_device_available();

#endif //TRACE_REPLAY_SRC_UTILITIES_UTILS_H
