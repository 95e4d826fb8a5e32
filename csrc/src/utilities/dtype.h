// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_UTILITIES_DTYPE_H
#define TRACE_REPLAY_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

enum class ETensorDType : int {
    FP32,
    FP64,
    FP16,
    BF16,
    INT64,
    INT32,
    INT8,
    BYTE,
    BOOL
};

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP64:
        case ETensorDType::INT64:
            return 8;
        case ETensorDType::FP32:
        case ETensorDType::INT32:
            return 4;
        case ETensorDType::FP16:
        case ETensorDType::BF16:
            return 2;
        case ETensorDType::INT8:
        case ETensorDType::BYTE:
        case ETensorDType::BOOL:
            return 1;
    }
    return 0;
}

const char* dtype_to_str(ETensorDType dtype);


template<class T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int8_t> = ETensorDType::INT8;
template<> inline constexpr ETensorDType dtype_from_type<std::uint8_t> = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<bool> = ETensorDType::BOOL;

#endif //TRACE_REPLAY_SRC_UTILITIES_DTYPE_H
