// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::FP64: return "fp64";
        case ETensorDType::FP16: return "fp16";
        case ETensorDType::BF16: return "bf16";
        case ETensorDType::INT64: return "int64";
        case ETensorDType::INT32: return "int32";
        case ETensorDType::INT8: return "int8";
        case ETensorDType::BYTE: return "byte";
        case ETensorDType::BOOL: return "bool";
    }
    return "unknown";
}

