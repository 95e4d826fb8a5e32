// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trace/element_types.h"

#include <array>

namespace replay {
namespace {

constexpr std::array<ElementTypeInfo, 14> kElementTypes = {{
    {"float", ETensorDType::FP32, EFillKind::Normal},
    {"double", ETensorDType::FP64, EFillKind::Normal},
    {"int", ETensorDType::INT32, EFillKind::Ones},
    {"long", ETensorDType::INT64, EFillKind::Ones},
    {"long int", ETensorDType::INT64, EFillKind::Ones},
    {"int64_t", ETensorDType::INT64, EFillKind::Ones},
    {"bool", ETensorDType::BOOL, EFillKind::Ones},
    {"half", ETensorDType::FP16, EFillKind::Ones},
    {"c10::Half", ETensorDType::FP16, EFillKind::Ones},
    {"c10::BFloat16", ETensorDType::BF16, EFillKind::Ones},
    {"int8", ETensorDType::INT8, EFillKind::Ones},
    {"signed char", ETensorDType::INT8, EFillKind::Ones},
    {"unsigned char", ETensorDType::BYTE, EFillKind::Ones},
    {"uint8", ETensorDType::BYTE, EFillKind::Ones},
}};

} // namespace

const ElementTypeInfo* find_element_type(std::string_view elem_type) {
    for (const auto& info : kElementTypes) {
        if (info.Name == elem_type) {
            return &info;
        }
    }
    return nullptr;
}

std::string_view element_type_name(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "float";
        case ETensorDType::FP64: return "double";
        case ETensorDType::FP16: return "c10::Half";
        case ETensorDType::BF16: return "c10::BFloat16";
        case ETensorDType::INT64: return "long int";
        case ETensorDType::INT32: return "int";
        case ETensorDType::INT8: return "signed char";
        case ETensorDType::BYTE: return "unsigned char";
        case ETensorDType::BOOL: return "bool";
    }
    return "unknown";
}

} // namespace replay
