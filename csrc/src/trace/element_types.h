// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_TRACE_ELEMENT_TYPES_H
#define TRACE_REPLAY_SRC_TRACE_ELEMENT_TYPES_H

#include <cstddef>
#include <string_view>

#include "utilities/dtype.h"

namespace replay {

//! How synthetic tensors of an element type are filled.
enum class EFillKind {
    Normal,     // standard normal samples
    Ones
};

struct ElementTypeInfo {
    std::string_view Name;
    ETensorDType DType;
    EFillKind Fill;
};

//! Looks up a recorded element type ("float", "long int", "c10::Half", ...).
//! Returns nullptr if no generator exists for it.
const ElementTypeInfo* find_element_type(std::string_view elem_type);

//! Canonical recorded name of @p dtype ("float", "long int", ...).
std::string_view element_type_name(ETensorDType dtype);

//! Marker recorded for undefined tensors; binding it to null is expected and not reported.
inline constexpr std::string_view kUninitializedElemType = "nullptr (uninitialized)";

} // namespace replay

#endif //TRACE_REPLAY_SRC_TRACE_ELEMENT_TYPES_H
