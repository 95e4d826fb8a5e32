// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Per-operator argument fixups applied right before an operator is invoked.

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_ARG_PATCHES_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_ARG_PATCHES_H

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "runtime/ops/op_library.h"

namespace replay {

using ArgPatch = std::function<void(OpContext&, std::vector<OpValue>&)>;

class ArgPatchTable {
public:
    void add(const std::string& op_name, ArgPatch patch);
    //! Applies the patch registered for @p op_name, if any.
    void apply(const std::string& op_name, OpContext& ctx, std::vector<OpValue>& args) const;
    [[nodiscard]] bool contains(const std::string& op_name) const { return mPatches.contains(op_name); }
    [[nodiscard]] std::size_t size() const { return mPatches.size(); }

    /// Table with the built-in patches:
    ///  - aten::convolution_backward: output mask forced to [true, true, true]
    ///  - aten::mul: second operand moved to the placement of the first if they differ
    static ArgPatchTable with_defaults();

private:
    std::unordered_map<std::string, ArgPatch> mPatches;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_ARG_PATCHES_H
