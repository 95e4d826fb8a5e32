// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Operator library: name/schema-keyed callables invoked by the replay engine.
//
// Every operator receives its resolved argument list and returns its results as
// a list of values. Outputs are freshly allocated per call so that a replay
// reproduces the allocation pattern of the recorded run.

#ifndef TRACE_REPLAY_SRC_RUNTIME_OPS_OP_LIBRARY_H
#define TRACE_REPLAY_SRC_RUNTIME_OPS_OP_LIBRARY_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <cuda_runtime.h>

#include "utilities/allocator.h"
#include "utilities/tensor.h"

typedef struct cublasContext* cublasHandle_t;

namespace replay {

struct OpValue;

using OpList = std::vector<OpValue>;
using TensorList = std::vector<TensorPtr>;

struct OpValue {
    using ListPtr = std::shared_ptr<OpList>;

    std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        TensorPtr,
        TensorList,
        ListPtr
    > value;

    OpValue() = default;

    template<typename T>
    OpValue(T v) : value(std::move(v)) {}

    //! True for the empty value and for a null tensor handle.
    [[nodiscard]] bool is_null() const;
    [[nodiscard]] bool is_tensor() const { return std::holds_alternative<TensorPtr>(value); }
    [[nodiscard]] bool is_number() const {
        return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
    }
};

//! Short human-readable description of a value, for error messages.
std::string describe(const OpValue& v);

struct OpContext {
    TensorAllocator& Allocator;
    int Device;                     ///< CUDA ordinal of the replay device, -1 for host replay
    cudaStream_t Stream;
    cublasHandle_t Cublas;          ///< null for host replay
};

using OpFunction = std::function<std::vector<OpValue>(OpContext&, std::vector<OpValue>&)>;

struct OpCallable {
    OpFunction Fn;
    int OutputCount = 1;
    std::string Name;

    explicit operator bool() const { return static_cast<bool>(Fn); }
};

class OperatorLibrary {
public:
    //! Registers @p fn under an operator name (e.g. "aten::mm").
    void add(const std::string& name, OpFunction fn, int output_count);
    //! Registers @p fn under a full schema string; schema entries win over name entries.
    void add_schema(const std::string& schema, OpFunction fn, int output_count);

    //! Resolves a node: schema first, then name. Returns nullopt on a miss.
    std::optional<OpCallable> lookup(const std::string& name, const std::string& schema) const;

    std::size_t size() const { return mByName.size() + mBySchema.size(); }

    //! Library with every built-in operator registered.
    static OperatorLibrary with_builtins();

private:
    std::unordered_map<std::string, OpCallable> mByName;
    std::unordered_map<std::string, OpCallable> mBySchema;
};

void register_elementwise_ops(OperatorLibrary& lib);
void register_matmul_ops(OperatorLibrary& lib);
void register_reduction_ops(OperatorLibrary& lib);
void register_embedding_bag_ops(OperatorLibrary& lib);
void register_data_movement_ops(OperatorLibrary& lib);

//! Copies @p t to the host or to the current device; returns @p t unchanged if it is already there.
TensorPtr move_to_placement(OpContext& ctx, const TensorPtr& t, bool host);

// ----------------------------------------------------------------------------
// helpers shared by the operator implementations

//! Argument @p idx as a non-null tensor.
//! @throws std::invalid_argument if missing, not a tensor, or null.
const TensorPtr& tensor_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op);
//! Argument @p idx as a tensor, or nullptr if absent or None.
TensorPtr optional_tensor_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op);
double number_arg(const std::vector<OpValue>& args, std::size_t idx, double fallback, const char* op);
std::int64_t int_arg(const std::vector<OpValue>& args, std::size_t idx, std::int64_t fallback, const char* op);
bool bool_arg(const std::vector<OpValue>& args, std::size_t idx, bool fallback, const char* op);
//! Integer list argument (e.g. reduction dims); empty if absent or None.
std::vector<std::int64_t> int_list_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op);

//! Argument @p idx as an int64 index or offset tensor. Int32 tensors are widened into a new tensor.
//! @throws std::invalid_argument if missing, null, or not an integer tensor.
TensorPtr index_tensor_arg(OpContext& ctx, const std::vector<OpValue>& args, std::size_t idx, const char* op);
//! Contents of an int64 tensor on the host; device tensors are copied back.
std::vector<std::int64_t> read_index_values(OpContext& ctx, const Tensor& t);
//! @throws std::invalid_argument if any index lies outside [0, num_rows).
void check_index_range(const std::vector<std::int64_t>& indices, long num_rows, const char* op);
//! @throws std::invalid_argument unless the offsets start at zero or later, never decrease and stay within @p num_indices.
void check_offsets(const std::vector<std::int64_t>& offsets, long num_indices, const char* op);

//! Allocates a new tensor on the same side (host or device) as @p placement.
TensorPtr allocate_output(OpContext& ctx, ETensorDType dtype, const std::vector<long>& shape,
                          const Tensor& placement, const char* name);

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_OPS_OP_LIBRARY_H
