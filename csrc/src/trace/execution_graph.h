// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Execution-graph trace structures and JSON loader.

#ifndef TRACE_REPLAY_SRC_TRACE_EXECUTION_GRAPH_H
#define TRACE_REPLAY_SRC_TRACE_EXECUTION_GRAPH_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace replay {

/// Raised for malformed traces: bad JSON structure, broken parent links,
/// parallel arrays of different length, unparsable tensor identifiers.
class TraceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ENodeKind : std::uint8_t {
    Operator,   ///< a recorded operator call (aten::mm, fbgemm::..., CppNode<...>)
    Label,      ///< grouping scope (record_function labels, thread roots, autograd scopes)
};

struct TraceValue;

using TraceList = std::vector<TraceValue>;

/// @brief A recorded argument value, kept as close to the JSON as possible.
///
/// Tensors are integer tuples and tensor lists are lists of tuples; which one
/// a value is follows from the parallel type string, not from the value itself.
struct TraceValue {
    using ListPtr = std::shared_ptr<TraceList>;

    std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        ListPtr
    > value;

    TraceValue() = default;

    template<typename T>
    TraceValue(T v) : value(std::move(v)) {}

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(value); }
    [[nodiscard]] bool is_list() const { return std::holds_alternative<ListPtr>(value); }
    [[nodiscard]] const TraceList& list() const;
};

/// @brief Identifier of the storage a tensor lived in during the recorded run.
///
/// Equal ids denote "same underlying storage", not necessarily the same shape.
struct TensorId {
    std::int64_t Tensor = 0;
    std::int64_t Storage = 0;
    std::int64_t Offset = 0;
    std::int64_t NumElem = 0;
    std::int64_t ElemBytes = 0;

    bool operator==(const TensorId&) const = default;
};

struct TensorIdHash {
    std::size_t operator()(const TensorId& id) const noexcept;
};

std::string to_string(const TensorId& id);

/// One tensor argument or result of a node. Tensor-list arguments are flattened,
/// with ListIndex giving the position inside the list.
struct TensorRef {
    std::string ElemType;       ///< element type as recorded, e.g. "float" or "c10::Half"
    TensorId Id;
    std::vector<long> Shape;
    int ArgIndex = 0;
    int ListIndex = -1;
};

struct TraceNode {
    std::int64_t Id = 0;
    std::string Name;
    std::string OpSchema;
    ENodeKind Kind = ENodeKind::Label;
    std::int64_t Parent = 0;
    std::vector<std::int64_t> Children;

    std::vector<TraceValue> Inputs;
    std::vector<TraceValue> InputShapes;
    std::vector<std::string> InputTypes;

    std::vector<TraceValue> Outputs;
    std::vector<TraceValue> OutputShapes;
    std::vector<std::string> OutputTypes;

    [[nodiscard]] bool is_operator() const { return Kind == ENodeKind::Operator; }

    bool is_tensor_input(std::size_t idx) const;
    bool is_tensor_list_input(std::size_t idx) const;

    //! Flattened tensor inputs in argument order.
    //! @throws TraceError if the parallel input arrays disagree or an identifier is malformed.
    std::vector<TensorRef> input_tensors() const;
    //! Flattened tensor outputs in result order.
    std::vector<TensorRef> output_tensors() const;
};

class ExecutionGraph {
public:
    static ExecutionGraph from_json(const nlohmann::json& root);
    static ExecutionGraph load(const std::string& path);

    const TraceNode& root() const;
    const TraceNode& node(std::int64_t id) const;
    //! Returns nullptr for the root.
    const TraceNode* parent_of(const TraceNode& node) const;
    bool contains(std::int64_t id) const { return mNodes.contains(id); }

    std::size_t size() const { return mNodes.size(); }
    const std::string& schema() const { return mSchema; }

private:
    std::map<std::int64_t, TraceNode> mNodes;
    std::int64_t mRootId = 0;
    std::string mSchema;
};

//! Classifies a node name as operator or grouping scope.
ENodeKind classify_node_name(std::string_view name);

bool is_tensor_type(std::string_view type);
bool is_tensor_list_type(std::string_view type);

//! "Tensor(float)" -> "float"; "GenericList[Tensor(long),Tensor(long)]" -> "long".
std::string tensor_element_type(std::string_view type);

//! True for the "<None>" and "<Generator>" markers.
bool is_null_sentinel(const TraceValue& v);

} // namespace replay

#endif //TRACE_REPLAY_SRC_TRACE_EXECUTION_GRAPH_H
