// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Execution-graph JSON loader and tensor accessors.

#include "trace/execution_graph.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace replay {
namespace {

constexpr std::string_view kTensorPrefix = "Tensor(";
constexpr std::string_view kListPrefix = "GenericList[";

bool is_identifier(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    const unsigned char c0 = static_cast<unsigned char>(text[0]);
    if (!(std::isalpha(c0) || text[0] == '_')) {
        return false;
    }
    for (std::size_t i = 1; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!(std::isalnum(c) || text[i] == '_')) {
            return false;
        }
    }
    return true;
}

TraceValue parse_value(const nlohmann::json& value) {
    if (value.is_null()) {
        return {};
    }
    if (value.is_boolean()) {
        return TraceValue{value.get<bool>()};
    }
    if (value.is_number_integer()) {
        return TraceValue{value.get<std::int64_t>()};
    }
    if (value.is_number_unsigned()) {
        return TraceValue{static_cast<std::int64_t>(value.get<std::uint64_t>())};
    }
    if (value.is_number_float()) {
        return TraceValue{value.get<double>()};
    }
    if (value.is_string()) {
        return TraceValue{value.get<std::string>()};
    }
    if (value.is_array()) {
        TraceList items;
        items.reserve(value.size());
        for (const auto& el : value) {
            items.push_back(parse_value(el));
        }
        return TraceValue{std::make_shared<TraceList>(std::move(items))};
    }
    throw TraceError("Unsupported value type in execution trace: " + std::string(value.type_name()));
}

std::vector<TraceValue> parse_value_array(const nlohmann::json& node_json, const char* key, std::int64_t id) {
    std::vector<TraceValue> out;
    if (!node_json.contains(key)) {
        return out;
    }
    const auto& arr = node_json[key];
    if (!arr.is_array()) {
        throw TraceError(fmt::format("node {}: field '{}' must be an array", id, key));
    }
    out.reserve(arr.size());
    for (const auto& item : arr) {
        out.push_back(parse_value(item));
    }
    return out;
}

std::vector<std::string> parse_type_array(const nlohmann::json& node_json, const char* key, std::int64_t id) {
    std::vector<std::string> out;
    if (!node_json.contains(key)) {
        return out;
    }
    const auto& arr = node_json[key];
    if (!arr.is_array()) {
        throw TraceError(fmt::format("node {}: field '{}' must be an array", id, key));
    }
    for (const auto& item : arr) {
        if (!item.is_string()) {
            throw TraceError(fmt::format("node {}: field '{}' must contain strings", id, key));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

TraceNode parse_node(const nlohmann::json& node_json) {
    if (!node_json.is_object()) {
        throw TraceError("execution trace node must be an object");
    }
    if (!node_json.contains("id") || !node_json["id"].is_number_integer()) {
        throw TraceError("execution trace node without integer 'id'");
    }

    TraceNode node;
    node.Id = node_json["id"].get<std::int64_t>();
    if (node_json.contains("name") && node_json["name"].is_string()) {
        node.Name = node_json["name"].get<std::string>();
    }
    if (node_json.contains("op_schema") && node_json["op_schema"].is_string()) {
        node.OpSchema = node_json["op_schema"].get<std::string>();
    }

    // a missing parent marks a root candidate, same as parent == id
    node.Parent = node.Id;
    if (node_json.contains("parent") && !node_json["parent"].is_null()) {
        if (!node_json["parent"].is_number_integer()) {
            throw TraceError(fmt::format("node {}: 'parent' must be an integer", node.Id));
        }
        node.Parent = node_json["parent"].get<std::int64_t>();
    }

    if (node_json.contains("kind") && node_json["kind"].is_string()) {
        const std::string kind = node_json["kind"].get<std::string>();
        if (kind == "operator") {
            node.Kind = ENodeKind::Operator;
        } else if (kind == "label") {
            node.Kind = ENodeKind::Label;
        } else {
            throw TraceError(fmt::format("node {}: unknown kind '{}'", node.Id, kind));
        }
    } else {
        node.Kind = classify_node_name(node.Name);
    }

    node.Inputs = parse_value_array(node_json, "inputs", node.Id);
    node.InputShapes = parse_value_array(node_json, "input_shapes", node.Id);
    node.InputTypes = parse_type_array(node_json, "input_types", node.Id);
    node.Outputs = parse_value_array(node_json, "outputs", node.Id);
    node.OutputShapes = parse_value_array(node_json, "output_shapes", node.Id);
    node.OutputTypes = parse_type_array(node_json, "output_types", node.Id);
    return node;
}

std::int64_t as_int(const TraceValue& v, std::int64_t node_id, const char* what) {
    if (const auto* i = std::get_if<std::int64_t>(&v.value)) {
        return *i;
    }
    throw TraceError(fmt::format("node {}: {} must contain integers", node_id, what));
}

TensorId parse_tensor_id(const TraceValue& v, std::int64_t node_id) {
    if (!v.is_list() || v.list().size() < 5) {
        throw TraceError(fmt::format("node {}: malformed tensor identifier", node_id));
    }
    const auto& items = v.list();
    return TensorId{
        as_int(items[0], node_id, "tensor identifier"),
        as_int(items[1], node_id, "tensor identifier"),
        as_int(items[2], node_id, "tensor identifier"),
        as_int(items[3], node_id, "tensor identifier"),
        as_int(items[4], node_id, "tensor identifier"),
    };
}

std::vector<long> parse_shape(const TraceValue& v, std::int64_t node_id) {
    std::vector<long> shape;
    if (v.is_null()) {
        return shape;
    }
    if (!v.is_list()) {
        throw TraceError(fmt::format("node {}: malformed tensor shape", node_id));
    }
    for (const auto& dim : v.list()) {
        shape.push_back(static_cast<long>(as_int(dim, node_id, "tensor shape")));
    }
    return shape;
}

//! Splits "GenericList[Tensor(a),Tensor(b)]" into the per-element type strings.
std::vector<std::string> list_element_types(std::string_view type) {
    std::vector<std::string> out;
    std::size_t pos = type.find(kTensorPrefix);
    while (pos != std::string_view::npos) {
        std::size_t start = pos + kTensorPrefix.size();
        int depth = 1;
        std::size_t i = start;
        for (; i < type.size() && depth > 0; ++i) {
            if (type[i] == '(') ++depth;
            else if (type[i] == ')') --depth;
        }
        out.emplace_back(type.substr(start, i - start - 1));
        pos = type.find(kTensorPrefix, i);
    }
    return out;
}

std::vector<TensorRef> collect_tensors(const TraceNode& node,
                                       const std::vector<TraceValue>& values,
                                       const std::vector<TraceValue>& shapes,
                                       const std::vector<std::string>& types,
                                       const char* direction) {
    if (values.size() != types.size() || values.size() != shapes.size()) {
        throw TraceError(fmt::format("node {} ({}): {} arrays have different lengths ({} values, {} shapes, {} types)",
                                     node.Id, node.Name, direction, values.size(), shapes.size(), types.size()));
    }

    std::vector<TensorRef> out;
    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        const std::string& type = types[idx];
        if (is_tensor_type(type)) {
            out.push_back(TensorRef{tensor_element_type(type),
                                    parse_tensor_id(values[idx], node.Id),
                                    parse_shape(shapes[idx], node.Id),
                                    static_cast<int>(idx), -1});
        } else if (is_tensor_list_type(type)) {
            if (!values[idx].is_list() || !shapes[idx].is_list()) {
                throw TraceError(fmt::format("node {} ({}): {} {} is not a tensor list", node.Id, node.Name, direction, idx));
            }
            const auto& items = values[idx].list();
            const auto& item_shapes = shapes[idx].list();
            if (items.size() != item_shapes.size()) {
                throw TraceError(fmt::format("node {} ({}): {} {} has {} tensors but {} shapes",
                                             node.Id, node.Name, direction, idx, items.size(), item_shapes.size()));
            }
            const auto elem_types = list_element_types(type);
            for (std::size_t j = 0; j < items.size(); ++j) {
                std::string elem = elem_types.empty() ? std::string{} : elem_types[std::min(j, elem_types.size() - 1)];
                out.push_back(TensorRef{std::move(elem),
                                        parse_tensor_id(items[j], node.Id),
                                        parse_shape(item_shapes[j], node.Id),
                                        static_cast<int>(idx), static_cast<int>(j)});
            }
        }
    }
    return out;
}

} // namespace

const TraceList& TraceValue::list() const {
    const auto* ptr = std::get_if<ListPtr>(&value);
    if (!ptr || !*ptr) {
        throw TraceError("trace value is not a list");
    }
    return **ptr;
}

std::size_t TensorIdHash::operator()(const TensorId& id) const noexcept {
    std::size_t h = std::hash<std::int64_t>{}(id.Tensor);
    auto mix = [&h](std::int64_t v) {
        h ^= std::hash<std::int64_t>{}(v) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    };
    mix(id.Storage);
    mix(id.Offset);
    mix(id.NumElem);
    mix(id.ElemBytes);
    return h;
}

std::string to_string(const TensorId& id) {
    return fmt::format("({}, {}, {}, {}, {})", id.Tensor, id.Storage, id.Offset, id.NumElem, id.ElemBytes);
}

bool TraceNode::is_tensor_input(std::size_t idx) const {
    return idx < InputTypes.size() && is_tensor_type(InputTypes[idx]);
}

bool TraceNode::is_tensor_list_input(std::size_t idx) const {
    return idx < InputTypes.size() && is_tensor_list_type(InputTypes[idx]);
}

std::vector<TensorRef> TraceNode::input_tensors() const {
    return collect_tensors(*this, Inputs, InputShapes, InputTypes, "input");
}

std::vector<TensorRef> TraceNode::output_tensors() const {
    return collect_tensors(*this, Outputs, OutputShapes, OutputTypes, "output");
}

ExecutionGraph ExecutionGraph::from_json(const nlohmann::json& root) {
    if (!root.is_object() || !root.contains("nodes") || !root["nodes"].is_array()) {
        throw TraceError("execution trace must be an object with a 'nodes' array");
    }

    ExecutionGraph graph;
    if (root.contains("schema") && root["schema"].is_string()) {
        graph.mSchema = root["schema"].get<std::string>();
    }

    std::vector<std::int64_t> file_order;
    for (const auto& node_json : root["nodes"]) {
        TraceNode node = parse_node(node_json);
        const std::int64_t id = node.Id;
        if (!graph.mNodes.emplace(id, std::move(node)).second) {
            throw TraceError(fmt::format("duplicate node id {}", id));
        }
        file_order.push_back(id);
    }

    std::vector<std::int64_t> roots;
    for (std::int64_t id : file_order) {
        TraceNode& node = graph.mNodes.at(id);
        if (node.Parent == node.Id) {
            roots.push_back(id);
            continue;
        }
        auto parent = graph.mNodes.find(node.Parent);
        if (parent == graph.mNodes.end()) {
            throw TraceError(fmt::format("node {} ({}) references missing parent {}", node.Id, node.Name, node.Parent));
        }
        parent->second.Children.push_back(id);
    }

    if (roots.size() != 1) {
        throw TraceError(fmt::format("execution trace must have exactly one root node, found {}", roots.size()));
    }
    graph.mRootId = roots.front();
    return graph;
}

ExecutionGraph ExecutionGraph::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open execution trace: " + path);
    }
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw TraceError(fmt::format("could not parse execution trace {}: {}", path, e.what()));
    }
    return from_json(root);
}

const TraceNode& ExecutionGraph::root() const {
    return mNodes.at(mRootId);
}

const TraceNode& ExecutionGraph::node(std::int64_t id) const {
    auto it = mNodes.find(id);
    if (it == mNodes.end()) {
        throw TraceError(fmt::format("no node with id {}", id));
    }
    return it->second;
}

const TraceNode* ExecutionGraph::parent_of(const TraceNode& node) const {
    if (node.Id == mRootId) {
        return nullptr;
    }
    return &mNodes.at(node.Parent);
}

ENodeKind classify_node_name(std::string_view name) {
    if (name.starts_with("CppNode<") && name.ends_with(">")) {
        return ENodeKind::Operator;
    }
    const std::size_t sep = name.find("::");
    if (sep == std::string_view::npos) {
        return ENodeKind::Label;
    }
    std::string_view ns = name.substr(0, sep);
    std::string_view op = name.substr(sep + 2);
    if (const std::size_t dot = op.find('.'); dot != std::string_view::npos) {
        if (!is_identifier(op.substr(dot + 1))) {
            return ENodeKind::Label;
        }
        op = op.substr(0, dot);
    }
    return is_identifier(ns) && is_identifier(op) ? ENodeKind::Operator : ENodeKind::Label;
}

bool is_tensor_type(std::string_view type) {
    return type.starts_with(kTensorPrefix) && type.ends_with(")");
}

bool is_tensor_list_type(std::string_view type) {
    return type.starts_with(kListPrefix) && type.find(kTensorPrefix) != std::string_view::npos;
}

std::string tensor_element_type(std::string_view type) {
    if (is_tensor_type(type)) {
        return std::string(type.substr(kTensorPrefix.size(), type.size() - kTensorPrefix.size() - 1));
    }
    auto elems = list_element_types(type);
    return elems.empty() ? std::string{} : elems.front();
}

bool is_null_sentinel(const TraceValue& v) {
    const auto* s = std::get_if<std::string>(&v.value);
    return s && (*s == "<None>" || *s == "<Generator>");
}

} // namespace replay
