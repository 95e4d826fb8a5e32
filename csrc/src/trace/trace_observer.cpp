// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trace/trace_observer.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "trace/element_types.h"

namespace replay {
namespace {

constexpr std::int64_t kRootId = 1;
constexpr const char* kSchemaVersion = "1.0.1-replay";

} // namespace

TraceObserver::TraceObserver() {
    mNodes.push_back(nlohmann::json{
        {"name", "[replay thread]"},
        {"id", kRootId},
        {"parent", kRootId},
        {"kind", "label"},
        {"inputs", nlohmann::json::array()},
        {"input_shapes", nlohmann::json::array()},
        {"input_types", nlohmann::json::array()},
        {"outputs", nlohmann::json::array()},
        {"output_shapes", nlohmann::json::array()},
        {"output_types", nlohmann::json::array()},
    });
}

std::int64_t TraceObserver::tensor_id(const Tensor& t) {
    auto [it, inserted] = mTensorIds.try_emplace(t.Data, static_cast<std::int64_t>(mTensorIds.size()) + 1);
    return it->second;
}

TraceObserver::Encoded TraceObserver::encode_tensor(const TensorPtr& t) {
    if (!t) {
        return {nlohmann::json::array({0, 0, 0, 0, 0}), nlohmann::json::array(),
                fmt::format("Tensor({})", kUninitializedElemType)};
    }
    const std::int64_t id = tensor_id(*t);
    return {nlohmann::json::array({id, id, 0, static_cast<std::int64_t>(t->nelem()), static_cast<std::int64_t>(get_dtype_size(t->DType))}),
            nlohmann::json(t->shape()),
            fmt::format("Tensor({})", element_type_name(t->DType))};
}

TraceObserver::Encoded TraceObserver::encode(const OpValue& v) {
    const auto& value = v.value;
    if (std::holds_alternative<std::monostate>(value)) {
        return {"<None>", nlohmann::json::array(), "None"};
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return {*b, nlohmann::json::array(), "Bool"};
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return {*i, nlohmann::json::array(), "Int"};
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isinf(*d)) {
            return {*d > 0 ? "inf" : "-inf", nlohmann::json::array(), "Double"};
        }
        return {*d, nlohmann::json::array(), "Double"};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return {*s, nlohmann::json::array(), "String"};
    }
    if (const auto* t = std::get_if<TensorPtr>(&value)) {
        return encode_tensor(*t);
    }
    if (const auto* list = std::get_if<TensorList>(&value)) {
        Encoded out{nlohmann::json::array(), nlohmann::json::array(), "GenericList["};
        for (std::size_t i = 0; i < list->size(); ++i) {
            Encoded e = encode_tensor((*list)[i]);
            out.Value.push_back(std::move(e.Value));
            out.Shape.push_back(std::move(e.Shape));
            out.Type += (i == 0 ? "" : ",") + e.Type;
        }
        out.Type += "]";
        return out;
    }

    const auto& list = std::get<OpValue::ListPtr>(value);
    Encoded out{nlohmann::json::array(), nlohmann::json::array(), "GenericList"};
    if (list) {
        for (const auto& item : *list) {
            Encoded e = encode(item);
            out.Value.push_back(std::move(e.Value));
        }
    }
    return out;
}

void TraceObserver::record(const TraceNode& node, const std::vector<OpValue>& inputs, const std::vector<TensorPtr>& outputs) {
    if (!mActive) {
        return;
    }

    nlohmann::json entry{
        {"name", node.Name},
        {"id", mNextNodeId++},
        {"parent", kRootId},
        {"kind", "operator"},
        {"op_schema", node.OpSchema},
        {"inputs", nlohmann::json::array()},
        {"input_shapes", nlohmann::json::array()},
        {"input_types", nlohmann::json::array()},
        {"outputs", nlohmann::json::array()},
        {"output_shapes", nlohmann::json::array()},
        {"output_types", nlohmann::json::array()},
    };
    for (const auto& in : inputs) {
        Encoded e = encode(in);
        entry["inputs"].push_back(std::move(e.Value));
        entry["input_shapes"].push_back(std::move(e.Shape));
        entry["input_types"].push_back(std::move(e.Type));
    }
    for (const auto& out : outputs) {
        Encoded e = encode_tensor(out);
        entry["outputs"].push_back(std::move(e.Value));
        entry["output_shapes"].push_back(std::move(e.Shape));
        entry["output_types"].push_back(std::move(e.Type));
    }
    mNodes.push_back(std::move(entry));
}

nlohmann::json TraceObserver::to_json() const {
    return nlohmann::json{
        {"schema", kSchemaVersion},
        {"nodes", mNodes},
    };
}

void TraceObserver::write(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open trace file {} for writing", path));
    }
    file << to_json().dump(2) << "\n";
}

} // namespace replay
