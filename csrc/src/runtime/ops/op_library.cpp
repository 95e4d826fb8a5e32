// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/ops/op_library.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "utilities/utils.h"

namespace replay {

bool OpValue::is_null() const {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* t = std::get_if<TensorPtr>(&value)) {
        return !*t;
    }
    return false;
}

std::string describe(const OpValue& v) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "None"; }
        std::string operator()(bool b) const { return b ? "True" : "False"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return fmt::format("{}", d); }
        std::string operator()(const std::string& s) const { return "'" + s + "'"; }
        std::string operator()(const TensorPtr& t) const {
            if (!t) return "Tensor(null)";
            return fmt::format("Tensor({}, {}, {})", dtype_to_str(t->DType), shape_to_string(t->shape()),
                               t->is_host() ? std::string("cpu") : fmt::format("cuda:{}", t->Device));
        }
        std::string operator()(const TensorList& l) const { return fmt::format("TensorList[{}]", l.size()); }
        std::string operator()(const OpValue::ListPtr& l) const { return fmt::format("List[{}]", l ? l->size() : 0); }
    };
    return std::visit(Visitor{}, v.value);
}

void OperatorLibrary::add(const std::string& name, OpFunction fn, int output_count) {
    mByName[name] = OpCallable{std::move(fn), output_count, name};
}

void OperatorLibrary::add_schema(const std::string& schema, OpFunction fn, int output_count) {
    mBySchema[schema] = OpCallable{std::move(fn), output_count, schema};
}

std::optional<OpCallable> OperatorLibrary::lookup(const std::string& name, const std::string& schema) const {
    if (!schema.empty()) {
        if (auto it = mBySchema.find(schema); it != mBySchema.end()) {
            return it->second;
        }
    }
    if (auto it = mByName.find(name); it != mByName.end()) {
        return it->second;
    }
    return std::nullopt;
}

OperatorLibrary OperatorLibrary::with_builtins() {
    OperatorLibrary lib;
    register_elementwise_ops(lib);
    register_matmul_ops(lib);
    register_reduction_ops(lib);
    register_embedding_bag_ops(lib);
    register_data_movement_ops(lib);
    return lib;
}

const TensorPtr& tensor_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op) {
    if (idx >= args.size()) {
        throw std::invalid_argument(fmt::format("{}: missing tensor argument {}", op, idx));
    }
    const auto* t = std::get_if<TensorPtr>(&args[idx].value);
    if (!t) {
        throw std::invalid_argument(fmt::format("{}: argument {} must be a tensor, got {}", op, idx, describe(args[idx])));
    }
    if (!*t) {
        throw std::invalid_argument(fmt::format("{}: tensor argument {} is null", op, idx));
    }
    return *t;
}

TensorPtr optional_tensor_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op) {
    if (idx >= args.size() || std::holds_alternative<std::monostate>(args[idx].value)) {
        return nullptr;
    }
    const auto* t = std::get_if<TensorPtr>(&args[idx].value);
    if (!t) {
        throw std::invalid_argument(fmt::format("{}: argument {} must be a tensor or None, got {}", op, idx, describe(args[idx])));
    }
    return *t;
}

double number_arg(const std::vector<OpValue>& args, std::size_t idx, double fallback, const char* op) {
    if (idx >= args.size() || std::holds_alternative<std::monostate>(args[idx].value)) {
        return fallback;
    }
    const auto& v = args[idx].value;
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    throw std::invalid_argument(fmt::format("{}: argument {} must be a number, got {}", op, idx, describe(args[idx])));
}

std::int64_t int_arg(const std::vector<OpValue>& args, std::size_t idx, std::int64_t fallback, const char* op) {
    if (idx >= args.size() || std::holds_alternative<std::monostate>(args[idx].value)) {
        return fallback;
    }
    const auto& v = args[idx].value;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return *i;
    if (const auto* b = std::get_if<bool>(&v)) return *b ? 1 : 0;
    throw std::invalid_argument(fmt::format("{}: argument {} must be an integer, got {}", op, idx, describe(args[idx])));
}

bool bool_arg(const std::vector<OpValue>& args, std::size_t idx, bool fallback, const char* op) {
    if (idx >= args.size() || std::holds_alternative<std::monostate>(args[idx].value)) {
        return fallback;
    }
    const auto& v = args[idx].value;
    if (const auto* b = std::get_if<bool>(&v)) return *b;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return *i != 0;
    throw std::invalid_argument(fmt::format("{}: argument {} must be a bool, got {}", op, idx, describe(args[idx])));
}

std::vector<std::int64_t> int_list_arg(const std::vector<OpValue>& args, std::size_t idx, const char* op) {
    std::vector<std::int64_t> out;
    if (idx >= args.size() || std::holds_alternative<std::monostate>(args[idx].value)) {
        return out;
    }
    const auto& v = args[idx].value;
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        out.push_back(*i);
        return out;
    }
    const auto* list = std::get_if<OpValue::ListPtr>(&v);
    if (!list || !*list) {
        throw std::invalid_argument(fmt::format("{}: argument {} must be an integer list, got {}", op, idx, describe(args[idx])));
    }
    for (std::size_t j = 0; j < (*list)->size(); ++j) {
        out.push_back(int_arg(**list, j, 0, op));
    }
    return out;
}

TensorPtr index_tensor_arg(OpContext& ctx, const std::vector<OpValue>& args, std::size_t idx, const char* op) {
    const TensorPtr& t = tensor_arg(args, idx, op);
    if (t->DType == ETensorDType::INT64) {
        return t;
    }
    if (t->DType != ETensorDType::INT32) {
        throw std::invalid_argument(fmt::format("{}: argument {} must be an int64 or int32 tensor, got {}", op, idx, describe(args[idx])));
    }
    TensorPtr wide = allocate_output(ctx, ETensorDType::INT64, t->shape(), *t, op);
    widen_indices(*wide, *t, ctx.Stream);
    return wide;
}

std::vector<std::int64_t> read_index_values(OpContext& ctx, const Tensor& t) {
    std::vector<std::int64_t> values(t.nelem());
    if (values.empty()) {
        return values;
    }
    const std::int64_t* src = t.get<std::int64_t>();
    if (t.is_host()) {
        std::copy(src, src + values.size(), values.begin());
    } else {
        CUDA_CHECK(cudaMemcpyAsync(values.data(), src, t.bytes(), cudaMemcpyDeviceToHost, ctx.Stream));
        CUDA_CHECK(cudaStreamSynchronize(ctx.Stream));
    }
    return values;
}

void check_index_range(const std::vector<std::int64_t>& indices, long num_rows, const char* op) {
    for (std::int64_t i : indices) {
        if (i < 0 || i >= num_rows) {
            throw std::invalid_argument(fmt::format("{}: index {} out of range for {} rows", op, i, num_rows));
        }
    }
}

void check_offsets(const std::vector<std::int64_t>& offsets, long num_indices, const char* op) {
    std::int64_t prev = 0;
    for (std::size_t b = 0; b < offsets.size(); ++b) {
        if (offsets[b] < prev || offsets[b] > num_indices) {
            throw std::invalid_argument(fmt::format("{}: offset {} at position {} is not within [{}, {}]",
                                                    op, offsets[b], b, prev, num_indices));
        }
        prev = offsets[b];
    }
}

TensorPtr allocate_output(OpContext& ctx, ETensorDType dtype, const std::vector<long>& shape,
                          const Tensor& placement, const char* name) {
    const EAllocationType kind = placement.is_host() ? EAllocationType::ON_HOST : EAllocationType::ON_DEVICE;
    return ctx.Allocator.allocate(dtype, name, kind, shape);
}

} // namespace replay
