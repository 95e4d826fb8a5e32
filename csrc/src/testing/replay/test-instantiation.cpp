// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "runtime/ops/split_embedding.h"
#include "runtime/replay/subgraph_extractor.h"
#include "runtime/replay/tensor_generators.h"
#include "runtime/replay/tensor_identity.h"
#include "runtime/replay/tensor_instantiator.h"
#include "runtime/replay/tensor_registry.h"
#include "trace/element_types.h"
#include "testing/utilities/test_config.h"
#include "testing/utilities/test_utils.h"

using namespace replay;
using testing_utils::TraceBuilder;
using testing_utils::TraceArg;
using testing_utils::tensor;
using testing_utils::tensor_with_id;
using testing_utils::scalar;
using testing_utils::none;
using testing_utils::to_vector;

namespace {

struct Prepared {
    ExecutionGraph Graph;
    ReplaySubgraph Subgraph;
    TensorBindings Bindings;
};

Prepared prepare(const TraceBuilder& b) {
    Prepared p{b.graph(), {}, {}};
    p.Subgraph = extract_subgraph(p.Graph, default_skip_node_names(), nullptr);
    p.Bindings = resolve_tensor_identities(p.Subgraph);
    return p;
}

ReplaySlot slot_of(const Prepared& p, std::int64_t node, const TraceArg& arg) {
    const auto& v = arg.Value;
    TensorId id{v[0].get<std::int64_t>(), v[1].get<std::int64_t>(), v[2].get<std::int64_t>(),
                v[3].get<std::int64_t>(), v[4].get<std::int64_t>()};
    auto slot = p.Bindings.slot_for(node, id);
    REQUIRE(slot.has_value());
    return *slot;
}

} // namespace

TEST_CASE("TensorGenerator: recorded shape and dtype, deterministic per seed", "[replay][instantiation]") {
    TensorAllocator alloc;
    const auto seed = testing_config::get_test_config().Seed;
    TensorGenerator g1(seed);
    TensorGenerator g2(seed);

    auto a = g1.generate(alloc, "float", {3, 5}, "a");
    auto b = g2.generate(alloc, "float", {3, 5}, "b");
    REQUIRE(a);
    REQUIRE(a->is_host());
    REQUIRE(a->DType == ETensorDType::FP32);
    REQUIRE(a->shape() == std::vector<long>{3, 5});
    REQUIRE(to_vector<float>(*a) == to_vector<float>(*b));

    auto ids = g1.generate(alloc, "long int", {4}, "ids");
    REQUIRE(ids->DType == ETensorDType::INT64);
    REQUIRE(to_vector<std::int64_t>(*ids) == std::vector<std::int64_t>{1, 1, 1, 1});

    auto half = g1.generate(alloc, "c10::Half", {2}, "half");
    REQUIRE(half->DType == ETensorDType::FP16);
    REQUIRE(reinterpret_cast<const std::uint16_t*>(half->Data)[0] == 0x3C00);

    REQUIRE(g1.generate(alloc, "c10::complex<float>", {2}, "complex") == nullptr);
}

TEST_CASE("instantiate_tensors: only instantiate-set inputs are materialized", "[replay][instantiation]") {
    TraceBuilder b;
    b.op(2, 1, "aten::mm", {tensor(10, {2, 3}), tensor(11, {3, 2})}, {tensor(12, {2, 2})})
     .op(3, 1, "aten::relu", {tensor(12, {2, 2})}, {tensor(13, {2, 2})})
     .op(4, 1, "aten::sum", {tensor(13, {2, 2})}, {tensor(14, {})});
    auto p = prepare(b);

    TensorAllocator alloc;
    TensorRegistry registry;
    TensorGenerator gen(1);
    auto stats = instantiate_tensors(p.Subgraph, p.Bindings, registry, gen, alloc);

    REQUIRE(stats.Materialized == 2);
    REQUIRE(stats.NullBound == 0);
    REQUIRE(stats.Bytes == 2 * 6 * sizeof(float));
    REQUIRE(stats.Warnings.empty());
    REQUIRE(registry.permanent_size() == 2);
    REQUIRE(registry.permanent_bytes() == stats.Bytes);

    REQUIRE(registry.has_permanent(slot_of(p, 2, tensor(10, {2, 3}))));
    REQUIRE(registry.permanent(slot_of(p, 2, tensor(11, {3, 2})))->shape() == std::vector<long>{3, 2});
    REQUIRE_FALSE(registry.has_permanent(slot_of(p, 3, tensor(12, {2, 2}))));
    REQUIRE_THROWS_AS(registry.permanent(slot_of(p, 3, tensor(12, {2, 2}))), std::out_of_range);
    REQUIRE(registry.num_unchangeable() == 0);
}

TEST_CASE("instantiate_tensors: embedding_bag inputs are eager, unchangeable, with uniform offsets", "[replay][instantiation]") {
    // offsets 20 are produced by an earlier node, yet still materialized for the bag op
    TraceBuilder b;
    b.op(2, 1, "aten::relu", {tensor(19, {4}, "long int")}, {tensor(20, {4}, "long int")})
     .op(3, 1, "aten::embedding_bag",
         {tensor(21, {10, 4}), tensor(22, {12}, "long int"), tensor(20, {4}, "long int"), scalar(false, "Bool"),
          scalar(0, "Int"), scalar(false, "Bool"), none(), scalar(false, "Bool")},
         {tensor(23, {4, 4}), tensor(24, {12}, "long int"), tensor(25, {4}, "long int"), tensor(26, {4}, "long int")})
     .op(4, 1, "aten::sum", {tensor(23, {4, 4})}, {tensor(27, {})});
    auto p = prepare(b);

    TensorAllocator alloc;
    TensorRegistry registry;
    TensorGenerator gen(7);
    auto stats = instantiate_tensors(p.Subgraph, p.Bindings, registry, gen, alloc);

    const ReplaySlot weight = slot_of(p, 3, tensor(21, {10, 4}));
    const ReplaySlot indices = slot_of(p, 3, tensor(22, {12}, "long int"));
    const ReplaySlot offsets = slot_of(p, 3, tensor(20, {4}, "long int"));
    for (ReplaySlot s : {weight, indices, offsets}) {
        REQUIRE(registry.has_permanent(s));
        REQUIRE(registry.is_unchangeable(s));
    }
    REQUIRE(to_vector<std::int64_t>(*registry.permanent(offsets)) == std::vector<std::int64_t>{0, 3, 6, 9});
    // 19 (relu input) + the three bag inputs
    REQUIRE(stats.Materialized == 4);
    REQUIRE_FALSE(registry.is_unchangeable(slot_of(p, 2, tensor(19, {4}, "long int"))));
}

TEST_CASE("instantiate_tensors: pin_memory input is host resident", "[replay][instantiation]") {
    TraceBuilder b;
    b.op(2, 1, "aten::pin_memory", {tensor(30, {8}), none()}, {tensor(31, {8})})
     .op(3, 1, "aten::relu", {tensor(31, {8})}, {tensor(32, {8})});
    auto p = prepare(b);

    TensorAllocator alloc;
    TensorRegistry registry;
    TensorGenerator gen(1);
    instantiate_tensors(p.Subgraph, p.Bindings, registry, gen, alloc);

    REQUIRE(registry.is_host_resident(slot_of(p, 2, tensor(30, {8}))));
    REQUIRE(registry.num_host_resident() == 1);
}

TEST_CASE("instantiate_tensors: unknown element types bind null", "[replay][instantiation]") {
    TraceBuilder b;
    b.op(2, 1, "aten::add", {tensor(40, {2}, "c10::complex<float>"), tensor_with_id({41, 41, 0, 2, 4}, {2}, std::string(kUninitializedElemType))},
         {tensor(42, {2})})
     .op(3, 1, "aten::relu", {tensor(42, {2})}, {tensor(43, {2})});
    auto p = prepare(b);

    TensorAllocator alloc;
    TensorRegistry registry;
    TensorGenerator gen(1);
    auto stats = instantiate_tensors(p.Subgraph, p.Bindings, registry, gen, alloc);

    REQUIRE(stats.Materialized == 0);
    REQUIRE(stats.NullBound == 2);
    // the uninitialized marker is expected and not reported
    REQUIRE(stats.Warnings.size() == 1);
    REQUIRE(stats.Warnings[0].find("c10::complex<float>") != std::string::npos);

    const ReplaySlot s = slot_of(p, 2, tensor(40, {2}, "c10::complex<float>"));
    REQUIRE(registry.has_permanent(s));
    REQUIRE(registry.permanent(s) == nullptr);
    REQUIRE(registry.permanent_bytes() == 0);
}

TEST_CASE("TensorGenerator: structured split embedding inputs", "[replay][instantiation][split_embedding]") {
    // T = 2 tables, E = 10 rows, D = 4, B = 3 bags, L = 2 indices per bag
    TraceBuilder b;
    b.op(2, 1, "fbgemm::split_embedding_codegen_lookup_sgd_function",
         {tensor(50, {80}), tensor(51, {2}, "long int"), tensor(52, {3}, "int"), scalar(8, "Int"), scalar(4, "Int"),
          tensor(53, {12}, "long int"), tensor(54, {7}, "long int"), scalar(0, "Int"), none(), scalar(0.1, "Double")},
         {tensor(55, {3, 8})});
    auto graph = b.graph();
    const auto& node = graph.node(2);

    auto cfg = split_embedding_config(node);
    REQUIRE(cfg.T == 2);
    REQUIRE(cfg.D == 4);
    REQUIRE(cfg.E == 10);
    REQUIRE(cfg.B == 3);
    REQUIRE(cfg.N == 12);
    REQUIRE(cfg.L == 2);
    REQUIRE_FALSE(cfg.Weighted);

    TensorAllocator alloc;
    TensorGenerator gen(3);
    auto inputs = gen.split_embedding_inputs(alloc, node);
    using namespace split_embedding_args;
    REQUIRE(inputs.size() == 5);
    REQUIRE(to_vector<std::int64_t>(*inputs.at(kWeightsOffsets)) == std::vector<std::int64_t>{0, 40});
    REQUIRE(to_vector<std::int32_t>(*inputs.at(kDOffsets)) == std::vector<std::int32_t>{0, 4, 8});
    REQUIRE(to_vector<std::int64_t>(*inputs.at(kOffsets)) == std::vector<std::int64_t>{0, 2, 4, 6, 8, 10, 12});
    auto idx = to_vector<std::int64_t>(*inputs.at(kIndices));
    REQUIRE(idx.size() == 12);
    REQUIRE(std::all_of(idx.begin(), idx.end(), [](std::int64_t i) { return i >= 0 && i < 10; }));
    REQUIRE(inputs.at(kDevWeights)->DType == ETensorDType::FP32);
    REQUIRE_FALSE(inputs.contains(kIndiceWeights));
}

TEST_CASE("TensorRegistry: host reset shares permanent buffers", "[replay][instantiation]") {
    TensorAllocator alloc;
    OpContext ctx{alloc, -1, nullptr, nullptr};
    TensorRegistry registry;
    auto t = testing_utils::host_tensor<float>(alloc, {1.f, 2.f}, {2});
    registry.bind_permanent(1, t);
    registry.bind_permanent(2, nullptr);

    registry.reset(ctx);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.get(1) == t);
    REQUIRE(registry.get(2) == nullptr);
    REQUIRE(registry.get(3) == nullptr);

    registry.set(1, testing_utils::host_tensor<float>(alloc, {5.f, 6.f}, {2}));
    REQUIRE(registry.get(1) != t);
    registry.reset(ctx);
    REQUIRE(registry.get(1) == t);
}
