// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <vector>

#include "runtime/replay/subgraph_extractor.h"
#include "runtime/replay/tensor_identity.h"
#include "testing/utilities/test_utils.h"

using namespace replay;
using testing_utils::TraceBuilder;
using testing_utils::tensor;
using testing_utils::tensor_with_id;
using testing_utils::scalar;

namespace {

TensorId tid(std::int64_t id, long numel) {
    return TensorId{id, id, 0, numel, 4};
}

std::set<ReplaySlot> distinct_slots(const TensorBindings& b) {
    std::set<ReplaySlot> slots;
    for (const auto& [key, slot] : b.Bindings) slots.insert(slot);
    return slots;
}

} // namespace

TEST_CASE("tensor identity: producer then consumer share one slot", "[replay][identity]") {
    // A: ones -> T1;  B: relu(T1) -> T2;  C: sum(T2)
    TraceBuilder b;
    b.op(2, 1, "aten::ones", {scalar(nlohmann::json::array({4}), "GenericList[Int]")}, {tensor(101, {4})})
     .op(3, 1, "aten::relu", {tensor(101, {4})}, {tensor(102, {4})})
     .op(4, 1, "aten::sum", {tensor(102, {4})}, {tensor(103, {})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto bindings = resolve_tensor_identities(sg);

    REQUIRE(bindings.NumSlots == 2);
    REQUIRE(distinct_slots(bindings).size() == 2);
    REQUIRE(bindings.Instantiate.empty());
    REQUIRE(sg.Nodes[0]->Id == 2);
    REQUIRE(sg.Nodes[1]->Id == 3);

    REQUIRE(bindings.slot_for(2, tid(101, 4)) == bindings.slot_for(3, tid(101, 4)));
    REQUIRE(bindings.slot_for(3, tid(102, 4)) == bindings.slot_for(4, tid(102, 4)));
    REQUIRE(bindings.slot_for(2, tid(101, 4)) != bindings.slot_for(3, tid(102, 4)));
}

TEST_CASE("tensor identity: a reused identifier with a new shape gets a new slot", "[replay][identity]") {
    // one identifier tuple recorded with two shapes
    const std::vector<std::int64_t> t1 = {101, 101, 0, 4, 4};
    TraceBuilder b;
    b.op(2, 1, "aten::ones", {}, {tensor_with_id(t1, {4})})
     .op(3, 1, "aten::relu", {tensor_with_id(t1, {4})}, {tensor(102, {4})})
     .op(4, 1, "aten::ones", {}, {tensor_with_id(t1, {8})})
     .op(5, 1, "aten::relu", {tensor_with_id(t1, {8})}, {tensor(103, {8})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto bindings = resolve_tensor_identities(sg);

    const TensorId id{101, 101, 0, 4, 4};
    auto s4 = bindings.slot_for(2, id);
    auto s8 = bindings.slot_for(4, id);
    REQUIRE(s4.has_value());
    REQUIRE(s8.has_value());
    REQUIRE(*s4 != *s8);
    REQUIRE(bindings.SlotShapes.at(*s4) == std::vector<long>{4});
    REQUIRE(bindings.SlotShapes.at(*s8) == std::vector<long>{8});
    REQUIRE(bindings.slot_for(3, id) == s4);
    REQUIRE(bindings.multi_shape_ids() == 1);
    REQUIRE(bindings.slot_for(5, id) == s8);
    REQUIRE(bindings.Instantiate.empty());
}

TEST_CASE("tensor identity: same identifier and shape always map to the same slot", "[replay][identity]") {
    // storage 200 shows up with two shapes under one TensorId (view-style reuse)
    auto j = TraceBuilder{}
        .op(2, 1, "aten::relu", {tensor(200, {2, 2})}, {tensor(201, {2, 2})})
        .op(3, 1, "aten::relu", {tensor(200, {4})}, {tensor(202, {4})})
        .op(4, 1, "aten::relu", {tensor(200, {2, 2})}, {tensor(203, {2, 2})})
        .json();
    auto graph = ExecutionGraph::from_json(j);
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto first = resolve_tensor_identities(sg);
    auto second = resolve_tensor_identities(sg);

    const TensorId id{200, 200, 0, 4, 4};
    REQUIRE(first.slot_for(2, id) == first.slot_for(4, id));
    REQUIRE(first.slot_for(2, id) != first.slot_for(3, id));
    REQUIRE(first.multi_shape_ids() == 1);
    REQUIRE(first.total_ids() == 1);
    REQUIRE(first.Bindings == second.Bindings);
    REQUIRE(first.NumSlots == second.NumSlots);
}

TEST_CASE("tensor identity: identifiers without qualified consumers are never bound", "[replay][identity]") {
    TraceBuilder b;
    b.op(2, 1, "aten::ones", {}, {tensor(101, {4})})
     .op(3, 1, "aten::relu", {tensor(101, {4})}, {tensor(102, {4})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto bindings = resolve_tensor_identities(sg);

    REQUIRE(sg.dependency_count(tid(102, 4)) == 0);
    REQUIRE_FALSE(bindings.slot_for(3, tid(102, 4)).has_value());
    REQUIRE(bindings.NumSlots == 1);
    for (const auto& [key, slot] : bindings.Bindings) {
        REQUIRE(sg.is_tracked(key.Tensor));
    }
}

TEST_CASE("tensor identity: slots read before being produced need instantiation", "[replay][identity]") {
    // weights (10, 11) are never produced; 12 is produced by mm before relu reads it;
    // 13 is read by add before the later in-place producer writes it
    TraceBuilder b;
    b.op(2, 1, "aten::mm", {tensor(10, {2, 3}), tensor(11, {3, 2})}, {tensor(12, {2, 2})})
     .op(3, 1, "aten::relu", {tensor(12, {2, 2})}, {tensor(14, {2, 2})})
     .op(4, 1, "aten::add", {tensor(14, {2, 2}), tensor(13, {2, 2})}, {tensor(15, {2, 2})})
     .op(5, 1, "aten::relu", {tensor(15, {2, 2})}, {tensor(13, {2, 2})})
     .op(6, 1, "aten::sum", {tensor(13, {2, 2})}, {tensor(16, {})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto bindings = resolve_tensor_identities(sg);

    auto slot = [&](std::int64_t node, std::int64_t id, long numel) { return *bindings.slot_for(node, tid(id, numel)); };
    REQUIRE(bindings.needs_instantiation(slot(2, 10, 6)));
    REQUIRE(bindings.needs_instantiation(slot(2, 11, 6)));
    REQUIRE_FALSE(bindings.needs_instantiation(slot(3, 12, 4)));
    REQUIRE_FALSE(bindings.needs_instantiation(slot(4, 14, 4)));
    REQUIRE(bindings.needs_instantiation(slot(4, 13, 4)));
    REQUIRE(bindings.Instantiate.size() == 3);

    // property: instantiate iff the first appearance in replay order is as an input
    std::set<ReplaySlot> seen;
    std::set<ReplaySlot> first_as_input;
    for (const TraceNode* node : sg.Nodes) {
        for (const auto& ref : node->input_tensors()) {
            if (auto s = bindings.slot_for(node->Id, ref.Id); s && seen.insert(*s).second) first_as_input.insert(*s);
        }
        for (const auto& ref : node->output_tensors()) {
            if (auto s = bindings.slot_for(node->Id, ref.Id)) seen.insert(*s);
        }
    }
    REQUIRE(std::set<ReplaySlot>(bindings.Instantiate.begin(), bindings.Instantiate.end()) == first_as_input);
}

TEST_CASE("tensor identity: skip-listed nodes never consume a slot", "[replay][identity]") {
    TraceBuilder b;
    b.label(2, 1, "DataLoader")
     .op(3, 2, "aten::relu", {tensor(300, {4})}, {tensor(301, {4})})
     .op(4, 1, "aten::relu", {tensor(302, {4})}, {tensor(303, {4})})
     .op(5, 1, "aten::add", {tensor(303, {4}), tensor(301, {4})}, {tensor(304, {4})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, default_skip_node_names(), nullptr);
    auto bindings = resolve_tensor_identities(sg);

    for (const auto& [key, slot] : bindings.Bindings) {
        REQUIRE(key.Node != 3);
    }
    // 301 is only produced inside the skipped scope, so add reads it before any producer
    REQUIRE(bindings.needs_instantiation(*bindings.slot_for(5, tid(301, 4))));
}

TEST_CASE("tensor identity: within one node the output shape owns a conflicting binding", "[replay][identity]") {
    TraceBuilder b;
    b.op(2, 1, "aten::ones", {}, {tensor(400, {4})})
     .op(3, 1, "aten::view", {tensor(400, {4}), scalar(nlohmann::json::array({2, 2}), "GenericList[Int]")}, {tensor(400, {2, 2})})
     .op(4, 1, "aten::relu", {tensor(400, {2, 2})}, {tensor(401, {2, 2})});
    auto graph = b.graph();
    auto sg = extract_subgraph(graph, {}, nullptr);
    auto bindings = resolve_tensor_identities(sg);

    const TensorId id{400, 400, 0, 4, 4};
    auto slot = bindings.slot_for(3, id);
    REQUIRE(slot.has_value());
    REQUIRE(bindings.SlotShapes.at(*slot) == std::vector<long>{2, 2});
    REQUIRE(bindings.ShapesById.at(id).size() == 2);
}
