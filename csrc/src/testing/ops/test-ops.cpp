// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Host-side checks of the built-in operators.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "runtime/ops/op_library.h"
#include "runtime/ops/split_embedding.h"
#include "testing/utilities/test_utils.h"

using namespace replay;
using Catch::Approx;
using testing_utils::host_tensor;
using testing_utils::to_vector;
using testing_utils::as_tensor;

namespace {

struct HostOps {
    TensorAllocator Allocator;
    OpContext Ctx{Allocator, -1, nullptr, nullptr};
    OperatorLibrary Library = OperatorLibrary::with_builtins();

    std::vector<OpValue> call(const std::string& name, std::vector<OpValue> args) {
        auto op = Library.lookup(name, "");
        REQUIRE(op.has_value());
        return op->Fn(Ctx, args);
    }

    TensorPtr floats(const std::vector<float>& v, const std::vector<long>& shape) {
        return host_tensor<float>(Allocator, v, shape);
    }

    TensorPtr longs(const std::vector<std::int64_t>& v, const std::vector<long>& shape) {
        return host_tensor<std::int64_t>(Allocator, v, shape);
    }
};

OpValue int_list(std::initializer_list<std::int64_t> values) {
    auto list = std::make_shared<OpList>();
    for (auto v : values) list->emplace_back(v);
    return OpValue{list};
}

void require_close(const std::vector<float>& actual, const std::vector<float>& expected) {
    REQUIRE(actual.size() == expected.size());
    for (std::size_t i = 0; i < actual.size(); ++i) {
        REQUIRE(actual[i] == Approx(expected[i]).margin(1e-5));
    }
}

} // namespace

TEST_CASE("OperatorLibrary: schema entries win over name entries", "[ops]") {
    OperatorLibrary lib;
    lib.add("aten::foo", [](OpContext&, std::vector<OpValue>&) { return std::vector<OpValue>{std::int64_t{1}}; }, 1);
    lib.add_schema("aten::foo.bar(Tensor self) -> Tensor",
                   [](OpContext&, std::vector<OpValue>&) { return std::vector<OpValue>{std::int64_t{2}}; }, 1);
    REQUIRE(lib.size() == 2);

    REQUIRE(lib.lookup("aten::foo", "aten::foo.bar(Tensor self) -> Tensor")->Name == "aten::foo.bar(Tensor self) -> Tensor");
    REQUIRE(lib.lookup("aten::foo", "aten::foo.baz(Tensor self) -> Tensor")->Name == "aten::foo");
    REQUIRE(lib.lookup("aten::foo", "")->OutputCount == 1);
    REQUIRE_FALSE(lib.lookup("aten::nope", "").has_value());

    auto builtins = OperatorLibrary::with_builtins();
    for (const char* name : {"aten::add", "aten::mul", "aten::relu", "aten::threshold_backward", "aten::mm", "aten::addmm",
                             "aten::linear", "aten::t", "aten::sum", "aten::embedding_bag", "aten::to", "aten::pin_memory"}) {
        REQUIRE(builtins.lookup(name, "").has_value());
    }
    REQUIRE(builtins.lookup("aten::embedding_bag", "")->OutputCount == 4);
}

TEST_CASE("argument helpers reject mismatched values", "[ops]") {
    std::vector<OpValue> args = {OpValue{}, std::string("cpu"), std::int64_t{3}, true, 2.5};
    REQUIRE_THROWS_AS(tensor_arg(args, 0, "op"), std::invalid_argument);
    REQUIRE_THROWS_AS(tensor_arg(args, 1, "op"), std::invalid_argument);
    REQUIRE_THROWS_AS(tensor_arg(args, 9, "op"), std::invalid_argument);
    REQUIRE(optional_tensor_arg(args, 0, "op") == nullptr);
    REQUIRE(int_arg(args, 2, 0, "op") == 3);
    REQUIRE(int_arg(args, 3, 0, "op") == 1);
    REQUIRE(int_arg(args, 7, 11, "op") == 11);
    REQUIRE_THROWS_AS(int_arg(args, 4, 0, "op"), std::invalid_argument);
    REQUIRE(number_arg(args, 4, 0.0, "op") == 2.5);
    REQUIRE(bool_arg(args, 3, false, "op"));
    REQUIRE(int_list_arg(args, 2, "op") == std::vector<std::int64_t>{3});
    REQUIRE(describe(args[0]) == "None");
    REQUIRE(describe(args[1]) == "'cpu'");
}

TEST_CASE("elementwise operators", "[ops]") {
    HostOps ops;
    auto a = ops.floats({1.f, -2.f, 3.f, -4.f}, {2, 2});
    auto row = ops.floats({10.f, 20.f}, {2});

    require_close(to_vector<float>(*as_tensor(ops.call("aten::add", {a, row})[0])), {11.f, 18.f, 13.f, 16.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::add", {a, row, 2.0})[0])), {21.f, 38.f, 23.f, 36.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::add", {a, 1.5, std::int64_t{2}})[0])), {4.f, 1.f, 6.f, -1.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::mul", {a, row})[0])), {10.f, -40.f, 30.f, -80.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::mul", {row, a})[0])), {10.f, -40.f, 30.f, -80.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::mul", {a, -1.0})[0])), {-1.f, 2.f, -3.f, 4.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::relu", {a})[0])), {1.f, 0.f, 3.f, 0.f});

    auto grad = ops.floats({5.f, 5.f, 5.f, 5.f}, {2, 2});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::threshold_backward", {grad, a, 0.0})[0])), {5.f, 0.f, 5.f, 0.f});

    // a scaled right operand may not be the larger one
    REQUIRE_THROWS_AS(ops.call("aten::add", {row, a, 2.0}), std::invalid_argument);

    auto out = as_tensor(ops.call("aten::relu", {a})[0]);
    REQUIRE(out->is_host());
    REQUIRE(out->shape() == std::vector<long>{2, 2});
    REQUIRE(out->Data != a->Data);
}

TEST_CASE("matmul operators", "[ops]") {
    HostOps ops;
    auto a = ops.floats({1.f, 2.f, 3.f, 4.f, 5.f, 6.f}, {2, 3});
    auto b = ops.floats({1.f, 0.f, 0.f, 1.f, 1.f, 1.f}, {3, 2});
    auto bias = ops.floats({100.f, 200.f}, {2});

    auto mm = as_tensor(ops.call("aten::mm", {a, b})[0]);
    REQUIRE(mm->shape() == std::vector<long>{2, 2});
    require_close(to_vector<float>(*mm), {4.f, 5.f, 10.f, 11.f});

    auto addmm = as_tensor(ops.call("aten::addmm", {bias, a, b, std::int64_t{1}, 2.0})[0]);
    require_close(to_vector<float>(*addmm), {108.f, 210.f, 120.f, 222.f});

    // linear multiplies with the transposed weight [out_features, in_features]
    auto weight = ops.floats({1.f, 0.f, 0.f, 1.f, 1.f, 1.f}, {2, 3});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::linear", {a, weight, bias})[0])), {101.f, 206.f, 104.f, 215.f});
    require_close(to_vector<float>(*as_tensor(ops.call("aten::linear", {a, weight, OpValue{}})[0])), {1.f, 6.f, 4.f, 15.f});

    auto t = as_tensor(ops.call("aten::t", {a})[0]);
    REQUIRE(t->shape() == std::vector<long>{3, 2});
    require_close(to_vector<float>(*t), {1.f, 4.f, 2.f, 5.f, 3.f, 6.f});
    auto t1 = as_tensor(ops.call("aten::t", {bias})[0]);
    REQUIRE(t1->Data != bias->Data);
    require_close(to_vector<float>(*t1), {100.f, 200.f});

    REQUIRE_THROWS_AS(ops.call("aten::mm", {a, a}), std::invalid_argument);
}

TEST_CASE("sum reduction", "[ops]") {
    HostOps ops;
    auto x = ops.floats({1.f, 2.f, 3.f, 4.f, 5.f, 6.f}, {2, 3});

    auto all = as_tensor(ops.call("aten::sum", {x})[0]);
    REQUIRE(all->Rank == 0);
    REQUIRE(all->get<float>()[0] == Approx(21.f));

    auto rows = as_tensor(ops.call("aten::sum", {x, int_list({1}), false})[0]);
    REQUIRE(rows->shape() == std::vector<long>{2});
    require_close(to_vector<float>(*rows), {6.f, 15.f});

    auto cols = as_tensor(ops.call("aten::sum", {x, int_list({0}), true, OpValue{}})[0]);
    REQUIRE(cols->shape() == std::vector<long>{1, 3});
    require_close(to_vector<float>(*cols), {5.f, 7.f, 9.f});

    auto last = as_tensor(ops.call("aten::sum", {x, int_list({-1}), false})[0]);
    require_close(to_vector<float>(*last), {6.f, 15.f});

    REQUIRE_THROWS_AS(ops.call("aten::sum", {x, int_list({2}), false}), std::invalid_argument);
}

TEST_CASE("embedding_bag", "[ops]") {
    HostOps ops;
    auto weight = ops.floats({0.f, 0.f, 1.f, 1.f, 2.f, 4.f, 3.f, 9.f}, {4, 2});
    auto indices = ops.longs({1, 2, 3, 0, 2}, {5});
    auto offsets = ops.longs({0, 3}, {2});

    SECTION("sum") {
        auto out = ops.call("aten::embedding_bag", {weight, indices, offsets, false, std::int64_t{0}, false, OpValue{}, false});
        REQUIRE(out.size() == 4);
        require_close(to_vector<float>(*as_tensor(out[0])), {6.f, 14.f, 2.f, 4.f});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[1])) == std::vector<std::int64_t>{0, 0, 0, 1, 1});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[2])) == std::vector<std::int64_t>{3, 2});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[3])) == std::vector<std::int64_t>{0, 0});
    }
    SECTION("mean") {
        auto out = ops.call("aten::embedding_bag", {weight, indices, offsets, false, std::int64_t{1}, false, OpValue{}, false});
        require_close(to_vector<float>(*as_tensor(out[0])), {2.f, 14.f / 3.f, 1.f, 2.f});
    }
    SECTION("per sample weights") {
        auto psw = ops.floats({1.f, 0.5f, 0.f, 2.f, 1.f}, {5});
        auto out = ops.call("aten::embedding_bag", {weight, indices, offsets, false, std::int64_t{0}, false, psw, false});
        require_close(to_vector<float>(*as_tensor(out[0])), {2.f, 3.f, 2.f, 4.f});
    }
    SECTION("include last offset") {
        auto offsets3 = ops.longs({0, 3, 5}, {3});
        auto out = ops.call("aten::embedding_bag", {weight, indices, offsets3, false, std::int64_t{0}, false, OpValue{}, true});
        REQUIRE(as_tensor(out[0])->shape() == std::vector<long>{2, 2});
        require_close(to_vector<float>(*as_tensor(out[0])), {6.f, 14.f, 2.f, 4.f});
    }
    SECTION("the last offset ends the last bag") {
        auto offsets3 = ops.longs({0, 2, 4}, {3});
        auto out = ops.call("aten::embedding_bag", {weight, indices, offsets3, false, std::int64_t{0}, false, OpValue{}, true});
        require_close(to_vector<float>(*as_tensor(out[0])), {3.f, 5.f, 3.f, 9.f});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[1])) == std::vector<std::int64_t>{0, 0, 1, 1, 0});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[2])) == std::vector<std::int64_t>{2, 2});
    }
    SECTION("int32 indices and offsets") {
        auto indices32 = host_tensor<std::int32_t>(ops.Allocator, {1, 2, 3, 0, 2}, {5});
        auto offsets32 = host_tensor<std::int32_t>(ops.Allocator, {0, 3}, {2});
        auto out = ops.call("aten::embedding_bag", {weight, indices32, offsets32, false, std::int64_t{0}, false, OpValue{}, false});
        require_close(to_vector<float>(*as_tensor(out[0])), {6.f, 14.f, 2.f, 4.f});
        REQUIRE(to_vector<std::int64_t>(*as_tensor(out[2])) == std::vector<std::int64_t>{3, 2});
    }
    SECTION("malformed offsets") {
        auto descending = ops.longs({3, 0}, {2});
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, indices, descending, false, std::int64_t{0}, false, OpValue{}, false}),
                          std::invalid_argument);
        auto past_end = ops.longs({0, 6}, {2});
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, indices, past_end, false, std::int64_t{0}, false, OpValue{}, false}),
                          std::invalid_argument);
        auto floats = ops.floats({0.f, 3.f}, {2});
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, indices, floats, false, std::int64_t{0}, false, OpValue{}, false}),
                          std::invalid_argument);
    }
    SECTION("invalid arguments") {
        auto out_of_range = ops.longs({1, 7, 0, 0, 0}, {5});
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, out_of_range, offsets, false, std::int64_t{0}, false, OpValue{}, false}),
                          std::invalid_argument);
        auto bad = ops.longs({1, 7}, {2});
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, bad, offsets, false, std::int64_t{0}, false, OpValue{}, false}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(ops.call("aten::embedding_bag", {weight, indices, offsets, false, std::int64_t{2}, false, OpValue{}, false}),
                          std::invalid_argument);
    }
}

TEST_CASE("data movement operators on the host", "[ops]") {
    HostOps ops;
    auto x = ops.floats({1.f, 2.f}, {2});

    // without a device, a move to cuda stays on the host
    REQUIRE(as_tensor(ops.call("aten::to", {x, std::string("cuda:0")})[0]) == x);
    REQUIRE(as_tensor(ops.call("aten::to", {x, std::string("cpu")})[0]) == x);
    REQUIRE(as_tensor(ops.call("aten::to", {x, std::int64_t{6}, false})[0]) == x);

    auto pinned = as_tensor(ops.call("aten::pin_memory", {x, OpValue{}})[0]);
    REQUIRE(pinned->is_host());
    REQUIRE(pinned->Data != x->Data);
    REQUIRE(to_vector<float>(*pinned) == std::vector<float>{1.f, 2.f});

    REQUIRE(move_to_placement(ops.Ctx, x, true) == x);
    REQUIRE(move_to_placement(ops.Ctx, nullptr, false) == nullptr);
}

TEST_CASE("split embedding: config and naming", "[ops][split_embedding]") {
    REQUIRE(split_embedding_forward_variant("fbgemm::split_embedding_codegen_lookup_sgd_function") == ETableOptimizer::SGD);
    REQUIRE(split_embedding_forward_variant("fbgemm::split_embedding_codegen_lookup_adagrad_function") == ETableOptimizer::ADAGRAD);
    REQUIRE_FALSE(split_embedding_forward_variant("fbgemm::split_embedding_codegen_lookup_rowwise_adam_function").has_value());
    REQUIRE(split_embedding_backward_variant("CppNode<SplitLookupFunction_adagrad_Op>") == ETableOptimizer::ADAGRAD);
    REQUIRE_FALSE(split_embedding_backward_variant("CppNode<SplitLookupFunction__Op>").has_value());
    REQUIRE_FALSE(split_embedding_backward_variant("aten::mm").has_value());
    REQUIRE(std::string(table_optimizer_to_str(ETableOptimizer::SGD)) == "sgd");
}

TEST_CASE("split embedding: forward pools, backward updates the looked-up rows", "[ops][split_embedding]") {
    HostOps ops;
    SplitEmbeddingConfig cfg;
    cfg.T = 2;
    cfg.D = 2;
    cfg.E = 3;
    cfg.B = 2;
    cfg.N = 5;
    cfg.L = 1;
    cfg.LearningRate = 0.5f;

    auto bags = std::make_shared<SplitEmbeddingBags>(cfg, ops.Ctx, 17);
    const auto initial = to_vector<float>(bags->weights());
    REQUIRE(initial.size() == 12);

    // table 0: bags {0, 1}, {2}; table 1: bags {}, {0, 2}
    auto indices = ops.longs({0, 1, 2, 0, 2}, {5});
    auto offsets = ops.longs({0, 2, 3, 3, 5}, {5});
    std::vector<OpValue> fwd_args = {indices, offsets, OpValue{}};
    auto out = as_tensor(bags->forward(ops.Ctx, fwd_args)[0]);
    REQUIRE(out->shape() == std::vector<long>{2, 4});

    auto w = [&](int t, int row, int d) { return initial[(t * 3 + row) * 2 + d]; };
    require_close(to_vector<float>(*out), {
        w(0, 0, 0) + w(0, 1, 0), w(0, 0, 1) + w(0, 1, 1), 0.f, 0.f,
        w(0, 2, 0), w(0, 2, 1), w(1, 0, 0) + w(1, 2, 0), w(1, 0, 1) + w(1, 2, 1),
    });

    auto grad = ops.floats({1.f, 1.f, 1.f, 1.f, 2.f, 2.f, 2.f, 2.f}, {2, 4});
    std::vector<OpValue> bwd_args = {grad};
    REQUIRE(bags->backward(ops.Ctx, bwd_args).empty());

    auto updated = to_vector<float>(bags->weights());
    // table 0 row 0 got the gradient of bag (0, 0): 1
    REQUIRE(updated[0] == Approx(initial[0] - 0.5f).margin(1e-6));
    // table 0 row 2 got the gradient of bag (0, 1): 2
    REQUIRE(updated[4] == Approx(initial[4] - 1.f).margin(1e-6));
    // table 1 row 1 was never looked up
    REQUIRE(updated[8] == initial[8]);
    REQUIRE(updated[9] == initial[9]);

    REQUIRE_THROWS_AS(bags->forward(ops.Ctx, bwd_args), std::invalid_argument);
}

TEST_CASE("split embedding: forward validates indices and offsets", "[ops][split_embedding]") {
    HostOps ops;
    SplitEmbeddingConfig cfg;
    cfg.T = 2;
    cfg.D = 2;
    cfg.E = 3;
    cfg.B = 2;
    cfg.N = 5;
    cfg.L = 1;
    auto bags = std::make_shared<SplitEmbeddingBags>(cfg, ops.Ctx, 17);
    auto offsets = ops.longs({0, 2, 3, 3, 5}, {5});

    SECTION("row past the table") {
        std::vector<OpValue> args = {ops.longs({0, 1, 3, 0, 2}, {5}), offsets, OpValue{}};
        REQUIRE_THROWS_AS(bags->forward(ops.Ctx, args), std::invalid_argument);
    }
    SECTION("negative row") {
        std::vector<OpValue> args = {ops.longs({0, -1, 2, 0, 2}, {5}), offsets, OpValue{}};
        REQUIRE_THROWS_AS(bags->forward(ops.Ctx, args), std::invalid_argument);
    }
    SECTION("offsets past the indices") {
        std::vector<OpValue> args = {ops.longs({0, 1, 2, 0, 2}, {5}), ops.longs({0, 2, 3, 3, 9}, {5}), OpValue{}};
        REQUIRE_THROWS_AS(bags->forward(ops.Ctx, args), std::invalid_argument);
    }
    SECTION("int32 inputs match int64 inputs") {
        std::vector<OpValue> int64_args = {ops.longs({0, 1, 2, 0, 2}, {5}), offsets, OpValue{}};
        const auto expected = to_vector<float>(*as_tensor(bags->forward(ops.Ctx, int64_args)[0]));
        std::vector<OpValue> int32_args = {host_tensor<std::int32_t>(ops.Allocator, {0, 1, 2, 0, 2}, {5}),
                                       host_tensor<std::int32_t>(ops.Allocator, {0, 2, 3, 3, 5}, {5}), OpValue{}};
        require_close(to_vector<float>(*as_tensor(bags->forward(ops.Ctx, int32_args)[0])), expected);
    }
}

TEST_CASE("split embedding: backward before forward is an error", "[ops][split_embedding]") {
    HostOps ops;
    SplitEmbeddingConfig cfg;
    cfg.Optimizer = ETableOptimizer::ADAGRAD;
    auto bags = std::make_shared<SplitEmbeddingBags>(cfg, ops.Ctx, 1);
    std::vector<OpValue> args = {ops.floats({1.f}, {1, 1})};
    REQUIRE_THROWS_AS(bags->backward(ops.Ctx, args), std::logic_error);

    auto callable = bags->backward_callable();
    REQUIRE(callable.OutputCount == 0);
    REQUIRE(callable.Name == "split_embedding_adagrad.backward");
}
