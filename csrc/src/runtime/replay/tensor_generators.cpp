// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/replay/tensor_generators.h"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "runtime/ops/split_embedding.h"
#include "trace/element_types.h"
#include "trace/execution_graph.h"

namespace replay {
namespace {

template<typename T>
void fill_value(Tensor& t, T value) {
    std::fill_n(reinterpret_cast<T*>(t.Data), t.nelem(), value);
}

void fill_ones(Tensor& t) {
    switch (t.DType) {
        case ETensorDType::FP32: fill_value<float>(t, 1.f); break;
        case ETensorDType::FP64: fill_value<double>(t, 1.0); break;
        // IEEE half and bfloat16 encodings of 1.0
        case ETensorDType::FP16: fill_value<std::uint16_t>(t, 0x3C00); break;
        case ETensorDType::BF16: fill_value<std::uint16_t>(t, 0x3F80); break;
        case ETensorDType::INT64: fill_value<std::int64_t>(t, 1); break;
        case ETensorDType::INT32: fill_value<std::int32_t>(t, 1); break;
        case ETensorDType::INT8: fill_value<std::int8_t>(t, 1); break;
        case ETensorDType::BYTE: fill_value<std::uint8_t>(t, 1); break;
        case ETensorDType::BOOL: fill_value<bool>(t, true); break;
    }
}

} // namespace

TensorGenerator::TensorGenerator(unsigned long long seed) : mGen(seed) {
}

TensorPtr TensorGenerator::generate(TensorAllocator& allocator, std::string_view elem_type, const std::vector<long>& shape,
                                    const char* name) {
    const ElementTypeInfo* info = find_element_type(elem_type);
    if (!info) {
        return nullptr;
    }

    TensorPtr t = allocator.allocate(info->DType, name, EAllocationType::ON_HOST, shape);
    if (info->Fill == EFillKind::Ones) {
        fill_ones(*t);
    } else if (t->DType == ETensorDType::FP64) {
        std::normal_distribution<double> dist(0.0, 1.0);
        std::generate_n(t->get<double>(), t->nelem(), [&] { return dist(mGen); });
    } else if (t->DType == ETensorDType::FP32) {
        std::normal_distribution<float> dist(0.f, 1.f);
        std::generate_n(t->get<float>(), t->nelem(), [&] { return dist(mGen); });
    } else {
        fill_ones(*t);
    }
    return t;
}

std::map<int, TensorPtr> TensorGenerator::split_embedding_inputs(TensorAllocator& allocator, const TraceNode& node) {
    namespace a = split_embedding_args;
    const SplitEmbeddingConfig cfg = split_embedding_config(node);

    std::map<int, TensorPtr> inputs;
    for (const auto& ref : node.input_tensors()) {
        if (ref.ListIndex >= 0 || inputs.contains(ref.ArgIndex)) {
            continue;
        }
        TensorPtr t;
        switch (ref.ArgIndex) {
            case a::kWeightsOffsets: {
                t = allocator.allocate(ETensorDType::INT64, "split_embedding.weights_offsets", EAllocationType::ON_HOST, ref.Shape);
                std::int64_t* off = t->get<std::int64_t>();
                for (std::size_t i = 0; i < t->nelem(); ++i) {
                    off[i] = static_cast<std::int64_t>(i) * cfg.E * cfg.D;
                }
                break;
            }
            case a::kDOffsets: {
                t = allocator.allocate(ETensorDType::INT32, "split_embedding.D_offsets", EAllocationType::ON_HOST, ref.Shape);
                std::int32_t* off = t->get<std::int32_t>();
                for (std::size_t i = 0; i < t->nelem(); ++i) {
                    off[i] = static_cast<std::int32_t>(i) * cfg.D;
                }
                break;
            }
            case a::kIndices: {
                t = allocator.allocate(ETensorDType::INT64, "split_embedding.indices", EAllocationType::ON_HOST, ref.Shape);
                std::uniform_int_distribution<std::int64_t> dist(0, cfg.E - 1);
                std::generate_n(t->get<std::int64_t>(), t->nelem(), [&] { return dist(mGen); });
                break;
            }
            case a::kOffsets: {
                t = allocator.allocate(ETensorDType::INT64, "split_embedding.offsets", EAllocationType::ON_HOST, ref.Shape);
                std::int64_t* off = t->get<std::int64_t>();
                const long n = static_cast<long>(t->nelem());
                for (long i = 0; i < n; ++i) {
                    off[i] = std::min(i * cfg.L, cfg.N);
                }
                off[n - 1] = cfg.N;
                break;
            }
            case a::kIndiceWeights: {
                t = allocator.allocate(ETensorDType::FP32, "split_embedding.per_sample_weights", EAllocationType::ON_HOST, ref.Shape);
                std::uniform_real_distribution<float> dist(0.f, 1.f);
                std::generate_n(t->get<float>(), t->nelem(), [&] { return dist(mGen); });
                break;
            }
            default:
                t = generate(allocator, ref.ElemType, ref.Shape, "split_embedding.input");
                break;
        }
        inputs[ref.ArgIndex] = std::move(t);
    }
    return inputs;
}

} // namespace replay
