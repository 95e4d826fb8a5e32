// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_GENERATORS_H
#define TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_GENERATORS_H

#include <map>
#include <random>
#include <string_view>
#include <vector>

#include "utilities/allocator.h"

namespace replay {

struct TraceNode;

/**
 * @brief Deterministic synthetic host tensors for instantiated slots.
 *
 * Floating point types are drawn from a standard normal distribution; integer,
 * boolean and half precision types are filled with ones.
 */
class TensorGenerator {
public:
    explicit TensorGenerator(unsigned long long seed);

    //! New host tensor of the recorded element type and shape, nullptr if the
    //! element type has no generator.
    TensorPtr generate(TensorAllocator& allocator, std::string_view elem_type, const std::vector<long>& shape,
                       const char* name);

    /**
     * @brief Structurally valid inputs for a recorded split-embedding forward call, keyed by argument index.
     *
     * Indices are uniform over the rows of a table, offsets split them into bags of
     * equal size. Tensor inputs without a structural role fall back to generate().
     *
     * @throws std::invalid_argument if the node's recorded geometry is inconsistent.
     */
    std::map<int, TensorPtr> split_embedding_inputs(TensorAllocator& allocator, const TraceNode& node);

private:
    std::mt19937_64 mGen;
};

} // namespace replay

#endif //TRACE_REPLAY_SRC_RUNTIME_REPLAY_TENSOR_GENERATORS_H
