// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Host reference implementations, used when replaying without a device.

#include <algorithm>
#include <cmath>

#include "kernels.h"

void add_broadcast_cpu(float* out, const float* a, const float* b, float alpha, long n, long nb) {
    for (long i = 0; i < n; ++i) {
        out[i] = a[i] + alpha * b[i % nb];
    }
}

void mul_broadcast_cpu(float* out, const float* a, const float* b, long n, long nb) {
    for (long i = 0; i < n; ++i) {
        out[i] = a[i] * b[i % nb];
    }
}

void add_scalar_cpu(float* out, const float* a, float s, long n) {
    for (long i = 0; i < n; ++i) {
        out[i] = a[i] + s;
    }
}

void mul_scalar_cpu(float* out, const float* a, float s, long n) {
    for (long i = 0; i < n; ++i) {
        out[i] = a[i] * s;
    }
}

void relu_forward_cpu(float* out, const float* inp, long n) {
    for (long i = 0; i < n; ++i) {
        out[i] = std::max(inp[i], 0.f);
    }
}

void threshold_backward_cpu(float* out, const float* grad, const float* inp, float threshold, long n) {
    for (long i = 0; i < n; ++i) {
        out[i] = inp[i] <= threshold ? 0.f : grad[i];
    }
}

void broadcast_fill_cpu(float* out, const float* src, long n, long nsrc) {
    for (long i = 0; i < n; ++i) {
        out[i] = src[i % nsrc];
    }
}

void sum_reduce_cpu(float* out, const float* inp, long outer, long reduce, long inner) {
    for (long o = 0; o < outer; ++o) {
        for (long i = 0; i < inner; ++i) {
            float acc = 0.f;
            for (long r = 0; r < reduce; ++r) {
                acc += inp[(o * reduce + r) * inner + i];
            }
            out[o * inner + i] = acc;
        }
    }
}

void matmul_cpu(float* out, const float* a, const float* b, int M, int N, int K, bool transpose_b, float alpha, float beta) {
    for (int m = 0; m < M; ++m) {
        for (int n = 0; n < N; ++n) {
            float acc = 0.f;
            for (int k = 0; k < K; ++k) {
                const float bv = transpose_b ? b[static_cast<long>(n) * K + k] : b[static_cast<long>(k) * N + n];
                acc += a[static_cast<long>(m) * K + k] * bv;
            }
            float& c = out[static_cast<long>(m) * N + n];
            c = alpha * acc + (beta == 0.f ? 0.f : beta * c);
        }
    }
}

void transpose_cpu(float* out, const float* inp, int rows, int cols) {
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out[static_cast<long>(c) * rows + r] = inp[static_cast<long>(r) * cols + c];
        }
    }
}

void embedding_bag_forward_cpu(float* out, std::int64_t* offset2bag, std::int64_t* bag_size,
                               const float* weight, const std::int64_t* indices, const std::int64_t* offsets,
                               const float* per_sample_weights, int B, long N, int D, EPoolingMode mode) {
    for (int b = 0; b < B; ++b) {
        const long begin = offsets[b];
        const long end = b + 1 < B ? offsets[b + 1] : N;
        float* row = out + static_cast<long>(b) * D;
        std::fill(row, row + D, 0.f);
        for (long p = begin; p < end; ++p) {
            const float scale = per_sample_weights ? per_sample_weights[p] : 1.f;
            const float* src = weight + indices[p] * D;
            for (int d = 0; d < D; ++d) {
                row[d] += scale * src[d];
            }
            offset2bag[p] = b;
        }
        if (mode == EPoolingMode::MEAN && end > begin) {
            for (int d = 0; d < D; ++d) {
                row[d] /= static_cast<float>(end - begin);
            }
        }
        bag_size[b] = end - begin;
    }
}

void widen_indices_cpu(std::int64_t* out, const std::int32_t* inp, long n) {
    for (long i = 0; i < n; ++i) {
        out[i] = inp[i];
    }
}

namespace {

template<class Fn>
void for_each_bag(const SplitEmbeddingLayout& layout, Fn&& fn) {
    for (int t = 0; t < layout.T; ++t) {
        const int col = layout.D_offsets[t];
        const int D = layout.D_offsets[t + 1] - col;
        for (int b = 0; b < layout.B; ++b) {
            const int bag = t * layout.B + b;
            fn(t, b, col, D, static_cast<long>(layout.offsets[bag]), static_cast<long>(layout.offsets[bag + 1]));
        }
    }
}

float row_grad_scale(const SplitEmbeddingLayout& layout, long p, long begin, long end) {
    float scale = layout.per_sample_weights ? layout.per_sample_weights[p] : 1.f;
    if (layout.pooling == EPoolingMode::MEAN && end > begin) {
        scale /= static_cast<float>(end - begin);
    }
    return scale;
}

} // namespace

void split_embedding_forward_cpu(float* out, const float* weights, const SplitEmbeddingLayout& layout) {
    for_each_bag(layout, [&](int t, int b, int col, int D, long begin, long end) {
        float* dst = out + static_cast<long>(b) * layout.total_D + col;
        const float* table = weights + layout.weights_offsets[t];
        std::fill(dst, dst + D, 0.f);
        for (long p = begin; p < end; ++p) {
            const float scale = layout.per_sample_weights ? layout.per_sample_weights[p] : 1.f;
            const float* src = table + layout.indices[p] * D;
            for (int d = 0; d < D; ++d) {
                dst[d] += scale * src[d];
            }
        }
        if (layout.pooling == EPoolingMode::MEAN && end > begin) {
            for (int d = 0; d < D; ++d) {
                dst[d] /= static_cast<float>(end - begin);
            }
        }
    });
}

void split_embedding_backward_sgd_cpu(float* weights, const float* grad, const SplitEmbeddingLayout& layout, float lr) {
    for_each_bag(layout, [&](int t, int b, int col, int D, long begin, long end) {
        const float* g = grad + static_cast<long>(b) * layout.total_D + col;
        float* table = weights + layout.weights_offsets[t];
        for (long p = begin; p < end; ++p) {
            const float scale = row_grad_scale(layout, p, begin, end);
            float* row = table + layout.indices[p] * D;
            for (int d = 0; d < D; ++d) {
                row[d] -= lr * scale * g[d];
            }
        }
    });
}

void split_embedding_backward_adagrad_cpu(float* weights, float* momentum, const float* grad, const SplitEmbeddingLayout& layout,
                                          float lr, float eps) {
    for_each_bag(layout, [&](int t, int b, int col, int D, long begin, long end) {
        const float* g = grad + static_cast<long>(b) * layout.total_D + col;
        const long table_offset = layout.weights_offsets[t];
        for (long p = begin; p < end; ++p) {
            const float scale = row_grad_scale(layout, p, begin, end);
            const long row = table_offset + layout.indices[p] * D;
            for (int d = 0; d < D; ++d) {
                const float gd = scale * g[d];
                momentum[row + d] += gd * gd;
                weights[row + d] -= lr * gd / (std::sqrt(momentum[row + d]) + eps);
            }
        }
    });
}
