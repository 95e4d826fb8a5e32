// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRACE_REPLAY_SRC_KERNELS_KERNELS_H
#define TRACE_REPLAY_SRC_KERNELS_KERNELS_H

#include <cstddef>
#include <cstdint>

#include <cuda_runtime.h>

typedef struct cublasContext* cublasHandle_t;

struct Tensor;
enum class ETensorDType: int;

// ----------------------------------------------------------------------------
// Element-wise. `b` is broadcast over `a` by repetition: out[i] = f(a[i], b[i % nb]).

void add_broadcast(float* out, const float* a, const float* b, float alpha, long n, long nb, cudaStream_t stream);
void add_broadcast_cpu(float* out, const float* a, const float* b, float alpha, long n, long nb);
void add_broadcast(Tensor& out, const Tensor& a, const Tensor& b, float alpha, cudaStream_t stream);

void mul_broadcast(float* out, const float* a, const float* b, long n, long nb, cudaStream_t stream);
void mul_broadcast_cpu(float* out, const float* a, const float* b, long n, long nb);
void mul_broadcast(Tensor& out, const Tensor& a, const Tensor& b, cudaStream_t stream);

// out = a + s  /  out = a * s
void add_scalar(float* out, const float* a, float s, long n, cudaStream_t stream);
void add_scalar_cpu(float* out, const float* a, float s, long n);
void add_scalar(Tensor& out, const Tensor& a, float s, cudaStream_t stream);

void mul_scalar(float* out, const float* a, float s, long n, cudaStream_t stream);
void mul_scalar_cpu(float* out, const float* a, float s, long n);
void mul_scalar(Tensor& out, const Tensor& a, float s, cudaStream_t stream);

void relu_forward(float* out, const float* inp, long n, cudaStream_t stream);
void relu_forward_cpu(float* out, const float* inp, long n);
void relu_forward(Tensor& out, const Tensor& inp, cudaStream_t stream);

// out = inp <= threshold ? 0 : grad
void threshold_backward(float* out, const float* grad, const float* inp, float threshold, long n, cudaStream_t stream);
void threshold_backward_cpu(float* out, const float* grad, const float* inp, float threshold, long n);
void threshold_backward(Tensor& out, const Tensor& grad, const Tensor& inp, float threshold, cudaStream_t stream);

// out[i] = src[i % nsrc]
void broadcast_fill(float* out, const float* src, long n, long nsrc, cudaStream_t stream);
void broadcast_fill_cpu(float* out, const float* src, long n, long nsrc);
void broadcast_fill(Tensor& out, const Tensor& src, cudaStream_t stream);

// ----------------------------------------------------------------------------
// Reductions

/// Sums the middle axis of an [outer, reduce, inner] view of @p inp into an [outer, inner] output.
void sum_reduce(float* out, const float* inp, long outer, long reduce, long inner, cudaStream_t stream);
void sum_reduce_cpu(float* out, const float* inp, long outer, long reduce, long inner);
void sum_reduce(Tensor& out, const Tensor& inp, long outer, long reduce, long inner, cudaStream_t stream);

// ----------------------------------------------------------------------------
// Matmul (cuBLAS, row-major)

/// C[M, N] = alpha * A[M, K] @ op(B) + beta * C, where op(B) is B[K, N], or B[N, K]^T if @p transpose_b.
void matmul(float* out, const float* a, const float* b, int M, int N, int K, bool transpose_b,
            float alpha, float beta, cublasHandle_t handle, cudaStream_t stream);
void matmul_cpu(float* out, const float* a, const float* b, int M, int N, int K, bool transpose_b, float alpha, float beta);
void matmul(Tensor& out, const Tensor& a, const Tensor& b, int M, int N, int K, bool transpose_b,
            float alpha, float beta, cublasHandle_t handle, cudaStream_t stream);

/// out[cols, rows] = inp[rows, cols]^T
void transpose(float* out, const float* inp, int rows, int cols, cublasHandle_t handle, cudaStream_t stream);
void transpose_cpu(float* out, const float* inp, int rows, int cols);
void transpose(Tensor& out, const Tensor& inp, int rows, int cols, cublasHandle_t handle, cudaStream_t stream);

// ----------------------------------------------------------------------------
// Embeddings

enum class EPoolingMode : int {
    SUM = 0,
    MEAN = 1,
    MAX = 2,
    NONE = 3
};

/**
 * @brief Pooled embedding lookup over a single table (weight[E, D]).
 *
 * Bag b covers indices[offsets[b] .. offsets[b + 1]), the last bag ending at @p N.
 * Also writes the bag index of each index position (offset2bag[N]) and the bag sizes (bag_size[B]).
 *
 * @param per_sample_weights Optional [N] weights, nullptr if unweighted. Only valid with SUM.
 */
void embedding_bag_forward(float* out, std::int64_t* offset2bag, std::int64_t* bag_size,
                           const float* weight, const std::int64_t* indices, const std::int64_t* offsets,
                           const float* per_sample_weights, int B, long N, int D, EPoolingMode mode, cudaStream_t stream);
void embedding_bag_forward_cpu(float* out, std::int64_t* offset2bag, std::int64_t* bag_size,
                               const float* weight, const std::int64_t* indices, const std::int64_t* offsets,
                               const float* per_sample_weights, int B, long N, int D, EPoolingMode mode);

// out[i] = inp[i], for int32 index and offset tensors
void widen_indices(std::int64_t* out, const std::int32_t* inp, long n, cudaStream_t stream);
void widen_indices_cpu(std::int64_t* out, const std::int32_t* inp, long n);
void widen_indices(Tensor& out, const Tensor& inp, cudaStream_t stream);

/// Layout shared by the batched multi-table lookup kernels.
/// Table t has D_t = D_offsets[t + 1] - D_offsets[t] columns and starts at weights[weights_offsets[t]].
/// Bag (t, b) covers indices[offsets[t * B + b] .. offsets[t * B + b + 1]).
struct SplitEmbeddingLayout {
    const std::int64_t* weights_offsets;
    const int* D_offsets;
    const std::int64_t* indices;
    const std::int64_t* offsets;
    const float* per_sample_weights;    // nullptr if unweighted
    int T;
    int B;
    int total_D;
    EPoolingMode pooling;
};

/// out[B, total_D]: the pooled rows of each table, concatenated along the feature axis.
void split_embedding_forward(float* out, const float* weights, const SplitEmbeddingLayout& layout, cudaStream_t stream);
void split_embedding_forward_cpu(float* out, const float* weights, const SplitEmbeddingLayout& layout);

/// Applies weights[row] -= lr * dL/drow for every looked-up row, with @p grad shaped like the forward output.
void split_embedding_backward_sgd(float* weights, const float* grad, const SplitEmbeddingLayout& layout, float lr, cudaStream_t stream);
void split_embedding_backward_sgd_cpu(float* weights, const float* grad, const SplitEmbeddingLayout& layout, float lr);

/// Element-wise Adagrad: m += g^2; w -= lr * g / (sqrt(m) + eps). @p momentum has the layout of @p weights.
void split_embedding_backward_adagrad(float* weights, float* momentum, const float* grad, const SplitEmbeddingLayout& layout,
                                      float lr, float eps, cudaStream_t stream);
void split_embedding_backward_adagrad_cpu(float* weights, float* momentum, const float* grad, const SplitEmbeddingLayout& layout,
                                          float lr, float eps);

#endif //TRACE_REPLAY_SRC_KERNELS_KERNELS_H
