// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include <cublas_v2.h>

#include "kernels.h"
#include "utilities/utils.h"

/**
 * @brief Row-major FP32 GEMM on top of column-major cuBLAS.
 *
 * A row-major [M, N] matrix is a column-major [N, M] matrix, so C = A @ op(B) is computed as
 * C^T = op(B)^T @ A^T, i.e. cuBLAS is called with the operands swapped and no extra transposes.
 *
 * @param out [out] C[M, N]; read as well if @p beta != 0.
 * @param a A[M, K].
 * @param b B[K, N], or B[N, K] if @p transpose_b.
 * @param handle cuBLAS handle; bound to @p stream for the call.
 */
void matmul(float* out, const float* a, const float* b, int M, int N, int K, bool transpose_b,
            float alpha, float beta, cublasHandle_t handle, cudaStream_t stream) {
    if (M == 0 || N == 0) return;
    CUBLAS_CHECK(cublasSetStream(handle, stream));
    const cublasOperation_t op_b = transpose_b ? CUBLAS_OP_T : CUBLAS_OP_N;
    const int ldb = transpose_b ? K : N;
    CUBLAS_CHECK(cublasSgemm(handle, op_b, CUBLAS_OP_N, N, M, K,
                             &alpha, b, ldb, a, K, &beta, out, N));
}

void transpose(float* out, const float* inp, int rows, int cols, cublasHandle_t handle, cudaStream_t stream) {
    if (rows == 0 || cols == 0) return;
    CUBLAS_CHECK(cublasSetStream(handle, stream));
    const float one = 1.f;
    const float zero = 0.f;
    // column-major view: inp is [cols, rows] with ld cols, out is [rows, cols] with ld rows
    CUBLAS_CHECK(cublasSgeam(handle, CUBLAS_OP_T, CUBLAS_OP_N, rows, cols,
                             &one, inp, cols, &zero, out, rows, out, rows));
}
