// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "kernels.h"

#include <initializer_list>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/tensor.h"

namespace {

//! All operands of a kernel call must live on the same side as the output.
void check_placement(const char* name, const Tensor& out, std::initializer_list<const Tensor*> operands) {
    for (const Tensor* t : operands) {
        if (t->is_host() != out.is_host()) {
            throw std::logic_error(fmt::format("{}: operands on different devices (out on {}, operand on {})",
                                               name, out.Device, t->Device));
        }
    }
}

long broadcast_extent(const char* name, const Tensor& a, const Tensor& b) {
    const long na = static_cast<long>(a.nelem());
    const long nb = static_cast<long>(b.nelem());
    if (nb == 0 || na % nb != 0) {
        throw std::logic_error(fmt::format("{}: cannot broadcast {} elements over {}", name, nb, na));
    }
    return nb;
}

} // namespace

/**
 * @brief Computes out = a + alpha * b, with @p b repeated over @p a.
 *
 * Runs the host loop if the output lives on the host and the CUDA kernel otherwise.
 *
 * @throws std::logic_error If the dtype is not FP32, the operands are on different devices,
 *                          or b's element count does not divide a's.
 */
void add_broadcast(Tensor& out, const Tensor& a, const Tensor& b, float alpha, cudaStream_t stream) {
    check_placement("add_broadcast", out, {&a, &b});
    const long nb = broadcast_extent("add_broadcast", a, b);
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("add_broadcast: unsupported dtype");
    }
    if (out.is_host()) {
        add_broadcast_cpu(out.get<float>(), a.get<float>(), b.get<float>(), alpha, static_cast<long>(out.nelem()), nb);
    } else {
        add_broadcast(out.get<float>(), a.get<float>(), b.get<float>(), alpha, static_cast<long>(out.nelem()), nb, stream);
    }
}

void mul_broadcast(Tensor& out, const Tensor& a, const Tensor& b, cudaStream_t stream) {
    check_placement("mul_broadcast", out, {&a, &b});
    const long nb = broadcast_extent("mul_broadcast", a, b);
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("mul_broadcast: unsupported dtype");
    }
    if (out.is_host()) {
        mul_broadcast_cpu(out.get<float>(), a.get<float>(), b.get<float>(), static_cast<long>(out.nelem()), nb);
    } else {
        mul_broadcast(out.get<float>(), a.get<float>(), b.get<float>(), static_cast<long>(out.nelem()), nb, stream);
    }
}

void add_scalar(Tensor& out, const Tensor& a, float s, cudaStream_t stream) {
    check_placement("add_scalar", out, {&a});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("add_scalar: unsupported dtype");
    }
    if (out.is_host()) {
        add_scalar_cpu(out.get<float>(), a.get<float>(), s, static_cast<long>(out.nelem()));
    } else {
        add_scalar(out.get<float>(), a.get<float>(), s, static_cast<long>(out.nelem()), stream);
    }
}

void mul_scalar(Tensor& out, const Tensor& a, float s, cudaStream_t stream) {
    check_placement("mul_scalar", out, {&a});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("mul_scalar: unsupported dtype");
    }
    if (out.is_host()) {
        mul_scalar_cpu(out.get<float>(), a.get<float>(), s, static_cast<long>(out.nelem()));
    } else {
        mul_scalar(out.get<float>(), a.get<float>(), s, static_cast<long>(out.nelem()), stream);
    }
}

void relu_forward(Tensor& out, const Tensor& inp, cudaStream_t stream) {
    check_placement("relu_forward", out, {&inp});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("relu_forward: unsupported dtype");
    }
    if (out.is_host()) {
        relu_forward_cpu(out.get<float>(), inp.get<float>(), static_cast<long>(out.nelem()));
    } else {
        relu_forward(out.get<float>(), inp.get<float>(), static_cast<long>(out.nelem()), stream);
    }
}

void threshold_backward(Tensor& out, const Tensor& grad, const Tensor& inp, float threshold, cudaStream_t stream) {
    check_placement("threshold_backward", out, {&grad, &inp});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("threshold_backward: unsupported dtype");
    }
    if (grad.nelem() != out.nelem() || inp.nelem() != out.nelem()) {
        throw std::logic_error("threshold_backward: shape mismatch");
    }
    if (out.is_host()) {
        threshold_backward_cpu(out.get<float>(), grad.get<float>(), inp.get<float>(), threshold, static_cast<long>(out.nelem()));
    } else {
        threshold_backward(out.get<float>(), grad.get<float>(), inp.get<float>(), threshold, static_cast<long>(out.nelem()), stream);
    }
}

void broadcast_fill(Tensor& out, const Tensor& src, cudaStream_t stream) {
    check_placement("broadcast_fill", out, {&src});
    const long nsrc = broadcast_extent("broadcast_fill", out, src);
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("broadcast_fill: unsupported dtype");
    }
    if (out.is_host()) {
        broadcast_fill_cpu(out.get<float>(), src.get<float>(), static_cast<long>(out.nelem()), nsrc);
    } else {
        broadcast_fill(out.get<float>(), src.get<float>(), static_cast<long>(out.nelem()), nsrc, stream);
    }
}

void widen_indices(Tensor& out, const Tensor& inp, cudaStream_t stream) {
    check_placement("widen_indices", out, {&inp});
    if (out.nelem() != inp.nelem()) {
        throw std::logic_error(fmt::format("widen_indices: {} elements into {}", inp.nelem(), out.nelem()));
    }
    if (out.is_host()) {
        widen_indices_cpu(out.get<std::int64_t>(), inp.get<std::int32_t>(), static_cast<long>(out.nelem()));
    } else {
        widen_indices(out.get<std::int64_t>(), inp.get<std::int32_t>(), static_cast<long>(out.nelem()), stream);
    }
}

void sum_reduce(Tensor& out, const Tensor& inp, long outer, long reduce, long inner, cudaStream_t stream) {
    check_placement("sum_reduce", out, {&inp});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("sum_reduce: unsupported dtype");
    }
    if (out.is_host()) {
        sum_reduce_cpu(out.get<float>(), inp.get<float>(), outer, reduce, inner);
    } else {
        sum_reduce(out.get<float>(), inp.get<float>(), outer, reduce, inner, stream);
    }
}

void matmul(Tensor& out, const Tensor& a, const Tensor& b, int M, int N, int K, bool transpose_b,
            float alpha, float beta, cublasHandle_t handle, cudaStream_t stream) {
    check_placement("matmul", out, {&a, &b});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("matmul: unsupported dtype");
    }
    if (out.is_host()) {
        matmul_cpu(out.get<float>(), a.get<float>(), b.get<float>(), M, N, K, transpose_b, alpha, beta);
    } else {
        if (!handle) {
            throw std::logic_error("matmul: device operands without a cuBLAS handle");
        }
        matmul(out.get<float>(), a.get<float>(), b.get<float>(), M, N, K, transpose_b, alpha, beta, handle, stream);
    }
}

void transpose(Tensor& out, const Tensor& inp, int rows, int cols, cublasHandle_t handle, cudaStream_t stream) {
    check_placement("transpose", out, {&inp});
    if (out.DType != ETensorDType::FP32) {
        throw std::logic_error("transpose: unsupported dtype");
    }
    if (out.is_host()) {
        transpose_cpu(out.get<float>(), inp.get<float>(), rows, cols);
    } else {
        if (!handle) {
            throw std::logic_error("transpose: device operands without a cuBLAS handle");
        }
        transpose(out.get<float>(), inp.get<float>(), rows, cols, handle, stream);
    }
}
