/**
 * Dense kernels for the Grassmann median solver.
 *
 * Eigen handles the matrix-vector work. Medians run per coordinate over a
 * scratch buffer, optionally split across pool workers by coordinate range.
 */

#include "grassmann/linear_algebra.hpp"
#include "grassmann/error.hpp"
#include "grassmann/thread_pool.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace grassmann {
namespace la {

template<typename Scalar>
Vector<Scalar> projection_signs(const Matrix<Scalar>& X, const Vector<Scalar>& mu) {
    const Vector<Scalar> dots = X * mu;
    return dots.unaryExpr([](Scalar x) {
        if (x > Scalar(0)) return Scalar(1);
        if (x < Scalar(0)) return Scalar(-1);
        return Scalar(0);
    });
}

template<typename Scalar>
Scalar median_inplace(std::vector<Scalar>& values) {
    if (values.empty()) {
        throw InvalidArgumentError("median of an empty set", __func__);
    }

    const size_t n = values.size();
    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const Scalar upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }

    // nth_element leaves the lower half in front of mid
    const Scalar lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / Scalar(2);
}

template<typename Scalar>
Vector<Scalar> signed_column_medians(const Matrix<Scalar>& X, const Vector<Scalar>& signs,
                                     ThreadPool* pool) {
    const Index N = X.rows();
    const Index D = X.cols();
    Vector<Scalar> out(D);

    auto worker = [&](size_t begin, size_t end) {
        std::vector<Scalar> buffer(static_cast<size_t>(N));
        for (Index d = static_cast<Index>(begin); d < static_cast<Index>(end); ++d) {
            const Scalar* column = X.col(d).data();
            for (Index i = 0; i < N; ++i) {
                buffer[static_cast<size_t>(i)] = signs[i] * column[i];
            }
            out[d] = median_inplace(buffer);
        }
    };

    if (!pool || pool->num_threads() < 2 || D < 2) {
        worker(0, static_cast<size_t>(D));
    } else {
        pool->parallel_ranges(0, static_cast<size_t>(D), worker);
    }

    return out;
}

template<typename Scalar>
Vector<Scalar> signed_column_means(const Matrix<Scalar>& X, const Vector<Scalar>& signs) {
    return (X.transpose() * signs) / static_cast<Scalar>(X.rows());
}

template<typename Scalar>
Scalar normalize(Vector<Scalar>& v, const char* what) {
    const Scalar n = v.norm();
    if (!(n > Scalar(0)) || !std::isfinite(n)) {
        throw DegenerateSubspaceError(
            std::string("cannot normalize ") + what + " (norm " + std::to_string(n) + ")",
            __func__,
            "the data has no variance left along the requested direction; "
            "check for all-zero input or request fewer basis vectors");
    }
    v /= n;
    return n;
}

template<typename Scalar>
void deflate(Matrix<Scalar>& X, const Vector<Scalar>& mu) {
    const Vector<Scalar> dots = X * mu;
    X.noalias() -= dots * mu.transpose();
}

template<typename Scalar>
void reorthogonalize(const Matrix<Scalar>& basis, Index count, Vector<Scalar>& v) {
    if (count <= 0) return;

    const auto Q = basis.leftCols(count);
    const Scalar before = v.norm();

    for (int pass = 0; pass < 2; ++pass) {
        const Vector<Scalar> coeffs = Q.transpose() * v;
        v.noalias() -= Q * coeffs;
    }

    const Scalar after = v.norm();
    const Scalar collapse = std::sqrt(std::numeric_limits<Scalar>::epsilon());
    if (!(after > collapse * before)) {
        throw DegenerateSubspaceError(
            "candidate direction lies in the span of the " + std::to_string(count) +
            " previously extracted vectors",
            __func__);
    }
}

template<typename Scalar>
Scalar max_abs_difference(const Vector<Scalar>& a, const Vector<Scalar>& b) {
    if (a.size() == 0) return Scalar(0);
    return (a - b).cwiseAbs().maxCoeff();
}

template<typename Scalar>
Scalar orthonormality_error(const Matrix<Scalar>& basis) {
    const Index k = basis.cols();
    if (k == 0) return Scalar(0);
    const Matrix<Scalar> gram = basis.transpose() * basis;
    return (gram - Matrix<Scalar>::Identity(k, k)).cwiseAbs().maxCoeff();
}

#define GRASSMANN_LA_INSTANTIATE(T)                                                        \
    template Vector<T> projection_signs<T>(const Matrix<T>&, const Vector<T>&);            \
    template T median_inplace<T>(std::vector<T>&);                                         \
    template Vector<T> signed_column_medians<T>(const Matrix<T>&, const Vector<T>&, ThreadPool*);\
    template Vector<T> signed_column_means<T>(const Matrix<T>&, const Vector<T>&);         \
    template T normalize<T>(Vector<T>&, const char*);                                      \
    template void deflate<T>(Matrix<T>&, const Vector<T>&);                                \
    template void reorthogonalize<T>(const Matrix<T>&, Index, Vector<T>&);                 \
    template T max_abs_difference<T>(const Vector<T>&, const Vector<T>&);                  \
    template T orthonormality_error<T>(const Matrix<T>&);

GRASSMANN_LA_INSTANTIATE(float)
GRASSMANN_LA_INSTANTIATE(double)

#undef GRASSMANN_LA_INSTANTIATE

} // namespace la
} // namespace grassmann
