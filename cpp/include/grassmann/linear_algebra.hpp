#pragma once

/**
 * Dense kernels used by the Grassmann median solver.
 *
 * Everything the solver needs from a linear-algebra backend lives here:
 * sign projections, per-coordinate medians and means, deflation,
 * reorthogonalization and checked normalization. Eigen does the BLAS-like
 * work; the medians are computed per coordinate with std::nth_element.
 *
 * Instantiated for float and double.
 */

#include "grassmann/types.hpp"
#include <vector>

namespace grassmann {

class ThreadPool;

namespace la {

/**
 * s_i = sign(x_i . mu) for every row of X, with sign(0) = 0.
 */
template<typename Scalar>
Vector<Scalar> projection_signs(const Matrix<Scalar>& X, const Vector<Scalar>& mu);

/**
 * Median of a non-empty set. Reorders the buffer.
 * Even-sized sets yield the mean of the two central order statistics.
 */
template<typename Scalar>
Scalar median_inplace(std::vector<Scalar>& values);

/**
 * Element-wise median of the sign-aligned rows: out[d] = median_i(s_i * X(i, d)).
 *
 * @param pool  When given, coordinates are split into contiguous chunks across
 *              its workers. Each coordinate is computed by the same sequential
 *              code, so the result does not depend on the worker count.
 */
template<typename Scalar>
Vector<Scalar> signed_column_medians(const Matrix<Scalar>& X, const Vector<Scalar>& signs,
                                     ThreadPool* pool = nullptr);

// Element-wise mean of the sign-aligned rows
template<typename Scalar>
Vector<Scalar> signed_column_means(const Matrix<Scalar>& X, const Vector<Scalar>& signs);

/**
 * Scale v to unit length in place and return its previous norm.
 * Throws DegenerateSubspaceError when the norm is zero or not finite.
 */
template<typename Scalar>
Scalar normalize(Vector<Scalar>& v, const char* what);

/**
 * Remove the component along unit vector mu from every row:
 * X <- X - (X mu) mu^T
 */
template<typename Scalar>
void deflate(Matrix<Scalar>& X, const Vector<Scalar>& mu);

/**
 * Project v onto the orthogonal complement of basis.leftCols(count).
 *
 * Classical Gram-Schmidt applied twice ("twice is enough"). Zero columns
 * make this a no-op. Throws DegenerateSubspaceError if v lies (numerically)
 * inside the span of the given columns.
 */
template<typename Scalar>
void reorthogonalize(const Matrix<Scalar>& basis, Index count, Vector<Scalar>& v);

// max_d |a[d] - b[d]|
template<typename Scalar>
Scalar max_abs_difference(const Vector<Scalar>& a, const Vector<Scalar>& b);

/**
 * Largest |<b_i, b_j>| over distinct columns and largest |1 - ||b_i|||.
 * Used by diagnostics and tests.
 */
template<typename Scalar>
Scalar orthonormality_error(const Matrix<Scalar>& basis);

} // namespace la
} // namespace grassmann
