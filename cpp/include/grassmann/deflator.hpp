#pragma once

/**
 * Accumulates accepted directions into a D x K basis and prepares the
 * residual data for the next extraction.
 *
 * For extraction k (1-based) out of K:
 *   k == 1      store mu as is, deflate the residual
 *   1 < k < K   reorthogonalize against columns 1..k-1, renormalize, store, deflate
 *   k == K      reorthogonalize, renormalize, store
 *
 * No deflation happens after the last vector since nothing consumes it.
 */

#include "grassmann/types.hpp"
#include <utility>

namespace grassmann {

template<typename Scalar>
class Deflator {
public:
    Deflator(Index dimension, Index total);

    // Store the next direction and update the residual in place
    void accept(Vector<Scalar> mu, Matrix<Scalar>& residual);

    const Matrix<Scalar>& basis() const { return basis_; }
    Index stored() const { return stored_; }
    Index total() const { return total_; }
    bool complete() const { return stored_ == total_; }

    Matrix<Scalar> release() { return std::move(basis_); }

private:
    Matrix<Scalar> basis_;
    Index total_;
    Index stored_ = 0;
};

extern template class Deflator<float>;
extern template class Deflator<double>;

} // namespace grassmann
