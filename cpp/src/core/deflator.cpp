#include "grassmann/deflator.hpp"
#include "grassmann/error.hpp"
#include "grassmann/linear_algebra.hpp"

namespace grassmann {

template<typename Scalar>
Deflator<Scalar>::Deflator(Index dimension, Index total)
    : basis_(Matrix<Scalar>::Zero(dimension, total)), total_(total) {}

template<typename Scalar>
void Deflator<Scalar>::accept(Vector<Scalar> mu, Matrix<Scalar>& residual) {
    GRASSMANN_CHECK(stored_ < total_, ErrorCode::INTERNAL_ERROR,
                    "basis already holds all requested vectors");
    GRASSMANN_CHECK_ARGUMENT(mu.size() == basis_.rows(), "direction has wrong dimension");

    if (stored_ > 0) {
        la::reorthogonalize(basis_, stored_, mu);
        la::normalize(mu, "reorthogonalized direction");
    }

    basis_.col(stored_) = mu;
    ++stored_;

    if (stored_ < total_) {
        la::deflate(residual, mu);
    }
}

template class Deflator<float>;
template class Deflator<double>;

} // namespace grassmann
