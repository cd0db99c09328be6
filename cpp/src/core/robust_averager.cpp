#include "grassmann/robust_averager.hpp"
#include "grassmann/linear_algebra.hpp"
#include "grassmann/logging.hpp"
#include <memory>
#include <utility>

namespace grassmann {

template<typename Scalar>
RobustAverager<Scalar>::RobustAverager(AverageKind kind, int num_threads)
    : kind_(kind) {
    if (kind_ == AverageKind::MEDIAN && num_threads > 1) {
        pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(num_threads));
    }
}

template<typename Scalar>
int RobustAverager<Scalar>::num_threads() const {
    return pool_ ? static_cast<int>(pool_->num_threads()) : 1;
}

template<typename Scalar>
Vector<Scalar> RobustAverager<Scalar>::update(const Matrix<Scalar>& X, const Vector<Scalar>& mu) const {
    const Vector<Scalar> signs = la::projection_signs(X, mu);

    Vector<Scalar> next = (kind_ == AverageKind::MEDIAN)
        ? la::signed_column_medians(X, signs, pool_.get())
        : la::signed_column_means(X, signs);

    la::normalize(next, kind_ == AverageKind::MEDIAN ? "element-wise median" : "element-wise mean");
    return next;
}

template<typename Scalar>
AveragerOutcome<Scalar> RobustAverager<Scalar>::run(const Matrix<Scalar>& X, Vector<Scalar> mu) const {
    AveragerOutcome<Scalar> outcome;
    const int cap = iteration_cap(X.rows());
    const Scalar tolerance = static_cast<Scalar>(CONVERGENCE_TOLERANCE);

    for (int iter = 0; iter < cap; ++iter) {
        Vector<Scalar> next = update(X, mu);
        outcome.last_change = la::max_abs_difference(next, mu);
        outcome.iterations = iter + 1;
        mu = std::move(next);

        if (outcome.last_change < tolerance) {
            outcome.converged = true;
            break;
        }
    }

    if (!outcome.converged) {
        LOG_DEBUG("iteration cap ", cap, " reached, last change ", outcome.last_change);
    }

    outcome.direction = std::move(mu);
    return outcome;
}

template class RobustAverager<float>;
template class RobustAverager<double>;

} // namespace grassmann
