#pragma once

/**
 * Grassmann median fixed-point iteration.
 *
 * Each step re-signs every observation by its projection onto the current
 * direction, takes the element-wise median (or mean) of the sign-aligned
 * rows and renormalizes:
 *
 *   s_i    = sign(x_i . mu)            sign(0) = 0
 *   mu'[d] = median_i(s_i * x_i[d])
 *   mu'    = mu' / ||mu'||
 *
 * The loop stops when max_d |mu'[d] - mu[d]| < CONVERGENCE_TOLERANCE or
 * after N steps, N being the observation count. Hitting the cap is not an
 * error: the last iterate is returned.
 */

#include "grassmann/thread_pool.hpp"
#include "grassmann/types.hpp"
#include <memory>

namespace grassmann {

template<typename Scalar>
struct AveragerOutcome {
    Vector<Scalar> direction;
    int iterations = 0;      // update steps performed
    bool converged = false;  // stopped on tolerance rather than the cap
    Scalar last_change = Scalar(0);
};

template<typename Scalar>
class RobustAverager {
public:
    // Workers for the per-coordinate medians are started here, once, when
    // num_threads > 1, and reused by every update
    explicit RobustAverager(AverageKind kind = AverageKind::MEDIAN, int num_threads = 1);

    AveragerOutcome<Scalar> run(const Matrix<Scalar>& X, Vector<Scalar> mu) const;

    // A single update step from mu
    Vector<Scalar> update(const Matrix<Scalar>& X, const Vector<Scalar>& mu) const;

    // Iteration cap for a data set with the given number of observations
    static int iteration_cap(Index observations) { return static_cast<int>(observations); }

    // Workers available to update(); 1 when running serially
    int num_threads() const;

private:
    AverageKind kind_;
    std::unique_ptr<ThreadPool> pool_;
};

extern template class RobustAverager<float>;
extern template class RobustAverager<double>;

} // namespace grassmann
