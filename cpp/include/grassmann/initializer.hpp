#pragma once

#include "grassmann/types.hpp"
#include <random>

namespace grassmann {

/**
 * Starting direction for one basis vector.
 *
 * Draws a vector with components uniform in [-0.5, 0.5), normalizes it and
 * refines it with INIT_POWER_STEPS ordinary power-iteration steps
 * (mu <- X^T X mu, renormalized). The engine is owned by the caller so that
 * successive components consume one reproducible stream.
 */
template<typename Scalar>
class Initializer {
public:
    explicit Initializer(std::mt19937_64& rng) : rng_(rng) {}

    Vector<Scalar> initial_direction(const Matrix<Scalar>& X);

    // The random unit vector before refinement
    Vector<Scalar> random_unit_vector(Index dimension);

    // One mean-based power step: mu <- normalize(X^T (X mu))
    static void power_step(const Matrix<Scalar>& X, Vector<Scalar>& mu);

private:
    std::mt19937_64& rng_;
};

extern template class Initializer<float>;
extern template class Initializer<double>;

} // namespace grassmann
