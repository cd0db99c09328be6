#include "grassmann/initializer.hpp"
#include "grassmann/linear_algebra.hpp"

namespace grassmann {

template<typename Scalar>
Vector<Scalar> Initializer<Scalar>::random_unit_vector(Index dimension) {
    std::uniform_real_distribution<double> dist(-0.5, 0.5);
    Vector<Scalar> mu(dimension);
    for (Index d = 0; d < dimension; ++d) {
        mu[d] = static_cast<Scalar>(dist(rng_));
    }
    la::normalize(mu, "random initial direction");
    return mu;
}

template<typename Scalar>
void Initializer<Scalar>::power_step(const Matrix<Scalar>& X, Vector<Scalar>& mu) {
    const Vector<Scalar> dots = X * mu;
    mu.noalias() = X.transpose() * dots;
    la::normalize(mu, "power-iteration direction");
}

template<typename Scalar>
Vector<Scalar> Initializer<Scalar>::initial_direction(const Matrix<Scalar>& X) {
    Vector<Scalar> mu = random_unit_vector(X.cols());
    for (int step = 0; step < INIT_POWER_STEPS; ++step) {
        power_step(X, mu);
    }
    return mu;
}

template class Initializer<float>;
template class Initializer<double>;

} // namespace grassmann
