#pragma once

#include <Eigen/Dense>
#include <cstdint>

namespace grassmann {

// Observations are rows: an N x D matrix holds N points in R^D.
template<typename Scalar>
using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

template<typename Scalar>
using Vector = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

template<typename Scalar>
using RowMajorMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using Index = Eigen::Index;

/**
 * How the sign-aligned observations are averaged per coordinate.
 * MEDIAN is the robust Grassmann median; MEAN is the plain Grassmann average.
 */
enum class AverageKind {
    MEDIAN = 0,
    MEAN = 1
};

// Fixed algorithm constants
constexpr int INIT_POWER_STEPS = 3;
constexpr double CONVERGENCE_TOLERANCE = 1e-5;

} // namespace grassmann
