/**
 * Grassmann Median: robust estimation of a dominant subspace
 *
 * Reference: S. Hauberg, A. Feragen and M.J. Black,
 * "Grassmann Averages for Scalable Robust PCA", CVPR 2014.
 *
 * Basis vectors are extracted one at a time:
 * 1. Initializer      random unit vector + INIT_POWER_STEPS power steps
 * 2. RobustAverager   sign-aligned element-wise median until convergence
 *                     or N iterations
 * 3. Deflator         reorthogonalize, store, deflate the residual
 *
 * Each call copies the data and owns its random engine, so concurrent calls
 * on different inputs need no coordination.
 */

#pragma once

#include "grassmann/types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace grassmann {

/**
 * Per-call settings
 */
struct GrassmannConfig {
    uint64_t seed = 0;                      // random initialization stream
    int num_threads = 0;                    // 0 = perf.num_threads (GRASSMANN_NUM_THREADS)
    AverageKind kind = AverageKind::MEDIAN;
};

/**
 * Convergence record for one extracted column
 */
struct ComponentStats {
    int iterations = 0;
    bool converged = false;
    double final_change = 0.0;
};

template<typename Scalar>
struct GrassmannResult {
    Matrix<Scalar> basis;                  // D x K, orthonormal columns
    std::vector<ComponentStats> components;
};

template<typename Scalar>
class GrassmannMedian {
public:
    explicit GrassmannMedian(const GrassmannConfig& config = GrassmannConfig{});

    /**
     * Estimate K orthonormal robust basis vectors.
     *
     * @param X  N x D observations (rows). Not modified.
     * @param K  Number of basis vectors, 1 <= K <= D
     * @return   D x K basis in extraction order plus per-column stats
     *
     * @throws MissingInputError        N == 0 or D == 0
     * @throws InvalidDimensionError    K <= 0 or K > D
     * @throws InvalidArgumentError     non-finite entries
     * @throws DegenerateSubspaceError  a direction collapsed to zero norm
     */
    GrassmannResult<Scalar> compute(const Matrix<Scalar>& X, int K = 1) const;

    // Row-major N x D buffer. A null pointer is reported as missing input.
    GrassmannResult<Scalar> compute(const Scalar* data, size_t rows, size_t cols, int K = 1) const;

private:
    int resolve_threads() const;

    GrassmannConfig config_;
};

extern template class GrassmannMedian<float>;
extern template class GrassmannMedian<double>;

/**
 * Basis-only convenience wrapper: D x K orthonormal columns.
 */
template<typename Scalar>
Matrix<Scalar> grassmann_median(const Matrix<Scalar>& X, int K = 1, uint64_t seed = 0);

extern template Matrix<float> grassmann_median<float>(const Matrix<float>&, int, uint64_t);
extern template Matrix<double> grassmann_median<double>(const Matrix<double>&, int, uint64_t);

} // namespace grassmann
