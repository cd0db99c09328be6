/**
 * Grassmann median driver
 *
 * Validates the request, copies the data into a working residual and runs
 * Initializer -> RobustAverager -> Deflator once per requested column.
 */

#include "grassmann/grassmann_median.hpp"
#include "grassmann/config.hpp"
#include "grassmann/deflator.hpp"
#include "grassmann/error.hpp"
#include "grassmann/initializer.hpp"
#include "grassmann/logging.hpp"
#include "grassmann/robust_averager.hpp"
#include <algorithm>
#include <random>
#include <string>
#include <thread>
#include <utility>

namespace grassmann {

template<typename Scalar>
GrassmannMedian<Scalar>::GrassmannMedian(const GrassmannConfig& config)
    : config_(config) {}

template<typename Scalar>
int GrassmannMedian<Scalar>::resolve_threads() const {
    int threads = config_.num_threads;
    if (threads <= 0) {
        threads = Config::getInstance().get<int>("perf.num_threads", 1);
    }
    if (threads <= 0) {
        threads = static_cast<int>(std::thread::hardware_concurrency());
        if (threads == 0) threads = 1;
    }
    return threads;
}

template<typename Scalar>
GrassmannResult<Scalar> GrassmannMedian<Scalar>::compute(const Matrix<Scalar>& X, int K) const {
    ensure_config();

    const Index N = X.rows();
    const Index D = X.cols();

    GRASSMANN_CHECK(N > 0 && D > 0, ErrorCode::MISSING_INPUT,
                    "not enough input arguments: data matrix is empty (" +
                    std::to_string(N) + " x " + std::to_string(D) + ")");
    GRASSMANN_CHECK_DIMENSION(K > 0 && static_cast<Index>(K) <= D,
                              "requested " + std::to_string(K) +
                              " basis vectors for data of dimension " + std::to_string(D));
    GRASSMANN_CHECK_ARGUMENT(X.allFinite(), "data contains NaN or infinite values");

    const int threads = resolve_threads();
    LOG_INFO("Grassmann ", config_.kind == AverageKind::MEDIAN ? "median" : "average",
             ": N=", N, " D=", D, " K=", K, " threads=", threads);

    std::mt19937_64 rng(config_.seed);
    Initializer<Scalar> initializer(rng);
    // More workers than coordinates would sit idle
    RobustAverager<Scalar> averager(config_.kind, static_cast<int>(std::min<Index>(threads, D)));
    Deflator<Scalar> deflator(D, K);

    // Working residual, never aliases the caller's matrix
    Matrix<Scalar> residual = X;

    GrassmannResult<Scalar> result;
    result.components.reserve(static_cast<size_t>(K));

    for (int k = 0; k < K; ++k) {
        Vector<Scalar> start = initializer.initial_direction(residual);
        AveragerOutcome<Scalar> outcome = averager.run(residual, std::move(start));

        ComponentStats stats;
        stats.iterations = outcome.iterations;
        stats.converged = outcome.converged;
        stats.final_change = static_cast<double>(outcome.last_change);
        result.components.push_back(stats);

        LOG_DEBUG("component ", k + 1, "/", K, ": ", stats.iterations, " iterations, ",
                  stats.converged ? "converged" : "hit cap", ", change ", stats.final_change);

        deflator.accept(std::move(outcome.direction), residual);
    }

    result.basis = deflator.release();
    return result;
}

template<typename Scalar>
GrassmannResult<Scalar> GrassmannMedian<Scalar>::compute(const Scalar* data, size_t rows, size_t cols, int K) const {
    GRASSMANN_CHECK_POINTER(data, "data");
    Eigen::Map<const RowMajorMatrix<Scalar>> view(data, static_cast<Index>(rows), static_cast<Index>(cols));
    return compute(Matrix<Scalar>(view), K);
}

template<typename Scalar>
Matrix<Scalar> grassmann_median(const Matrix<Scalar>& X, int K, uint64_t seed) {
    GrassmannConfig config;
    config.seed = seed;
    return GrassmannMedian<Scalar>(config).compute(X, K).basis;
}

template class GrassmannMedian<float>;
template class GrassmannMedian<double>;

template Matrix<float> grassmann_median<float>(const Matrix<float>&, int, uint64_t);
template Matrix<double> grassmann_median<double>(const Matrix<double>&, int, uint64_t);

} // namespace grassmann
