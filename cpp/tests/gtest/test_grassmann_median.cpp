// =============================================================================
// Grassmann Median Solver Tests
// =============================================================================

#include <gtest/gtest.h>
#include "grassmann/deflator.hpp"
#include "grassmann/error.hpp"
#include "grassmann/grassmann_median.hpp"
#include "grassmann/initializer.hpp"
#include "grassmann/linear_algebra.hpp"
#include "grassmann/robust_averager.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>

using namespace grassmann;

class GrassmannMedianTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Seed RNG for reproducible tests
        rng.seed(42);
    }

    std::mt19937 rng;

    // Gaussian cloud with a different scale per coordinate
    Matrix<double> anisotropic_cloud(Index n, const std::vector<double>& scales) {
        std::normal_distribution<double> dist(0.0, 1.0);
        const Index d = static_cast<Index>(scales.size());
        Matrix<double> X(n, d);
        for (Index i = 0; i < n; ++i) {
            for (Index j = 0; j < d; ++j) {
                X(i, j) = scales[static_cast<size_t>(j)] * dist(rng);
            }
        }
        return X;
    }

    // Points t_i * e0 plus small isotropic noise
    Matrix<double> line_along_first_axis(Index n, Index d, double noise) {
        std::normal_distribution<double> dist(0.0, 1.0);
        Matrix<double> X(n, d);
        for (Index i = 0; i < n; ++i) {
            for (Index j = 0; j < d; ++j) {
                X(i, j) = noise * dist(rng);
            }
            X(i, 0) += dist(rng);
        }
        return X;
    }

    // Inliers along e0; outliers of magnitude ~10 along (e0 + e1) / sqrt(2)
    Matrix<double> line_with_outliers(Index inliers, Index outliers, Index d) {
        Matrix<double> X(inliers + outliers, d);
        X.topRows(inliers) = line_along_first_axis(inliers, d, 0.01);

        std::normal_distribution<double> noise(0.0, 0.01);
        std::uniform_real_distribution<double> magnitude(8.0, 12.0);
        const double w = 1.0 / std::sqrt(2.0);
        for (Index j = 0; j < outliers; ++j) {
            const double a = (j % 2 == 0 ? 1.0 : -1.0) * magnitude(rng);
            Index row = inliers + j;
            for (Index c = 0; c < d; ++c) {
                X(row, c) = noise(rng);
            }
            X(row, 0) += a * w;
            X(row, 1) += a * w;
        }
        return X;
    }

    // Top eigenvector of X^T X (ordinary uncentered PCA)
    static Vector<double> pca_direction(const Matrix<double>& X) {
        Eigen::SelfAdjointEigenSolver<Matrix<double>> solver(X.transpose() * X);
        return solver.eigenvectors().col(X.cols() - 1);
    }

    static Vector<double> axis(Index d, Index which) {
        Vector<double> e = Vector<double>::Zero(d);
        e[which] = 1.0;
        return e;
    }

    static GrassmannConfig config_with_seed(uint64_t seed) {
        GrassmannConfig config;
        config.seed = seed;
        config.num_threads = 1;
        return config;
    }
};

// Output is D x K with one stats record per column
TEST_F(GrassmannMedianTest, ShapeContract) {
    Matrix<double> X = anisotropic_cloud(120, {5.0, 4.0, 3.0, 2.0, 1.0, 0.5});

    for (int K = 1; K <= 6; ++K) {
        auto result = GrassmannMedian<double>(config_with_seed(7)).compute(X, K);
        EXPECT_EQ(result.basis.rows(), 6);
        EXPECT_EQ(result.basis.cols(), K);
        EXPECT_EQ(result.components.size(), static_cast<size_t>(K));
    }
}

TEST_F(GrassmannMedianTest, ColumnsAreUnitNorm) {
    Matrix<double> X = anisotropic_cloud(200, {5.0, 4.0, 3.0, 2.0, 1.0, 0.5});
    Matrix<double> basis = grassmann_median(X, 4, 11);

    for (Index k = 0; k < basis.cols(); ++k) {
        EXPECT_NEAR(basis.col(k).norm(), 1.0, 1e-6) << "column " << k;
    }
}

TEST_F(GrassmannMedianTest, ColumnsAreMutuallyOrthogonal) {
    Matrix<double> X = anisotropic_cloud(200, {5.0, 4.0, 3.0, 2.0, 1.0, 0.5});
    Matrix<double> basis = grassmann_median(X, 4, 11);

    for (Index i = 0; i < basis.cols(); ++i) {
        for (Index j = i + 1; j < basis.cols(); ++j) {
            EXPECT_NEAR(basis.col(i).dot(basis.col(j)), 0.0, 1e-6) << "columns " << i << ", " << j;
        }
    }
    EXPECT_LT(la::orthonormality_error(basis), 1e-6);
}

// Full basis K = D is a rotation
TEST_F(GrassmannMedianTest, FullBasisIsOrthonormal) {
    Matrix<double> X = anisotropic_cloud(150, {3.0, 2.0, 1.0, 0.5});
    Matrix<double> basis = grassmann_median(X, 4, 3);

    EXPECT_LT(la::orthonormality_error(basis), 1e-6);
}

// Negating the data leaves every column unchanged up to sign
TEST_F(GrassmannMedianTest, SignInvariance) {
    Matrix<double> X = anisotropic_cloud(150, {4.0, 3.0, 2.0, 1.0, 0.5});
    Matrix<double> negated = -X;

    Matrix<double> a = grassmann_median(X, 3, 5);
    Matrix<double> b = grassmann_median(negated, 3, 5);

    for (Index k = 0; k < a.cols(); ++k) {
        double same = (a.col(k) - b.col(k)).cwiseAbs().maxCoeff();
        double flipped = (a.col(k) + b.col(k)).cwiseAbs().maxCoeff();
        EXPECT_LT(std::min(same, flipped), 1e-9) << "column " << k;
    }
}

// Outliers pull ordinary PCA but not the median
TEST_F(GrassmannMedianTest, OutlierRobustness) {
    const Index d = 5;
    Matrix<double> X = line_with_outliers(80, 20, d);
    const Vector<double> v = axis(d, 0);

    Matrix<double> basis = grassmann_median(X, 1, 1);
    double robust_alignment = std::abs(basis.col(0).dot(v));

    double pca_alignment = std::abs(pca_direction(X).dot(v));

    EXPECT_GT(robust_alignment, 0.999);
    EXPECT_LT(pca_alignment, 0.9);
}

// The mean-based Grassmann average is pulled by the same outliers
TEST_F(GrassmannMedianTest, MeanAverageIsLessRobust) {
    const Index d = 5;
    Matrix<double> X = line_with_outliers(80, 20, d);
    const Vector<double> v = axis(d, 0);

    GrassmannConfig median_config = config_with_seed(1);
    GrassmannConfig mean_config = config_with_seed(1);
    mean_config.kind = AverageKind::MEAN;

    auto median = GrassmannMedian<double>(median_config).compute(X, 1);
    auto mean = GrassmannMedian<double>(mean_config).compute(X, 1);

    double median_alignment = std::abs(median.basis.col(0).dot(v));
    double mean_alignment = std::abs(mean.basis.col(0).dot(v));

    EXPECT_GT(median_alignment, 0.999);
    EXPECT_LT(mean_alignment, 0.95);
}

// Well-conditioned data converges before the N-iteration cap and the
// result is a fixed point of one more update
TEST_F(GrassmannMedianTest, ConvergesBeforeCap) {
    Matrix<double> X = line_along_first_axis(100, 4, 0.01);

    auto result = GrassmannMedian<double>(config_with_seed(9)).compute(X, 1);
    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_TRUE(result.components[0].converged);
    EXPECT_LT(result.components[0].iterations, 100);
    EXPECT_LT(result.components[0].final_change, CONVERGENCE_TOLERANCE);

    RobustAverager<double> averager;
    Vector<double> once_more = averager.update(X, result.basis.col(0));
    EXPECT_LT(la::max_abs_difference(once_more, Vector<double>(result.basis.col(0))),
              CONVERGENCE_TOLERANCE);
}

// First column of a K = 3 run equals the K = 1 result for the same seed
TEST_F(GrassmannMedianTest, FirstColumnIndependentOfK) {
    Matrix<double> X = anisotropic_cloud(120, {4.0, 3.0, 2.0, 1.0});

    Matrix<double> single = grassmann_median(X, 1, 21);
    Matrix<double> triple = grassmann_median(X, 3, 21);

    for (Index d = 0; d < X.cols(); ++d) {
        EXPECT_DOUBLE_EQ(single(d, 0), triple(d, 0));
    }
}

TEST_F(GrassmannMedianTest, DeterministicForSeed) {
    Matrix<double> X = anisotropic_cloud(80, {3.0, 2.0, 1.0});

    Matrix<double> a = grassmann_median(X, 2, 1234);
    Matrix<double> b = grassmann_median(X, 2, 1234);
    EXPECT_TRUE(a == b);
}

TEST_F(GrassmannMedianTest, ThreadCountDoesNotChangeResult) {
    Matrix<double> X = anisotropic_cloud(90, {5.0, 4.0, 3.0, 2.0, 1.0, 0.5, 0.25});

    GrassmannConfig serial = config_with_seed(3);
    GrassmannConfig parallel = config_with_seed(3);
    parallel.num_threads = 4;

    auto a = GrassmannMedian<double>(serial).compute(X, 3);
    auto b = GrassmannMedian<double>(parallel).compute(X, 3);
    EXPECT_TRUE(a.basis == b.basis);
}

TEST_F(GrassmannMedianTest, InputIsNotModified) {
    Matrix<double> X = anisotropic_cloud(60, {3.0, 2.0, 1.0});
    const Matrix<double> copy = X;

    grassmann_median(X, 2, 0);
    EXPECT_TRUE(X == copy);
}

TEST_F(GrassmannMedianTest, RowMajorPointerOverloadMatchesMatrix) {
    Matrix<double> X = anisotropic_cloud(50, {3.0, 2.0, 1.0});
    RowMajorMatrix<double> row_major = X;

    GrassmannMedian<double> solver(config_with_seed(8));
    auto from_matrix = solver.compute(X, 2);
    auto from_pointer = solver.compute(row_major.data(), 50, 3, 2);
    EXPECT_TRUE(from_matrix.basis == from_pointer.basis);
}

TEST_F(GrassmannMedianTest, SinglePrecision) {
    Matrix<float> X = anisotropic_cloud(100, {4.0, 2.0, 1.0, 0.5}).cast<float>();

    Matrix<float> basis = grassmann_median(X, 2, 17);
    ASSERT_EQ(basis.rows(), 4);
    ASSERT_EQ(basis.cols(), 2);
    EXPECT_NEAR(basis.col(0).norm(), 1.0f, 1e-5f);
    EXPECT_NEAR(basis.col(1).norm(), 1.0f, 1e-5f);
    EXPECT_NEAR(basis.col(0).dot(basis.col(1)), 0.0f, 1e-5f);
}

TEST_F(GrassmannMedianTest, SingleObservation) {
    Matrix<double> X(1, 3);
    X << 1.0, 2.0, 2.0;

    auto result = GrassmannMedian<double>(config_with_seed(2)).compute(X, 1);
    EXPECT_EQ(result.components[0].iterations, 1);
    EXPECT_NEAR(std::abs(result.basis.col(0).dot(X.row(0).transpose() / 3.0)), 1.0, 1e-12);
}

// =============================================================================
// Failure modes
// =============================================================================

TEST_F(GrassmannMedianTest, AllZeroDataIsDegenerate) {
    Matrix<double> X = Matrix<double>::Zero(10, 4);
    EXPECT_THROW(grassmann_median(X, 1, 0), DegenerateSubspaceError);
    EXPECT_THROW(grassmann_median(X, 3, 0), DegenerateSubspaceError);
}

// Rank-one data has nothing left after the first direction
TEST_F(GrassmannMedianTest, RequestBeyondRankIsDegenerate) {
    Matrix<double> X = Matrix<double>::Zero(20, 3);
    for (Index i = 0; i < 20; ++i) {
        X(i, 0) = static_cast<double>(i) - 9.5;
    }

    EXPECT_NO_THROW(grassmann_median(X, 1, 0));
    EXPECT_THROW(grassmann_median(X, 2, 0), DegenerateSubspaceError);
}

TEST_F(GrassmannMedianTest, EmptyDataIsMissingInput) {
    EXPECT_THROW(grassmann_median(Matrix<double>(0, 3), 1, 0), MissingInputError);
    EXPECT_THROW(grassmann_median(Matrix<double>(5, 0), 1, 0), MissingInputError);
}

TEST_F(GrassmannMedianTest, NullPointerIsMissingInput) {
    GrassmannMedian<double> solver;
    EXPECT_THROW(solver.compute(nullptr, 10, 3, 1), MissingInputError);
}

TEST_F(GrassmannMedianTest, InvalidDimensionRequests) {
    Matrix<double> X = anisotropic_cloud(30, {2.0, 1.0, 0.5});

    EXPECT_THROW(grassmann_median(X, 0, 0), InvalidDimensionError);
    EXPECT_THROW(grassmann_median(X, -2, 0), InvalidDimensionError);
    EXPECT_THROW(grassmann_median(X, 4, 0), InvalidDimensionError);
}

// Dimension checks run before any iteration, so they win over degeneracy
TEST_F(GrassmannMedianTest, DimensionCheckedBeforeIterating) {
    Matrix<double> X = Matrix<double>::Zero(10, 3);
    EXPECT_THROW(grassmann_median(X, 0, 0), InvalidDimensionError);
}

TEST_F(GrassmannMedianTest, NonFiniteDataRejected) {
    Matrix<double> X = anisotropic_cloud(10, {1.0, 1.0});
    X(3, 1) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(grassmann_median(X, 1, 0), InvalidArgumentError);

    X(3, 1) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(grassmann_median(X, 1, 0), InvalidArgumentError);
}

TEST_F(GrassmannMedianTest, ExceptionsCarryCodeAndContext) {
    Matrix<double> X = anisotropic_cloud(10, {1.0, 1.0});
    try {
        grassmann_median(X, 5, 0);
        FAIL() << "expected InvalidDimensionError";
    } catch (const GrassmannException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_DIMENSION);
        EXPECT_FALSE(e.context().empty());
        EXPECT_NE(std::string(e.what()).find("invalid dimensionality"), std::string::npos);
    }
}

// =============================================================================
// Phase components
// =============================================================================

TEST_F(GrassmannMedianTest, InitializerProducesUnitVector) {
    std::mt19937_64 engine(5);
    Initializer<double> init(engine);
    Vector<double> mu = init.random_unit_vector(8);
    EXPECT_NEAR(mu.norm(), 1.0, 1e-12);
    EXPECT_LE(mu.cwiseAbs().maxCoeff(), 1.0);
}

TEST_F(GrassmannMedianTest, InitializerIsReproducible) {
    Matrix<double> X = anisotropic_cloud(40, {3.0, 2.0, 1.0});

    std::mt19937_64 e1(99), e2(99);
    Initializer<double> a(e1), b(e2);
    EXPECT_TRUE(a.initial_direction(X) == b.initial_direction(X));
}

// Power steps on rank-one data land exactly on its direction
TEST_F(GrassmannMedianTest, InitializerFindsRankOneDirection) {
    Vector<double> v(3);
    v << 1.0, -2.0, 2.0;
    v /= 3.0;
    Matrix<double> X(10, 3);
    for (Index i = 0; i < 10; ++i) {
        X.row(i) = (static_cast<double>(i) - 4.5) * v.transpose();
    }

    std::mt19937_64 engine(1);
    Initializer<double> init(engine);
    Vector<double> mu = init.initial_direction(X);
    EXPECT_NEAR(std::abs(mu.dot(v)), 1.0, 1e-12);
}

TEST_F(GrassmannMedianTest, AveragerIterationCapIsObservationCount) {
    EXPECT_EQ(RobustAverager<double>::iteration_cap(1), 1);
    EXPECT_EQ(RobustAverager<double>::iteration_cap(250), 250);
}

// One observation allows one update; a start far from the row cannot
// settle in that step, so the last iterate comes back without an error
TEST_F(GrassmannMedianTest, AveragerReturnsLastIterateAtCap) {
    Matrix<double> X(1, 3);
    X << 2.0, 0.0, 0.0;
    Vector<double> start = Vector<double>::Ones(3).normalized();

    AveragerOutcome<double> outcome;
    ASSERT_NO_THROW(outcome = RobustAverager<double>().run(X, start));

    EXPECT_FALSE(outcome.converged);
    EXPECT_EQ(outcome.iterations, 1);
    EXPECT_GT(outcome.last_change, CONVERGENCE_TOLERANCE);
    EXPECT_NEAR(outcome.direction.norm(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(outcome.direction[0], 1.0);
}

TEST_F(GrassmannMedianTest, AveragerWorkerCount) {
    EXPECT_EQ(RobustAverager<double>().num_threads(), 1);
    EXPECT_EQ(RobustAverager<double>(AverageKind::MEDIAN, 3).num_threads(), 3);
    // The mean needs no per-coordinate workers
    EXPECT_EQ(RobustAverager<double>(AverageKind::MEAN, 3).num_threads(), 1);
}

// Reusing the pool across iterations gives the serial result
TEST_F(GrassmannMedianTest, PooledAveragerMatchesSerial) {
    Matrix<double> X = anisotropic_cloud(75, {5.0, 3.0, 2.0, 1.0, 0.5});
    Vector<double> start = Vector<double>::Ones(5).normalized();

    auto serial = RobustAverager<double>(AverageKind::MEDIAN, 1).run(X, start);
    auto pooled = RobustAverager<double>(AverageKind::MEDIAN, 4).run(X, start);

    EXPECT_EQ(serial.iterations, pooled.iterations);
    EXPECT_EQ(serial.converged, pooled.converged);
    EXPECT_TRUE(serial.direction == pooled.direction);
}

TEST_F(GrassmannMedianTest, DeflatorStoresAndDeflates) {
    Matrix<double> residual = anisotropic_cloud(30, {3.0, 2.0, 1.0});
    Deflator<double> deflator(3, 2);

    Vector<double> first = axis(3, 0);
    deflator.accept(first, residual);
    EXPECT_EQ(deflator.total(), 2);
    EXPECT_EQ(deflator.stored(), 1);
    EXPECT_FALSE(deflator.complete());
    EXPECT_TRUE(deflator.basis().col(0) == first);
    EXPECT_LT(residual.col(0).cwiseAbs().maxCoeff(), 1e-12);

    // Last vector: reorthogonalized against the first, residual left alone
    Vector<double> second(3);
    second << 1.0, 1.0, 0.0;
    second.normalize();
    const Matrix<double> before = residual;
    deflator.accept(second, residual);

    EXPECT_TRUE(deflator.complete());
    EXPECT_TRUE(residual == before);
    EXPECT_NEAR(deflator.basis()(0, 1), 0.0, 1e-15);
    EXPECT_NEAR(deflator.basis()(1, 1), 1.0, 1e-15);
}

TEST_F(GrassmannMedianTest, DeflatorRejectsExtraVectors) {
    Matrix<double> residual = anisotropic_cloud(5, {1.0, 1.0});
    Deflator<double> deflator(2, 1);
    deflator.accept(axis(2, 0), residual);

    try {
        deflator.accept(axis(2, 1), residual);
        FAIL() << "expected GrassmannException";
    } catch (const GrassmannException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTERNAL_ERROR);
    }
}
