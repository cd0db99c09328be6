/**
 * Grassmann median C API implementation
 *
 * Translates the C++ exception hierarchy into GrassmannStatus codes.
 */

#include "grassmann_c.h"
#include "grassmann/error.hpp"
#include "grassmann/grassmann_median.hpp"
#include "grassmann/logging.hpp"

#include <exception>
#include <new>
#include <string>

using namespace grassmann;

namespace {

thread_local std::string g_last_error;

GrassmannStatus status_from_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:             return GRASSMANN_OK;
        case ErrorCode::MISSING_INPUT:       return GRASSMANN_ERR_MISSING_INPUT;
        case ErrorCode::INVALID_DIMENSION:   return GRASSMANN_ERR_INVALID_DIMENSION;
        case ErrorCode::INVALID_ARGUMENT:    return GRASSMANN_ERR_INVALID_ARGUMENT;
        case ErrorCode::DEGENERATE_SUBSPACE: return GRASSMANN_ERR_DEGENERATE;
        case ErrorCode::INTERNAL_ERROR:      return GRASSMANN_ERR_INTERNAL;
    }
    return GRASSMANN_ERR_INTERNAL;
}

template<typename Scalar>
GrassmannStatus run_median(const Scalar* data, size_t n, size_t d, int k,
                           uint64_t seed, Scalar* out_basis) {
    g_last_error.clear();
    try {
        GRASSMANN_CHECK_POINTER(out_basis, "out_basis");

        GrassmannConfig config;
        config.seed = seed;
        GrassmannResult<Scalar> result = GrassmannMedian<Scalar>(config).compute(data, n, d, k);

        Eigen::Map<Matrix<Scalar>> out(out_basis, result.basis.rows(), result.basis.cols());
        out = result.basis;
        return GRASSMANN_OK;
    } catch (const GrassmannException& e) {
        g_last_error = e.what();
        LOG_WARN("grassmann_c: ", e.what());
        return status_from_code(e.code());
    } catch (const std::bad_alloc& e) {
        g_last_error = std::string("out of memory: ") + e.what();
        LOG_ERROR("grassmann_c: ", g_last_error);
        return GRASSMANN_ERR_INTERNAL;
    } catch (const std::exception& e) {
        g_last_error = e.what();
        LOG_ERROR("grassmann_c: ", e.what());
        return GRASSMANN_ERR_INTERNAL;
    }
}

} // anonymous namespace

extern "C" {

GrassmannStatus grassmann_c_median_f64(const double* data, size_t n, size_t d, int k,
                                       uint64_t seed, double* out_basis) {
    return run_median<double>(data, n, d, k, seed, out_basis);
}

GrassmannStatus grassmann_c_median_f32(const float* data, size_t n, size_t d, int k,
                                       uint64_t seed, float* out_basis) {
    return run_median<float>(data, n, d, k, seed, out_basis);
}

const char* grassmann_c_last_error(void) {
    return g_last_error.c_str();
}

const char* grassmann_c_status_string(GrassmannStatus status) {
    switch (status) {
        case GRASSMANN_OK:                    return error_code_name(ErrorCode::SUCCESS);
        case GRASSMANN_ERR_MISSING_INPUT:     return error_code_name(ErrorCode::MISSING_INPUT);
        case GRASSMANN_ERR_INVALID_DIMENSION: return error_code_name(ErrorCode::INVALID_DIMENSION);
        case GRASSMANN_ERR_INVALID_ARGUMENT:  return error_code_name(ErrorCode::INVALID_ARGUMENT);
        case GRASSMANN_ERR_DEGENERATE:        return error_code_name(ErrorCode::DEGENERATE_SUBSPACE);
        case GRASSMANN_ERR_INTERNAL:          return error_code_name(ErrorCode::INTERNAL_ERROR);
    }
    return "unknown status";
}

} // extern "C"
