/**
 * grassmann_c.h - C API for the Grassmann median solver
 *
 * Pure C entry points over the C++ library. Exceptions never cross this
 * boundary: every call returns a status code, and the message of the last
 * failure on the calling thread is available from grassmann_c_last_error().
 *
 * Data layout:
 *   input   row-major N x D (one observation per row)
 *   output  column-major D x K (one basis vector per column), caller-allocated
 */

#ifndef GRASSMANN_C_H
#define GRASSMANN_C_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(_MSC_VER)
    #ifdef GRASSMANN_C_EXPORTS
        #define GRASSMANN_C_API __declspec(dllexport)
    #else
        #define GRASSMANN_C_API __declspec(dllimport)
    #endif
#else
    #define GRASSMANN_C_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    GRASSMANN_OK = 0,
    GRASSMANN_ERR_MISSING_INPUT = 1,
    GRASSMANN_ERR_INVALID_DIMENSION = 2,
    GRASSMANN_ERR_INVALID_ARGUMENT = 3,
    GRASSMANN_ERR_DEGENERATE = 4,
    GRASSMANN_ERR_INTERNAL = 5
} GrassmannStatus;

/**
 * Estimate k robust orthonormal basis vectors of an n x d data set.
 *
 * @param data       Row-major n x d observations (must not be NULL)
 * @param n          Number of observations
 * @param d          Observation dimension
 * @param k          Number of basis vectors, 1 <= k <= d
 * @param seed       Seed of the random initialization
 * @param out_basis  Column-major d x k output buffer (must not be NULL)
 */
GRASSMANN_C_API GrassmannStatus grassmann_c_median_f64(
    const double* data,
    size_t n,
    size_t d,
    int k,
    uint64_t seed,
    double* out_basis
);

/** Single-precision variant of grassmann_c_median_f64. */
GRASSMANN_C_API GrassmannStatus grassmann_c_median_f32(
    const float* data,
    size_t n,
    size_t d,
    int k,
    uint64_t seed,
    float* out_basis
);

/** Message of the last failure on this thread, "" after a success. */
GRASSMANN_C_API const char* grassmann_c_last_error(void);

/** Static description of a status code. */
GRASSMANN_C_API const char* grassmann_c_status_string(GrassmannStatus status);

#ifdef __cplusplus
}
#endif

#endif /* GRASSMANN_C_H */
