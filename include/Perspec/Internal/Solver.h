#pragma once

/**
 * @file Solver.h
 * @brief Dense linear system solver for Perspec
 *
 * This module provides:
 * - Gaussian elimination with partial pivoting on fixed-size systems
 *
 * Used by:
 * - Homography.h (8x8 DLT system for four point correspondences)
 *
 * Design principles:
 * - Stack-resident augmented matrix, no allocation
 * - Fail-fast: any near-zero pivot or non-finite unknown aborts the solve,
 *   no partial solution is ever reported as valid
 */

#include <Perspec/Internal/Matrix.h>

namespace Perspec::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Minimum pivot magnitude accepted during elimination and back substitution
constexpr double GAUSS_PIVOT_THRESHOLD = 1e-10;

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Outcome of a Gaussian elimination solve
 */
enum class SolveStatus {
    Ok,                 ///< Fully determined, finite solution
    SingularPivot,      ///< Best pivot below threshold during forward elimination
    ZeroBackPivot,      ///< Diagonal entry below threshold during back substitution
    NonFiniteSolution   ///< An unknown came out NaN or infinite
};

/**
 * @brief Gaussian elimination result
 *
 * x is meaningful only when valid is true.
 */
template<int N>
struct GaussResult {
    Vec<N> x;
    SolveStatus status = SolveStatus::SingularPivot;
    bool valid = false;
    int failedRow = -1;     ///< Pivot row or unknown index that failed
};

// =============================================================================
// Solvers
// =============================================================================

/**
 * @brief Solve Ax = b by Gaussian elimination with partial pivoting
 *
 * Builds the augmented matrix [A|b], eliminates below each pivot after
 * swapping in the largest-magnitude candidate, then back-substitutes.
 * Every unknown is checked for finiteness as soon as it is computed.
 *
 * @param A Coefficient matrix (N x N)
 * @param b Right-hand side vector (N)
 * @param pivotThreshold Pivots with magnitude below this are treated as zero
 * @return GaussResult with valid=false and the failing status on any failure
 *
 * Complexity: O(N^3), fixed for a given N
 */
template<int N>
GaussResult<N> SolveGaussian(const Mat<N, N>& A, const Vec<N>& b,
                             double pivotThreshold = GAUSS_PIVOT_THRESHOLD);

/// Name of a solve status for diagnostics
const char* SolveStatusName(SolveStatus status);

} // namespace Perspec::Internal
