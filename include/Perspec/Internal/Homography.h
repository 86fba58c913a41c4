#pragma once

/**
 * @file Homography.h
 * @brief Four-point homography estimation kernel
 *
 * This module provides:
 * - DLT equation assembly from four point correspondences
 * - Point normalization (centroid removal + isotropic scaling)
 * - Status-reporting homography estimation pipeline
 *
 * The public entry point is Transform::ComputePerspectiveTransform, which
 * collapses every failure reported here to the identity fallback.
 *
 * Parameterization: h22 is fixed to 1, leaving 8 unknowns
 *   [h00, h01, h02, h10, h11, h12, h20, h21]
 */

#include <Perspec/Core/Matrix3x3.h>
#include <Perspec/Core/Types.h>
#include <Perspec/Internal/Matrix.h>
#include <Perspec/Internal/Solver.h>

#include <optional>

namespace Perspec::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Largest accepted magnitude for a solved unknown
constexpr double HOMOGRAPHY_MAX_COEFFICIENT = 1e6;

/// Mean centroid distance below which normalization does not rescale
constexpr double NORMALIZE_MIN_MEAN_DISTANCE = 1e-10;

// =============================================================================
// Status
// =============================================================================

/**
 * @brief Why an estimation did or did not produce a matrix
 */
enum class HomographyStatus {
    Ok,
    MissingInput,               ///< A corner set was absent
    NonFiniteCoordinate,        ///< NaN in any coordinate, or Inf in a correspondence
    SingularSystem,             ///< Pivot below threshold (degenerate quadrilateral)
    NonFiniteSolution,          ///< A solved unknown was NaN or Inf
    SolutionMagnitudeOverflow,  ///< A solved unknown exceeded the magnitude limit
    NonFiniteResultMatrix       ///< Assembled matrix is non-finite or has no h22 = 1 form
};

const char* HomographyStatusName(HomographyStatus status);

// =============================================================================
// Equation Builder
// =============================================================================

/**
 * @brief Linear system A * h = b for the 8 homography unknowns
 *
 * Rows 0-3 are the x-equations of TL, TR, BR, BL; rows 4-7 the y-equations.
 */
struct DltSystem {
    Mat88 A;
    Vec8 b;
};

/**
 * @brief Assemble the DLT system for four correspondences src[i] -> dst[i]
 *
 * For src = (sx, sy), dst = (dx, dy):
 *   x row: [sx, sy, 1, 0, 0, 0, -sx*dx, -sy*dx] = dx
 *   y row: [0, 0, 0, sx, sy, 1, -sx*dy, -sy*dy] = dy
 *
 * @return nullopt if any of the 16 coordinates is NaN, or any coordinate of
 *         a correspondence is infinite
 */
std::optional<DltSystem> BuildDltSystem(const Corners& src, const Corners& dst);

// =============================================================================
// Point Normalization
// =============================================================================

/**
 * @brief Parameters of an applied normalization: p' = (p + t) * scale
 */
struct NormalizationResult {
    double scale = 1.0;
    double tx = 0.0;    ///< Negated centroid x
    double ty = 0.0;    ///< Negated centroid y
};

/**
 * @brief Normalize corners in place
 *
 * Moves the centroid to the origin and scales so the mean distance to it
 * is sqrt(2). The scale stays 1 when the mean distance is below
 * NORMALIZE_MIN_MEAN_DISTANCE.
 */
NormalizationResult NormalizeCorners(Corners& corners);

/// Matrix T applying the normalization: p' = T * p
Matrix3x3 NormalizationMatrix(const NormalizationResult& norm);

/// Inverse of NormalizationMatrix
Matrix3x3 DenormalizationMatrix(const NormalizationResult& norm);

/**
 * @brief Map a homography solved in normalized coordinates back
 *
 * H = Tdst^-1 * Hnorm * Tsrc. The product is not rescaled: its h22 can be
 * zero when the mapping sends the source origin to infinity.
 */
Matrix3x3 DenormalizeHomography(const Matrix3x3& Hnorm,
                                const NormalizationResult& srcNorm,
                                const NormalizationResult& dstNorm);

// =============================================================================
// Estimation
// =============================================================================

/**
 * @brief Tunables of the estimation pipeline
 *
 * Defaults reproduce the reference behaviour exactly.
 */
struct EstimateParams {
    bool normalizePoints = false;
    double pivotThreshold = GAUSS_PIVOT_THRESHOLD;
    double maxCoefficient = HOMOGRAPHY_MAX_COEFFICIENT;
};

/**
 * @brief Estimation outcome; H is meaningful only when valid
 */
struct HomographyEstimate {
    Matrix3x3 H;
    HomographyStatus status = HomographyStatus::MissingInput;
    bool valid = false;
};

/**
 * @brief Estimate the homography mapping src corners onto dst corners
 *
 * Pipeline: presence check, NaN check over all 16 coordinates, equation
 * assembly (with per-correspondence Inf check), Gaussian elimination,
 * validation of the 8 unknowns (finite, |h| <= maxCoefficient), assembly
 * with h22 = 1, and a final finiteness check of all 9 entries.
 * Stops at the first failing step.
 *
 * @param src Source corners (TL, TR, BR, BL), may be null
 * @param dst Destination corners (TL, TR, BR, BL), may be null
 */
HomographyEstimate EstimatePerspective(const Corners* src, const Corners* dst,
                                       const EstimateParams& params = EstimateParams());

} // namespace Perspec::Internal
