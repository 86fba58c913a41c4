#pragma once

/**
 * @file Perspective.h
 * @brief Public four-corner perspective transform API
 *
 * Every function here returns a usable, fully finite matrix. When the
 * corners are missing, non-finite or degenerate, the result is a copy of
 * IdentityFallback(); the reason is only reported through the library
 * logger at debug level.
 *
 * Corner order is always TL, TR, BR, BL.
 */

#include <Perspec/Core/Export.h>
#include <Perspec/Core/Matrix3x3.h>
#include <Perspec/Core/Types.h>
#include <Perspec/Internal/Homography.h>

#include <vector>

namespace Perspec::Transform {

/**
 * @brief Estimation options
 *
 * normalizePoints enables centroid/scale preconditioning before solving.
 * It is off by default because it changes intermediate conditioning and
 * therefore the numerical result.
 */
struct PERSPEC_API PerspectiveParams {
    bool normalizePoints = false;
    double pivotThreshold = Internal::GAUSS_PIVOT_THRESHOLD;       ///< Minimum pivot magnitude in the 8x8 solve
    double maxCoefficient = Internal::HOMOGRAPHY_MAX_COEFFICIENT;  ///< Largest accepted coefficient
};

/**
 * @brief The shared identity matrix returned on every failure
 *
 * Immutable for the lifetime of the process; safe to read from any thread.
 */
PERSPEC_API const Matrix3x3& IdentityFallback();

/**
 * @brief Compute the homography mapping src corners onto dst corners
 *
 * @param src Source quadrilateral (TL, TR, BR, BL)
 * @param dst Destination quadrilateral (TL, TR, BR, BL)
 * @return Homography with m22 = 1, or IdentityFallback() on failure
 */
PERSPEC_API Matrix3x3 ComputePerspectiveTransform(const Corners& src, const Corners& dst);

PERSPEC_API Matrix3x3 ComputePerspectiveTransform(const Corners& src, const Corners& dst,
                                                  const PerspectiveParams& params);

/**
 * @brief Point-list variant
 *
 * A list that does not hold exactly four points counts as missing input
 * and yields IdentityFallback().
 */
PERSPEC_API Matrix3x3 ComputePerspectiveTransform(const std::vector<Point2d>& src,
                                                  const std::vector<Point2d>& dst,
                                                  const PerspectiveParams& params = PerspectiveParams());

/**
 * @brief Homography that maps a quadrilateral onto the upright rectangle
 *        (0,0), (width,0), (width,height), (0,height)
 */
PERSPEC_API Matrix3x3 RectifyQuadrilateral(const Corners& quad, double width, double height,
                                           const PerspectiveParams& params = PerspectiveParams());

/**
 * @brief Homography that maps the upright rectangle of size width x height
 *        onto a quadrilateral
 */
PERSPEC_API Matrix3x3 RectangleToQuadrilateral(double width, double height, const Corners& quad,
                                               const PerspectiveParams& params = PerspectiveParams());

/**
 * @brief Apply a homography to a point: (wx / w, wy / w)
 *
 * Points mapped to infinity (|w| < 1e-10) come back with infinite coordinates.
 */
PERSPEC_API Point2d ProjectPoint(const Matrix3x3& H, const Point2d& p);

PERSPEC_API std::vector<Point2d> ProjectPoints(const Matrix3x3& H, const std::vector<Point2d>& points);

} // namespace Perspec::Transform
