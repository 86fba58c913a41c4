/**
 * @file Perspective.cpp
 * @brief Implementation of the public perspective transform API
 */

#include <Perspec/Transform/Perspective.h>
#include <Perspec/Internal/Homography.h>

#include <optional>

namespace Perspec::Transform {

namespace {

Internal::EstimateParams ToInternalParams(const PerspectiveParams& params) {
    Internal::EstimateParams p;
    p.normalizePoints = params.normalizePoints;
    p.pivotThreshold = params.pivotThreshold;
    p.maxCoefficient = params.maxCoefficient;
    return p;
}

// Every failure becomes the shared identity; EstimatePerspective logs the reason
Matrix3x3 ComputeOrFallback(const Corners* src, const Corners* dst,
                            const PerspectiveParams& params) {
    Internal::HomographyEstimate estimate =
        Internal::EstimatePerspective(src, dst, ToInternalParams(params));
    return estimate.valid ? estimate.H : IdentityFallback();
}

} // anonymous namespace

const Matrix3x3& IdentityFallback() {
    static const Matrix3x3 identity = Matrix3x3::Identity();
    return identity;
}

Matrix3x3 ComputePerspectiveTransform(const Corners& src, const Corners& dst) {
    return ComputeOrFallback(&src, &dst, PerspectiveParams());
}

Matrix3x3 ComputePerspectiveTransform(const Corners& src, const Corners& dst,
                                      const PerspectiveParams& params) {
    return ComputeOrFallback(&src, &dst, params);
}

Matrix3x3 ComputePerspectiveTransform(const std::vector<Point2d>& src,
                                      const std::vector<Point2d>& dst,
                                      const PerspectiveParams& params) {
    std::optional<Corners> srcCorners;
    std::optional<Corners> dstCorners;
    if (src.size() == static_cast<size_t>(Corners::COUNT)) {
        srcCorners = Corners::FromPoints(src);
    }
    if (dst.size() == static_cast<size_t>(Corners::COUNT)) {
        dstCorners = Corners::FromPoints(dst);
    }
    return ComputeOrFallback(srcCorners ? &*srcCorners : nullptr,
                             dstCorners ? &*dstCorners : nullptr,
                             params);
}

Matrix3x3 RectifyQuadrilateral(const Corners& quad, double width, double height,
                               const PerspectiveParams& params) {
    Corners rect = Corners::FromRectangle(width, height);
    return ComputeOrFallback(&quad, &rect, params);
}

Matrix3x3 RectangleToQuadrilateral(double width, double height, const Corners& quad,
                                   const PerspectiveParams& params) {
    Corners rect = Corners::FromRectangle(width, height);
    return ComputeOrFallback(&rect, &quad, params);
}

Point2d ProjectPoint(const Matrix3x3& H, const Point2d& p) {
    return H.Transform(p);
}

std::vector<Point2d> ProjectPoints(const Matrix3x3& H, const std::vector<Point2d>& points) {
    return H.Transform(points);
}

} // namespace Perspec::Transform
