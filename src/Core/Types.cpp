#include <Perspec/Core/Types.h>
#include <Perspec/Core/Exception.h>

#include <string>

namespace Perspec {

// =============================================================================
// Corners Implementation
// =============================================================================

Corners Corners::FromPoints(const std::vector<Point2d>& points) {
    if (points.size() != static_cast<size_t>(COUNT)) {
        throw InvalidArgumentException("Corners::FromPoints: expected 4 points, got " +
                                       std::to_string(points.size()));
    }
    return Corners(points[0], points[1], points[2], points[3]);
}

Corners Corners::FromRectangle(double width, double height) {
    return Corners({0.0, 0.0}, {width, 0.0}, {width, height}, {0.0, height});
}

Point2d& Corners::At(int32_t i) {
    if (i < 0 || i >= COUNT) {
        throw OutOfRangeException("Corners::At: index " + std::to_string(i));
    }
    return points_[static_cast<size_t>(i)];
}

const Point2d& Corners::At(int32_t i) const {
    if (i < 0 || i >= COUNT) {
        throw OutOfRangeException("Corners::At: index " + std::to_string(i));
    }
    return points_[static_cast<size_t>(i)];
}

std::vector<Point2d> Corners::ToVector() const {
    return std::vector<Point2d>(points_.begin(), points_.end());
}

bool Corners::HasNaN() const {
    for (const auto& p : points_) {
        if (std::isnan(p.x) || std::isnan(p.y)) {
            return true;
        }
    }
    return false;
}

bool Corners::IsFinite() const {
    for (const auto& p : points_) {
        if (!p.IsValid()) {
            return false;
        }
    }
    return true;
}

} // namespace Perspec
