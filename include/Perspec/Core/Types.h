#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for Perspec
 */

#include <Perspec/Core/Export.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

namespace Perspec {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with double precision
 */
struct PERSPEC_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Quadrilateral Corners
// =============================================================================

/**
 * @brief Position of a corner inside a Corners set
 *
 * The numeric value is the storage index; the winding is clockwise in
 * image coordinates (y pointing down).
 */
enum class CornerIndex : int32_t {
    TopLeft = 0,
    TopRight = 1,
    BottomRight = 2,
    BottomLeft = 3
};

/**
 * @brief Four corners of a quadrilateral in TL, TR, BR, BL order
 *
 * The ordering is trusted as given. Only numeric well-formedness is ever
 * checked; convexity and winding are the caller's responsibility.
 */
class PERSPEC_API Corners {
public:
    static constexpr int32_t COUNT = 4;

    /// Default constructor (all corners at origin)
    Corners() = default;

    Corners(const Point2d& topLeft, const Point2d& topRight,
            const Point2d& bottomRight, const Point2d& bottomLeft)
        : points_{{topLeft, topRight, bottomRight, bottomLeft}} {}

    explicit Corners(const std::array<Point2d, 4>& points) : points_(points) {}

    /**
     * @brief Build from a dynamic point list
     * @throws InvalidArgumentException if points does not hold exactly 4 points
     */
    static Corners FromPoints(const std::vector<Point2d>& points);

    /// Axis-aligned rectangle (0,0), (w,0), (w,h), (0,h)
    static Corners FromRectangle(double width, double height);

    // =========================================================================
    // Element Access
    // =========================================================================

    Point2d& operator[](CornerIndex idx) { return points_[static_cast<size_t>(idx)]; }
    const Point2d& operator[](CornerIndex idx) const { return points_[static_cast<size_t>(idx)]; }

    /**
     * @brief Indexed access
     * @throws OutOfRangeException if i is not in [0, 3]
     */
    Point2d& At(int32_t i);
    const Point2d& At(int32_t i) const;

    const Point2d& TopLeft() const { return points_[0]; }
    const Point2d& TopRight() const { return points_[1]; }
    const Point2d& BottomRight() const { return points_[2]; }
    const Point2d& BottomLeft() const { return points_[3]; }

    const std::array<Point2d, 4>& Points() const { return points_; }
    std::vector<Point2d> ToVector() const;

    // =========================================================================
    // Checks
    // =========================================================================

    /// True if any of the 8 coordinates is NaN
    bool HasNaN() const;

    /// True if all 8 coordinates are finite
    bool IsFinite() const;

    bool operator==(const Corners& other) const { return points_ == other.points_; }
    bool operator!=(const Corners& other) const { return !(*this == other); }

private:
    std::array<Point2d, 4> points_{};
};

} // namespace Perspec
