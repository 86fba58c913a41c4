#pragma once

/**
 * @file Matrix3x3.h
 * @brief 3x3 projective transformation matrix for Perspec
 *
 * Represents a homogeneous 2D projective transform:
 * | m00  m01  m02 |
 * | m10  m11  m12 |
 * | m20  m21  m22 |
 *
 * Transforms point (x, y) to:
 *   wx = m00*x + m01*y + m02
 *   wy = m10*x + m11*y + m12
 *   w  = m20*x + m21*y + m22
 *   (x', y') = (wx / w, wy / w)
 */

#include <Perspec/Core/Types.h>
#include <Perspec/Core/Export.h>

#include <array>
#include <vector>

namespace Perspec {

/**
 * @brief Homogeneous 2D projective transformation matrix (row-major)
 */
class PERSPEC_API Matrix3x3 {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (identity matrix)
    Matrix3x3();

    /// Construct from 9 elements (row-major)
    Matrix3x3(double m00, double m01, double m02,
              double m10, double m11, double m12,
              double m20, double m21, double m22);

    /// Construct from array of 9 elements (row-major)
    explicit Matrix3x3(const double* elements);

    // =========================================================================
    // Static Factory Methods
    // =========================================================================

    /// Identity matrix
    static Matrix3x3 Identity();

    /// Translation matrix
    static Matrix3x3 Translation(double tx, double ty);

    /// Non-uniform scaling matrix (around origin)
    static Matrix3x3 Scaling(double sx, double sy);

    /// Rotation matrix (angle in radians, around origin)
    static Matrix3x3 Rotation(double angle);

    // =========================================================================
    // Element Access
    // =========================================================================

    double& operator()(int row, int col) { return m_[row * 3 + col]; }
    double operator()(int row, int col) const { return m_[row * 3 + col]; }

    double* Data() { return m_.data(); }
    const double* Data() const { return m_.data(); }

    double M00() const { return m_[0]; }
    double M01() const { return m_[1]; }
    double M02() const { return m_[2]; }
    double M10() const { return m_[3]; }
    double M11() const { return m_[4]; }
    double M12() const { return m_[5]; }
    double M20() const { return m_[6]; }
    double M21() const { return m_[7]; }
    double M22() const { return m_[8]; }

    // =========================================================================
    // Matrix Operations
    // =========================================================================

    /// Matrix multiplication: this * other (apply other first)
    Matrix3x3 operator*(const Matrix3x3& other) const;

    /// Exact element-wise equality
    bool operator==(const Matrix3x3& other) const;
    bool operator!=(const Matrix3x3& other) const;

    double Determinant() const;

    /// Invert the matrix (returns identity if not invertible)
    Matrix3x3 Inverse() const;

    /// Scale so that m22 = 1 (unchanged if m22 is near zero)
    Matrix3x3 Normalized() const;

    // =========================================================================
    // Checks
    // =========================================================================

    /// True if all nine entries are finite
    bool IsFinite() const;

    bool IsIdentity(double tolerance = 1e-10) const;

    /// True if the perspective row is (0, 0, m22)
    bool IsAffine(double tolerance = 1e-10) const;

    // =========================================================================
    // Point Transformation
    // =========================================================================

    /// Transform a point; points mapped to infinity come back non-finite
    Point2d Transform(const Point2d& p) const;
    Point2d Transform(double x, double y) const;

    std::vector<Point2d> Transform(const std::vector<Point2d>& points) const;

private:
    std::array<double, 9> m_;
};

} // namespace Perspec
