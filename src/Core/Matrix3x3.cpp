#include <Perspec/Core/Matrix3x3.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Perspec {

namespace {

constexpr double EPSILON = 1e-10;

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

Matrix3x3::Matrix3x3() : m_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0} {}

Matrix3x3::Matrix3x3(double m00, double m01, double m02,
                     double m10, double m11, double m12,
                     double m20, double m21, double m22)
    : m_{m00, m01, m02, m10, m11, m12, m20, m21, m22} {}

Matrix3x3::Matrix3x3(const double* elements) {
    std::copy(elements, elements + 9, m_.begin());
}

// =============================================================================
// Static Factory Methods
// =============================================================================

Matrix3x3 Matrix3x3::Identity() {
    return Matrix3x3();
}

Matrix3x3 Matrix3x3::Translation(double tx, double ty) {
    return Matrix3x3(1.0, 0.0, tx, 0.0, 1.0, ty, 0.0, 0.0, 1.0);
}

Matrix3x3 Matrix3x3::Scaling(double sx, double sy) {
    return Matrix3x3(sx, 0.0, 0.0, 0.0, sy, 0.0, 0.0, 0.0, 1.0);
}

Matrix3x3 Matrix3x3::Rotation(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    return Matrix3x3(c, -s, 0.0, s, c, 0.0, 0.0, 0.0, 1.0);
}

// =============================================================================
// Matrix Operations
// =============================================================================

Matrix3x3 Matrix3x3::operator*(const Matrix3x3& other) const {
    Matrix3x3 result;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            double sum = 0.0;
            for (int k = 0; k < 3; ++k) {
                sum += m_[i * 3 + k] * other.m_[k * 3 + j];
            }
            result.m_[i * 3 + j] = sum;
        }
    }
    return result;
}

bool Matrix3x3::operator==(const Matrix3x3& other) const {
    return m_ == other.m_;
}

bool Matrix3x3::operator!=(const Matrix3x3& other) const {
    return !(*this == other);
}

double Matrix3x3::Determinant() const {
    return m_[0] * (m_[4] * m_[8] - m_[5] * m_[7])
         - m_[1] * (m_[3] * m_[8] - m_[5] * m_[6])
         + m_[2] * (m_[3] * m_[7] - m_[4] * m_[6]);
}

Matrix3x3 Matrix3x3::Inverse() const {
    double det = Determinant();
    if (std::abs(det) < EPSILON) {
        return Identity();
    }

    double invDet = 1.0 / det;

    // Adjugate
    return Matrix3x3(
        (m_[4] * m_[8] - m_[5] * m_[7]) * invDet,
        (m_[2] * m_[7] - m_[1] * m_[8]) * invDet,
        (m_[1] * m_[5] - m_[2] * m_[4]) * invDet,
        (m_[5] * m_[6] - m_[3] * m_[8]) * invDet,
        (m_[0] * m_[8] - m_[2] * m_[6]) * invDet,
        (m_[2] * m_[3] - m_[0] * m_[5]) * invDet,
        (m_[3] * m_[7] - m_[4] * m_[6]) * invDet,
        (m_[1] * m_[6] - m_[0] * m_[7]) * invDet,
        (m_[0] * m_[4] - m_[1] * m_[3]) * invDet
    );
}

Matrix3x3 Matrix3x3::Normalized() const {
    if (std::abs(m_[8]) < EPSILON) {
        return *this;
    }

    double invM22 = 1.0 / m_[8];
    Matrix3x3 result;
    for (int i = 0; i < 9; ++i) {
        result.m_[i] = m_[i] * invM22;
    }
    return result;
}

// =============================================================================
// Checks
// =============================================================================

bool Matrix3x3::IsFinite() const {
    return std::all_of(m_.begin(), m_.end(), [](double v) { return std::isfinite(v); });
}

bool Matrix3x3::IsIdentity(double tolerance) const {
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            double expected = (i == j) ? 1.0 : 0.0;
            if (!(std::abs(m_[i * 3 + j] - expected) <= tolerance)) {
                return false;
            }
        }
    }
    return true;
}

bool Matrix3x3::IsAffine(double tolerance) const {
    return std::abs(m_[6]) < tolerance && std::abs(m_[7]) < tolerance;
}

// =============================================================================
// Point Transformation
// =============================================================================

Point2d Matrix3x3::Transform(const Point2d& p) const {
    return Transform(p.x, p.y);
}

Point2d Matrix3x3::Transform(double x, double y) const {
    double w = m_[6] * x + m_[7] * y + m_[8];

    if (std::abs(w) < EPSILON) {
        // Point at infinity
        return {std::numeric_limits<double>::infinity(),
                std::numeric_limits<double>::infinity()};
    }

    double invW = 1.0 / w;
    return {
        (m_[0] * x + m_[1] * y + m_[2]) * invW,
        (m_[3] * x + m_[4] * y + m_[5]) * invW
    };
}

std::vector<Point2d> Matrix3x3::Transform(const std::vector<Point2d>& points) const {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(Transform(p));
    }
    return result;
}

} // namespace Perspec
