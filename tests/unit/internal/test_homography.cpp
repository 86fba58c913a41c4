/**
 * @file test_homography.cpp
 * @brief Unit tests for Internal/Homography module
 */

#include <gtest/gtest.h>
#include <Perspec/Internal/Homography.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Perspec;
using namespace Perspec::Internal;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double Inf = std::numeric_limits<double>::infinity();

Corners UnitSquare() {
    return Corners::FromRectangle(1.0, 1.0);
}

Corners Skewed() {
    return Corners({12.5, 8.0}, {410.0, 22.0}, {395.0, 590.0}, {5.0, 570.0});
}

// The pair below is related by x' = 1/x, y' = y/x, i.e. H = [0 0 1; 0 1 0; 1 0 0],
// whose h22 is zero
Corners ReciprocalSource() {
    return Corners({1.0, 0.0}, {2.0, 0.0}, {2.0, 1.0}, {1.0, 1.0});
}

Corners ReciprocalTarget() {
    return Corners({1.0, 0.0}, {0.5, 0.0}, {0.5, 0.5}, {1.0, 1.0});
}

EstimateParams Normalizing() {
    EstimateParams params;
    params.normalizePoints = true;
    return params;
}

} // namespace

// =============================================================================
// Equation Builder Tests
// =============================================================================

TEST(DltSystemTest, RowLayout) {
    Corners src({1, 2}, {3, 4}, {5, 6}, {7, 8});
    Corners dst({10, 20}, {30, 40}, {50, 60}, {70, 80});

    auto system = BuildDltSystem(src, dst);
    ASSERT_TRUE(system.has_value());

    const double row0[8] = {1, 2, 1, 0, 0, 0, -10, -20};
    const double row2[8] = {5, 6, 1, 0, 0, 0, -250, -300};
    const double row4[8] = {0, 0, 0, 1, 2, 1, -20, -40};
    const double row7[8] = {0, 0, 0, 7, 8, 1, -560, -640};
    for (int j = 0; j < 8; ++j) {
        EXPECT_DOUBLE_EQ(system->A(0, j), row0[j]) << "col " << j;
        EXPECT_DOUBLE_EQ(system->A(2, j), row2[j]) << "col " << j;
        EXPECT_DOUBLE_EQ(system->A(4, j), row4[j]) << "col " << j;
        EXPECT_DOUBLE_EQ(system->A(7, j), row7[j]) << "col " << j;
    }

    // x-equations first (TL, TR, BR, BL), then y-equations
    const double rhs[8] = {10, 30, 50, 70, 20, 40, 60, 80};
    for (int i = 0; i < 8; ++i) {
        EXPECT_DOUBLE_EQ(system->b[i], rhs[i]);
    }
}

TEST(DltSystemTest, RejectsNaN) {
    for (int corner = 0; corner < 4; ++corner) {
        Corners src = UnitSquare();
        Corners dst = Skewed();
        dst.At(corner).y = NaN;
        EXPECT_FALSE(BuildDltSystem(src, dst).has_value()) << "dst corner " << corner;

        Corners src2 = UnitSquare();
        src2.At(corner).x = NaN;
        EXPECT_FALSE(BuildDltSystem(src2, Skewed()).has_value()) << "src corner " << corner;
    }
}

TEST(DltSystemTest, RejectsInfinity) {
    Corners src = UnitSquare();
    Corners dst = Skewed();
    dst.At(2).x = -Inf;
    EXPECT_FALSE(BuildDltSystem(src, dst).has_value());

    Corners src2 = UnitSquare();
    src2.At(3).y = Inf;
    EXPECT_FALSE(BuildDltSystem(src2, Skewed()).has_value());
}

// =============================================================================
// Point Normalization Tests
// =============================================================================

TEST(NormalizeCornersTest, CentroidAndMeanDistance) {
    Corners c = Skewed();
    Corners original = c;
    NormalizationResult norm = NormalizeCorners(c);

    double cx = 0.0, cy = 0.0, meanDist = 0.0;
    for (const auto& p : c.Points()) {
        cx += p.x;
        cy += p.y;
        meanDist += p.Norm();
    }
    EXPECT_NEAR(cx / 4, 0.0, 1e-12);
    EXPECT_NEAR(cy / 4, 0.0, 1e-12);
    EXPECT_NEAR(meanDist / 4, std::sqrt(2.0), 1e-12);

    // Returned parameters reproduce the mapping
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(c.At(i).x, (original.At(i).x + norm.tx) * norm.scale, 1e-12);
        EXPECT_NEAR(c.At(i).y, (original.At(i).y + norm.ty) * norm.scale, 1e-12);
    }
}

TEST(NormalizeCornersTest, UnitSquare) {
    Corners c = UnitSquare();
    NormalizationResult norm = NormalizeCorners(c);

    // Centroid (0.5, 0.5), every corner at distance sqrt(0.5)
    EXPECT_DOUBLE_EQ(norm.tx, -0.5);
    EXPECT_DOUBLE_EQ(norm.ty, -0.5);
    EXPECT_NEAR(norm.scale, 2.0, 1e-12);
    EXPECT_NEAR(c.TopLeft().x, -1.0, 1e-12);
    EXPECT_NEAR(c.BottomRight().y, 1.0, 1e-12);
}

TEST(NormalizeCornersTest, CoincidentPointsKeepScale) {
    Corners c({3, 4}, {3, 4}, {3, 4}, {3, 4});
    NormalizationResult norm = NormalizeCorners(c);

    EXPECT_DOUBLE_EQ(norm.scale, 1.0);
    for (const auto& p : c.Points()) {
        EXPECT_DOUBLE_EQ(p.x, 0.0);
        EXPECT_DOUBLE_EQ(p.y, 0.0);
    }
}

TEST(NormalizeCornersTest, MatrixMatchesInPlaceResult) {
    Corners c = Skewed();
    Corners original = c;
    NormalizationResult norm = NormalizeCorners(c);

    Matrix3x3 T = NormalizationMatrix(norm);
    Matrix3x3 Tinv = DenormalizationMatrix(norm);
    EXPECT_TRUE((T * Tinv).IsIdentity(1e-12));

    for (int i = 0; i < 4; ++i) {
        Point2d p = T.Transform(original.At(i));
        EXPECT_NEAR(p.x, c.At(i).x, 1e-12);
        EXPECT_NEAR(p.y, c.At(i).y, 1e-12);
    }
}

// =============================================================================
// Estimation Tests
// =============================================================================

TEST(EstimatePerspectiveTest, ScaleByTwo) {
    Corners src = UnitSquare();
    Corners dst = Corners::FromRectangle(2.0, 2.0);

    HomographyEstimate est = EstimatePerspective(&src, &dst);
    ASSERT_TRUE(est.valid);
    EXPECT_EQ(est.status, HomographyStatus::Ok);
    EXPECT_NEAR(est.H.M00(), 2.0, 1e-12);
    EXPECT_NEAR(est.H.M11(), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(est.H.M22(), 1.0);
    EXPECT_NEAR(est.H.M01(), 0.0, 1e-12);
    EXPECT_NEAR(est.H.M20(), 0.0, 1e-12);
}

TEST(EstimatePerspectiveTest, RecoversKnownHomography) {
    Matrix3x3 Htrue(0.9, 0.15, 20.0,
                    -0.05, 1.1, 35.0,
                    0.0004, -0.0002, 1.0);
    Corners src = Skewed();
    Corners dst;
    for (int i = 0; i < 4; ++i) {
        dst.At(i) = Htrue.Transform(src.At(i));
    }

    HomographyEstimate est = EstimatePerspective(&src, &dst);
    ASSERT_TRUE(est.valid);
    EXPECT_DOUBLE_EQ(est.H.M22(), 1.0);

    // Corners and interior points follow the generating transform
    std::vector<Point2d> checkPoints = src.ToVector();
    checkPoints.push_back({200.0, 300.0});
    checkPoints.push_back({50.0, 500.0});
    for (const auto& p : checkPoints) {
        Point2d expected = Htrue.Transform(p);
        Point2d actual = est.H.Transform(p);
        EXPECT_NEAR(actual.x, expected.x, 1e-6);
        EXPECT_NEAR(actual.y, expected.y, 1e-6);
    }
}

TEST(EstimatePerspectiveTest, MissingInput) {
    Corners c = UnitSquare();
    EXPECT_EQ(EstimatePerspective(nullptr, &c).status, HomographyStatus::MissingInput);
    EXPECT_EQ(EstimatePerspective(&c, nullptr).status, HomographyStatus::MissingInput);
    EXPECT_FALSE(EstimatePerspective(nullptr, nullptr).valid);
}

TEST(EstimatePerspectiveTest, NonFiniteCoordinate) {
    Corners src = UnitSquare();
    Corners dst = Skewed();
    dst.At(1).x = NaN;
    EXPECT_EQ(EstimatePerspective(&src, &dst).status, HomographyStatus::NonFiniteCoordinate);

    dst = Skewed();
    dst.At(3).y = Inf;
    EXPECT_EQ(EstimatePerspective(&src, &dst).status, HomographyStatus::NonFiniteCoordinate);
}

TEST(EstimatePerspectiveTest, CollinearDestinationIsSingular) {
    Corners src = UnitSquare();
    Corners dst({0, 0}, {1, 0}, {2, 0}, {3, 0});

    HomographyEstimate est = EstimatePerspective(&src, &dst);
    EXPECT_FALSE(est.valid);
    EXPECT_EQ(est.status, HomographyStatus::SingularSystem);
}

TEST(EstimatePerspectiveTest, ThreeCollinearSourceIsSingular) {
    Corners src({0, 0}, {1, 1}, {2, 2}, {0, 5});
    Corners dst = UnitSquare();

    EXPECT_EQ(EstimatePerspective(&src, &dst).status, HomographyStatus::SingularSystem);
}

TEST(EstimatePerspectiveTest, CoefficientMagnitudeLimit) {
    Corners src = UnitSquare();
    Corners dst = Corners::FromRectangle(2e6, 2e6);

    HomographyEstimate est = EstimatePerspective(&src, &dst);
    EXPECT_FALSE(est.valid);
    EXPECT_EQ(est.status, HomographyStatus::SolutionMagnitudeOverflow);

    EstimateParams relaxed;
    relaxed.maxCoefficient = 1e7;
    HomographyEstimate accepted = EstimatePerspective(&src, &dst, relaxed);
    ASSERT_TRUE(accepted.valid);
    EXPECT_NEAR(accepted.H.M00(), 2e6, 1.0);
}

TEST(EstimatePerspectiveTest, HugeCoordinatesFail) {
    Corners src = Corners::FromRectangle(1e200, 1e200);
    Corners dst = src;

    HomographyEstimate est = EstimatePerspective(&src, &dst);
    EXPECT_FALSE(est.valid);
    EXPECT_NE(est.status, HomographyStatus::Ok);
}

TEST(EstimatePerspectiveTest, NormalizedMatchesDirect) {
    Corners src = Skewed();
    Corners dst = Corners::FromRectangle(400.0, 600.0);

    EstimateParams params;
    params.normalizePoints = true;
    HomographyEstimate direct = EstimatePerspective(&src, &dst);
    HomographyEstimate normalized = EstimatePerspective(&src, &dst, params);
    ASSERT_TRUE(direct.valid);
    ASSERT_TRUE(normalized.valid);
    EXPECT_EQ(normalized.H.M22(), 1.0);

    for (int i = 0; i < 4; ++i) {
        Point2d a = direct.H.Transform(src.At(i));
        Point2d b = normalized.H.Transform(src.At(i));
        EXPECT_NEAR(a.x, b.x, 1e-6);
        EXPECT_NEAR(a.y, b.y, 1e-6);
        EXPECT_NEAR(b.x, dst.At(i).x, 1e-6);
        EXPECT_NEAR(b.y, dst.At(i).y, 1e-6);
    }
}

TEST(EstimatePerspectiveTest, NormalizedStillRejectsInfinity) {
    Corners src = UnitSquare();
    Corners dst = Skewed();
    dst.At(0).x = Inf;

    EstimateParams params;
    params.normalizePoints = true;
    EXPECT_EQ(EstimatePerspective(&src, &dst, params).status,
              HomographyStatus::NonFiniteCoordinate);
}

TEST(EstimatePerspectiveTest, VanishingH22IsSingular) {
    Corners src = ReciprocalSource();
    Corners dst = ReciprocalTarget();

    EXPECT_EQ(EstimatePerspective(&src, &dst).status, HomographyStatus::SingularSystem);
}

TEST(EstimatePerspectiveTest, NormalizedVanishingH22) {
    // Solvable in normalized space, but denormalizing brings h22 back to zero
    Corners src = ReciprocalSource();
    Corners dst = ReciprocalTarget();

    HomographyEstimate est = EstimatePerspective(&src, &dst, Normalizing());
    EXPECT_FALSE(est.valid);
    EXPECT_EQ(est.status, HomographyStatus::NonFiniteResultMatrix);
}

TEST(EstimatePerspectiveTest, NormalizedRescaledMagnitudeLimit) {
    // A tiny h22 after denormalization inflates every entry past the limit
    Corners src = ReciprocalSource();
    src.At(0).x += 1e-8;
    Corners dst = ReciprocalTarget();

    HomographyEstimate direct = EstimatePerspective(&src, &dst);
    EXPECT_EQ(direct.status, HomographyStatus::SolutionMagnitudeOverflow);

    HomographyEstimate normalized = EstimatePerspective(&src, &dst, Normalizing());
    EXPECT_FALSE(normalized.valid);
    EXPECT_EQ(normalized.status, HomographyStatus::SolutionMagnitudeOverflow);
}

TEST(EstimatePerspectiveTest, NormalizedResultHasUnitH22) {
    Corners src = Skewed();
    Corners dst({30.0, 20.0}, {600.0, 5.0}, {640.0, 480.0}, {0.0, 470.0});

    HomographyEstimate est = EstimatePerspective(&src, &dst, Normalizing());
    ASSERT_TRUE(est.valid);
    EXPECT_EQ(est.H.M22(), 1.0);
    for (int i = 0; i < 8; ++i) {
        EXPECT_LE(std::abs(est.H.Data()[i]), HOMOGRAPHY_MAX_COEFFICIENT);
    }
}

TEST(DenormalizeHomographyTest, KeepsProductScale) {
    NormalizationResult srcNorm{0.5, -2.0, -4.0};
    NormalizationResult dstNorm{2.0, 1.0, 3.0};
    Matrix3x3 Hn(1, 0, 0,
                 0, 1, 0,
                 0, 0, 2);

    Matrix3x3 H = DenormalizeHomography(Hn, srcNorm, dstNorm);
    Matrix3x3 expected = DenormalizationMatrix(dstNorm) * Hn * NormalizationMatrix(srcNorm);
    EXPECT_EQ(H, expected);
    EXPECT_DOUBLE_EQ(H.M22(), 2.0);
}

TEST(HomographyStatusTest, Names) {
    EXPECT_STREQ(HomographyStatusName(HomographyStatus::Ok), "Ok");
    EXPECT_STREQ(HomographyStatusName(HomographyStatus::MissingInput), "MissingInput");
    EXPECT_STREQ(HomographyStatusName(HomographyStatus::SingularSystem), "SingularSystem");
    EXPECT_STREQ(HomographyStatusName(HomographyStatus::NonFiniteResultMatrix),
                 "NonFiniteResultMatrix");
}
