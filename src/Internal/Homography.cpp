#include <Perspec/Internal/Homography.h>
#include <Perspec/Core/Log.h>

#include <cmath>

namespace Perspec::Internal {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

const char* const CORNER_NAMES[4] = {"tl", "tr", "br", "bl"};

void LogCorners(spdlog::logger& log, const char* label, const Corners& c) {
    log.debug("{}: tl({}, {}) tr({}, {}) br({}, {}) bl({}, {})", label,
              c.TopLeft().x, c.TopLeft().y,
              c.TopRight().x, c.TopRight().y,
              c.BottomRight().x, c.BottomRight().y,
              c.BottomLeft().x, c.BottomLeft().y);
}

void LogMatrix(spdlog::logger& log, const char* label, const Matrix3x3& H) {
    log.debug("{}:", label);
    for (int r = 0; r < 3; ++r) {
        log.debug("  {:.10f}, {:.10f}, {:.10f}", H(r, 0), H(r, 1), H(r, 2));
    }
}

// Index of the first of count coefficients whose magnitude exceeds limit, or -1
int FindOversizedCoefficient(const double* h, int count, double limit) {
    for (int i = 0; i < count; ++i) {
        if (std::abs(h[i]) > limit) {
            return i;
        }
    }
    return -1;
}

HomographyEstimate Fail(HomographyStatus status) {
    HomographyEstimate result;
    result.status = status;
    result.valid = false;
    return result;
}

} // anonymous namespace

const char* HomographyStatusName(HomographyStatus status) {
    switch (status) {
        case HomographyStatus::Ok:                        return "Ok";
        case HomographyStatus::MissingInput:              return "MissingInput";
        case HomographyStatus::NonFiniteCoordinate:       return "NonFiniteCoordinate";
        case HomographyStatus::SingularSystem:            return "SingularSystem";
        case HomographyStatus::NonFiniteSolution:         return "NonFiniteSolution";
        case HomographyStatus::SolutionMagnitudeOverflow: return "SolutionMagnitudeOverflow";
        case HomographyStatus::NonFiniteResultMatrix:     return "NonFiniteResultMatrix";
    }
    return "Unknown";
}

// =============================================================================
// Equation Builder
// =============================================================================

std::optional<DltSystem> BuildDltSystem(const Corners& src, const Corners& dst) {
    if (src.HasNaN() || dst.HasNaN()) {
        return std::nullopt;
    }

    DltSystem system;
    for (int i = 0; i < Corners::COUNT; ++i) {
        const Point2d& s = src.At(i);
        const Point2d& d = dst.At(i);

        if (std::isinf(s.x) || std::isinf(s.y) || std::isinf(d.x) || std::isinf(d.y)) {
            Log::Get()->debug("BuildDltSystem: infinite coordinate in {} correspondence",
                              CORNER_NAMES[i]);
            return std::nullopt;
        }

        // x-equation
        system.A(i, 0) = s.x;
        system.A(i, 1) = s.y;
        system.A(i, 2) = 1.0;
        system.A(i, 6) = -s.x * d.x;
        system.A(i, 7) = -s.y * d.x;
        system.b[i] = d.x;

        // y-equation
        system.A(i + 4, 3) = s.x;
        system.A(i + 4, 4) = s.y;
        system.A(i + 4, 5) = 1.0;
        system.A(i + 4, 6) = -s.x * d.y;
        system.A(i + 4, 7) = -s.y * d.y;
        system.b[i + 4] = d.y;
    }
    return system;
}

// =============================================================================
// Point Normalization
// =============================================================================

NormalizationResult NormalizeCorners(Corners& corners) {
    // Centroid
    double cx = 0.0, cy = 0.0;
    for (const auto& p : corners.Points()) {
        cx += p.x;
        cy += p.y;
    }
    cx /= Corners::COUNT;
    cy /= Corners::COUNT;

    // Mean distance from centroid
    double meanDist = 0.0;
    for (const auto& p : corners.Points()) {
        double dx = p.x - cx;
        double dy = p.y - cy;
        meanDist += std::sqrt(dx * dx + dy * dy);
    }
    meanDist /= Corners::COUNT;

    NormalizationResult norm;
    norm.scale = (meanDist > NORMALIZE_MIN_MEAN_DISTANCE) ? std::sqrt(2.0) / meanDist : 1.0;
    norm.tx = -cx;
    norm.ty = -cy;

    for (int i = 0; i < Corners::COUNT; ++i) {
        Point2d& p = corners.At(i);
        p.x = (p.x + norm.tx) * norm.scale;
        p.y = (p.y + norm.ty) * norm.scale;
    }
    return norm;
}

Matrix3x3 NormalizationMatrix(const NormalizationResult& norm) {
    return Matrix3x3(norm.scale, 0.0, norm.scale * norm.tx,
                     0.0, norm.scale, norm.scale * norm.ty,
                     0.0, 0.0, 1.0);
}

Matrix3x3 DenormalizationMatrix(const NormalizationResult& norm) {
    double invScale = 1.0 / norm.scale;
    return Matrix3x3(invScale, 0.0, -norm.tx,
                     0.0, invScale, -norm.ty,
                     0.0, 0.0, 1.0);
}

Matrix3x3 DenormalizeHomography(const Matrix3x3& Hnorm,
                                const NormalizationResult& srcNorm,
                                const NormalizationResult& dstNorm) {
    return DenormalizationMatrix(dstNorm) * Hnorm * NormalizationMatrix(srcNorm);
}

// =============================================================================
// Estimation
// =============================================================================

HomographyEstimate EstimatePerspective(const Corners* src, const Corners* dst,
                                       const EstimateParams& params) {
    auto log = Log::Get();

    if (!src || !dst) {
        log->debug("EstimatePerspective: MissingInput, corner set absent");
        return Fail(HomographyStatus::MissingInput);
    }

    if (log->should_log(spdlog::level::debug)) {
        log->debug("Calculating perspective transform");
        LogCorners(*log, "src_corners", *src);
        LogCorners(*log, "dst_corners", *dst);
    }

    if (src->HasNaN() || dst->HasNaN()) {
        log->debug("EstimatePerspective: NonFiniteCoordinate, NaN in corners");
        return Fail(HomographyStatus::NonFiniteCoordinate);
    }

    Corners srcWork = *src;
    Corners dstWork = *dst;
    NormalizationResult srcNorm, dstNorm;
    if (params.normalizePoints && srcWork.IsFinite() && dstWork.IsFinite()) {
        srcNorm = NormalizeCorners(srcWork);
        dstNorm = NormalizeCorners(dstWork);
    }

    std::optional<DltSystem> system = BuildDltSystem(srcWork, dstWork);
    if (!system) {
        log->debug("EstimatePerspective: NonFiniteCoordinate, system not assembled");
        return Fail(HomographyStatus::NonFiniteCoordinate);
    }

    GaussResult<8> solution = SolveGaussian(system->A, system->b, params.pivotThreshold);
    if (!solution.valid) {
        HomographyStatus status = solution.status == SolveStatus::NonFiniteSolution
                                      ? HomographyStatus::NonFiniteSolution
                                      : HomographyStatus::SingularSystem;
        log->debug("EstimatePerspective: {}, solver stopped with {} at row {}",
                   HomographyStatusName(status), SolveStatusName(solution.status),
                   solution.failedRow);
        return Fail(status);
    }

    const Vec8& h = solution.x;
    for (int i = 0; i < Vec8::Size(); ++i) {
        if (!std::isfinite(h[i])) {
            log->debug("EstimatePerspective: NonFiniteSolution, h[{}] = {}", i, h[i]);
            return Fail(HomographyStatus::NonFiniteSolution);
        }
    }
    int oversized = FindOversizedCoefficient(&h[0], Vec8::Size(), params.maxCoefficient);
    if (oversized >= 0) {
        log->debug("EstimatePerspective: SolutionMagnitudeOverflow, h[{}] = {} exceeds {}",
                   oversized, h[oversized], params.maxCoefficient);
        return Fail(HomographyStatus::SolutionMagnitudeOverflow);
    }

    HomographyEstimate result;
    result.H = Matrix3x3(h[0], h[1], h[2],
                         h[3], h[4], h[5],
                         h[6], h[7], 1.0);

    if (params.normalizePoints) {
        Matrix3x3 H = DenormalizeHomography(result.H, srcNorm, dstNorm);

        // In input units h22 may vanish, leaving no finite h22 = 1 form
        if (!H.IsFinite() || !(std::abs(H(2, 2)) >= params.pivotThreshold)) {
            log->debug("EstimatePerspective: NonFiniteResultMatrix, denormalized h22 = {}",
                       H(2, 2));
            return Fail(HomographyStatus::NonFiniteResultMatrix);
        }

        double invH22 = 1.0 / H(2, 2);
        double* data = H.Data();
        for (int i = 0; i < 8; ++i) {
            data[i] *= invH22;
        }
        data[8] = 1.0;

        oversized = FindOversizedCoefficient(data, 8, params.maxCoefficient);
        if (oversized >= 0) {
            log->debug("EstimatePerspective: SolutionMagnitudeOverflow, "
                       "denormalized entry {} = {} exceeds {}",
                       oversized, data[oversized], params.maxCoefficient);
            return Fail(HomographyStatus::SolutionMagnitudeOverflow);
        }
        result.H = H;
    }

    if (log->should_log(spdlog::level::debug)) {
        LogMatrix(*log, "Result matrix", result.H);
    }

    // Re-check the assembled entries, including any denormalization
    if (!result.H.IsFinite()) {
        log->debug("EstimatePerspective: NonFiniteResultMatrix, non-finite entry");
        return Fail(HomographyStatus::NonFiniteResultMatrix);
    }

    result.status = HomographyStatus::Ok;
    result.valid = true;
    return result;
}

} // namespace Perspec::Internal
