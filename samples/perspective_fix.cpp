/**
 * @file perspective_fix.cpp
 * @brief Compute the transform that flattens a photographed quadrilateral
 *
 * Usage:
 *   perspective_fix [--verbose] [--normalize] sx0 sy0 ... sx3 sy3 dx0 dy0 ... dx3 dy3
 *   perspective_fix [--verbose] [--normalize] --width W --height H sx0 sy0 ... sx3 sy3
 *
 * Corners are given in TL, TR, BR, BL order. The second form maps the
 * quadrilateral onto the upright rectangle W x H.
 */

#include <Perspec/Perspec.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace Perspec;

namespace {

struct Options {
    bool verbose = false;
    bool normalize = false;
    double width = 0.0;
    double height = 0.0;
    std::vector<double> values;
};

double ParseNumber(const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == text.c_str() || *end != '\0') {
        throw InvalidArgumentException("not a number: '" + text + "'");
    }
    return value;
}

Options ParseOptions(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--normalize") {
            opts.normalize = true;
        } else if (arg == "--width" || arg == "--height") {
            if (i + 1 >= argc) {
                throw InvalidArgumentException(arg + " needs a value");
            }
            double value = ParseNumber(argv[++i]);
            if (!(value > 0.0)) {
                throw InvalidArgumentException(arg + " must be positive");
            }
            (arg == "--width" ? opts.width : opts.height) = value;
        } else {
            opts.values.push_back(ParseNumber(arg));
        }
    }

    bool rectify = opts.width > 0.0 || opts.height > 0.0;
    if (rectify && (opts.width <= 0.0 || opts.height <= 0.0)) {
        throw InvalidArgumentException("--width and --height must be given together");
    }
    size_t expected = rectify ? 8 : 16;
    if (opts.values.size() != expected) {
        throw InvalidArgumentException("expected " + std::to_string(expected) +
                                       " coordinates, got " + std::to_string(opts.values.size()));
    }
    return opts;
}

Corners CornersFrom(const std::vector<double>& v, size_t offset) {
    std::vector<Point2d> points;
    for (size_t i = 0; i < 4; ++i) {
        points.emplace_back(v[offset + 2 * i], v[offset + 2 * i + 1]);
    }
    return Corners::FromPoints(points);
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = ParseOptions(argc, argv);
    } catch (const Exception& ex) {
        spdlog::error("{}", ex.what());
        spdlog::info("Usage: {} [--verbose] [--normalize] [--width W --height H] <coordinates>", argv[0]);
        return 1;
    }

    if (opts.verbose) {
        Log::SetLevel(Log::Level::Debug);
    }

    Transform::PerspectiveParams params;
    params.normalizePoints = opts.normalize;

    Corners src = CornersFrom(opts.values, 0);
    Matrix3x3 H;
    if (opts.width > 0.0) {
        H = Transform::RectifyQuadrilateral(src, opts.width, opts.height, params);
    } else {
        H = Transform::ComputePerspectiveTransform(src, CornersFrom(opts.values, 8), params);
    }

    spdlog::info("Perspec {}", GetVersion());
    if (H == Transform::IdentityFallback()) {
        spdlog::warn("Result is the identity transform (corners identical, degenerate or invalid)");
    }
    spdlog::info("Perspective transform:");
    for (int r = 0; r < 3; ++r) {
        spdlog::info("{:.10f} {:.10f} {:.10f}", H(r, 0), H(r, 1), H(r, 2));
    }
    return 0;
}
