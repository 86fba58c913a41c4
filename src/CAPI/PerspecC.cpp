#include <Perspec/CAPI/PerspecC.h>
#include <Perspec/Core/Exception.h>
#include <Perspec/Perspec.h>

#include <cmath>
#include <string>

namespace {

thread_local PS_Status g_lastStatus = PS_STATUS_OK;
thread_local std::string g_lastMessage;

void SetLastError(PS_Status status, const char* message) {
    g_lastStatus = status;
    g_lastMessage = message ? message : "";
}

void ClearLastErrorInternal() {
    g_lastStatus = PS_STATUS_OK;
    g_lastMessage.clear();
}

PS_Status StatusFromException(const std::exception& ex) {
    using namespace Perspec;
    if (dynamic_cast<const InvalidArgumentException*>(&ex)) {
        return PS_STATUS_INVALID_ARGUMENT;
    }
    if (dynamic_cast<const OutOfRangeException*>(&ex)) {
        return PS_STATUS_OUT_OF_RANGE;
    }
    return PS_STATUS_INTERNAL_ERROR;
}

Perspec::Corners ToCorners(const PS_Corners& c) {
    return Perspec::Corners({c.tl_x, c.tl_y}, {c.tr_x, c.tr_y},
                            {c.br_x, c.br_y}, {c.bl_x, c.bl_y});
}

Perspec::Matrix3x3 ToMatrix(const PS_Matrix3x3& m) {
    return Perspec::Matrix3x3(m.m00, m.m01, m.m02,
                              m.m10, m.m11, m.m12,
                              m.m20, m.m21, m.m22);
}

PS_Matrix3x3 FromMatrix(const Perspec::Matrix3x3& m) {
    PS_Matrix3x3 out;
    out.m00 = m.M00(); out.m01 = m.M01(); out.m02 = m.M02();
    out.m10 = m.M10(); out.m11 = m.M11(); out.m12 = m.M12();
    out.m20 = m.M20(); out.m21 = m.M21(); out.m22 = m.M22();
    return out;
}

PS_Matrix3x3 Calculate(const PS_Corners* src, const PS_Corners* dst, bool normalize) {
    using namespace Perspec;
    try {
        Transform::PerspectiveParams params;
        params.normalizePoints = normalize;
        if (!src || !dst) {
            Log::Get()->debug("PS_CalculatePerspectiveTransform: null corner pointer");
            ClearLastErrorInternal();
            return FromMatrix(Transform::IdentityFallback());
        }
        Matrix3x3 H = Transform::ComputePerspectiveTransform(ToCorners(*src), ToCorners(*dst), params);
        ClearLastErrorInternal();
        return FromMatrix(H);
    } catch (const std::exception& ex) {
        SetLastError(StatusFromException(ex), ex.what());
        return FromMatrix(Transform::IdentityFallback());
    }
}

} // namespace

extern "C" {

PERSPEC_API PS_Matrix3x3 PERSPEC_CALL PS_CalculatePerspectiveTransform(
    const PS_Corners* src_corners, const PS_Corners* dst_corners) {
    return Calculate(src_corners, dst_corners, false);
}

PERSPEC_API PS_Matrix3x3 PERSPEC_CALL PS_CalculatePerspectiveTransformNormalized(
    const PS_Corners* src_corners, const PS_Corners* dst_corners) {
    return Calculate(src_corners, dst_corners, true);
}

PERSPEC_API PS_Status PERSPEC_CALL PS_ProjectPoint(
    const PS_Matrix3x3* matrix, double x, double y, double* out_x, double* out_y) {
    if (!matrix || !out_x || !out_y) {
        SetLastError(PS_STATUS_INVALID_ARGUMENT, "PS_ProjectPoint: null pointer");
        return PS_STATUS_INVALID_ARGUMENT;
    }
    Perspec::Point2d p = Perspec::Transform::ProjectPoint(ToMatrix(*matrix), {x, y});
    if (!p.IsValid()) {
        SetLastError(PS_STATUS_POINT_AT_INFINITY, "PS_ProjectPoint: point maps to infinity");
        return PS_STATUS_POINT_AT_INFINITY;
    }
    *out_x = p.x;
    *out_y = p.y;
    ClearLastErrorInternal();
    return PS_STATUS_OK;
}

PERSPEC_API const char* PERSPEC_CALL PS_StatusToString(PS_Status status) {
    switch (status) {
        case PS_STATUS_OK: return "OK";
        case PS_STATUS_INVALID_ARGUMENT: return "Invalid argument";
        case PS_STATUS_OUT_OF_RANGE: return "Out of range";
        case PS_STATUS_POINT_AT_INFINITY: return "Point at infinity";
        case PS_STATUS_INTERNAL_ERROR: return "Internal error";
        case PS_STATUS_UNKNOWN_ERROR: return "Unknown error";
        default: return "Unknown error";
    }
}

PERSPEC_API PS_Status PERSPEC_CALL PS_GetLastError(void) {
    return g_lastStatus;
}

PERSPEC_API const char* PERSPEC_CALL PS_GetLastErrorMessage(void) {
    return g_lastMessage.c_str();
}

PERSPEC_API void PERSPEC_CALL PS_ClearLastError(void) {
    ClearLastErrorInternal();
}

PERSPEC_API PS_Status PERSPEC_CALL PS_SetLogLevel(PS_LogLevel level) {
    using Perspec::Log::Level;
    Level mapped;
    switch (level) {
        case PS_LOG_TRACE: mapped = Level::Trace; break;
        case PS_LOG_DEBUG: mapped = Level::Debug; break;
        case PS_LOG_INFO:  mapped = Level::Info; break;
        case PS_LOG_WARN:  mapped = Level::Warn; break;
        case PS_LOG_ERROR: mapped = Level::Error; break;
        case PS_LOG_OFF:   mapped = Level::Off; break;
        default:
            SetLastError(PS_STATUS_OUT_OF_RANGE, "PS_SetLogLevel: unknown level");
            return PS_STATUS_OUT_OF_RANGE;
    }
    try {
        Perspec::Log::SetLevel(mapped);
    } catch (const std::exception& ex) {
        PS_Status status = StatusFromException(ex);
        SetLastError(status, ex.what());
        return status;
    }
    ClearLastErrorInternal();
    return PS_STATUS_OK;
}

PERSPEC_API const char* PERSPEC_CALL PS_GetVersionString(void) {
    return Perspec::GetVersion();
}

PERSPEC_API PS_Status PERSPEC_CALL PS_GetVersionNumbers(int* major, int* minor, int* patch) {
    if (!major || !minor || !patch) {
        SetLastError(PS_STATUS_INVALID_ARGUMENT, "PS_GetVersionNumbers: null output pointer");
        return PS_STATUS_INVALID_ARGUMENT;
    }
    Perspec::GetVersion(*major, *minor, *patch);
    ClearLastErrorInternal();
    return PS_STATUS_OK;
}

} // extern "C"
