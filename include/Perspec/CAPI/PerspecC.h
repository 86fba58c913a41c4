#pragma once

#include <Perspec/Core/Export.h>

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum PS_Status {
    PS_STATUS_OK = 0,
    PS_STATUS_INVALID_ARGUMENT = 1,
    PS_STATUS_OUT_OF_RANGE = 2,
    PS_STATUS_POINT_AT_INFINITY = 3,
    PS_STATUS_INTERNAL_ERROR = 4,
    PS_STATUS_UNKNOWN_ERROR = 5
} PS_Status;

typedef enum PS_LogLevel {
    PS_LOG_TRACE = 0,
    PS_LOG_DEBUG = 1,
    PS_LOG_INFO = 2,
    PS_LOG_WARN = 3,
    PS_LOG_ERROR = 4,
    PS_LOG_OFF = 5
} PS_LogLevel;

/* Quadrilateral corners: top-left, top-right, bottom-right, bottom-left */
typedef struct PS_Corners {
    double tl_x, tl_y;
    double tr_x, tr_y;
    double br_x, br_y;
    double bl_x, bl_y;
} PS_Corners;

/* Row-major homogeneous transform */
typedef struct PS_Matrix3x3 {
    double m00, m01, m02;
    double m10, m11, m12;
    double m20, m21, m22;
} PS_Matrix3x3;

/*
 * Homography mapping src onto dst. Never fails: null, non-finite or
 * degenerate input yields the identity matrix. The result is returned by
 * value and needs no release.
 */
PERSPEC_API PS_Matrix3x3 PERSPEC_CALL PS_CalculatePerspectiveTransform(
    const PS_Corners* src_corners, const PS_Corners* dst_corners);

/* Same, with point normalization before solving */
PERSPEC_API PS_Matrix3x3 PERSPEC_CALL PS_CalculatePerspectiveTransformNormalized(
    const PS_Corners* src_corners, const PS_Corners* dst_corners);

/* Apply a transform to (x, y); fails on null pointers or a point at infinity */
PERSPEC_API PS_Status PERSPEC_CALL PS_ProjectPoint(
    const PS_Matrix3x3* matrix, double x, double y, double* out_x, double* out_y);

PERSPEC_API const char* PERSPEC_CALL PS_StatusToString(PS_Status status);

PERSPEC_API PS_Status PERSPEC_CALL PS_GetLastError(void);
PERSPEC_API const char* PERSPEC_CALL PS_GetLastErrorMessage(void);
PERSPEC_API void PERSPEC_CALL PS_ClearLastError(void);

PERSPEC_API PS_Status PERSPEC_CALL PS_SetLogLevel(PS_LogLevel level);

PERSPEC_API const char* PERSPEC_CALL PS_GetVersionString(void);
PERSPEC_API PS_Status PERSPEC_CALL PS_GetVersionNumbers(int* major, int* minor, int* patch);

#ifdef __cplusplus
} // extern "C"
#endif
