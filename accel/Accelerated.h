#pragma once

// C ABI of the accelerated backend library. Every function reports failure through
// *outError (null on success), the message stays valid until the next failing call on the same thread.

#include <stdint.h>

#if defined(_MSC_VER)
#define TABULA_ACCEL_EXPORT __declspec(dllexport)
#else
#define TABULA_ACCEL_EXPORT __attribute__((visibility ("default")))
#endif

#ifdef __cplusplus
extern "C"
{
#endif

struct TabulaArena;
typedef int64_t TabulaHandle;

// Bits of the function mask given to tabulaGroupReduce. Results are written in increasing bit order.
#define TABULA_SUM   1
#define TABULA_MEAN  2
#define TABULA_COUNT 4
#define TABULA_MIN   8
#define TABULA_MAX   16
#define TABULA_STD   32
#define TABULA_VAR   64

TABULA_ACCEL_EXPORT void tabulaSetVerbosity(int8_t verbose);

TABULA_ACCEL_EXPORT struct TabulaArena *tabulaArenaNew(const char **outError);
TABULA_ACCEL_EXPORT void tabulaArenaFree(struct TabulaArena *arena);
TABULA_ACCEL_EXPORT void tabulaArenaFlush(struct TabulaArena *arena, const char **outError);
TABULA_ACCEL_EXPORT int64_t tabulaArenaHandleCount(struct TabulaArena *arena, const char **outError);
TABULA_ACCEL_EXPORT int64_t tabulaArenaBytesAllocated(struct TabulaArena *arena, const char **outError);

TABULA_ACCEL_EXPORT TabulaHandle tabulaRegisterFloat64(struct TabulaArena *arena, const double *values, int64_t length, const char **outError);
TABULA_ACCEL_EXPORT TabulaHandle tabulaRegisterInt32(struct TabulaArena *arena, const int32_t *values, int64_t length, const char **outError);
TABULA_ACCEL_EXPORT void tabulaRelease(struct TabulaArena *arena, TabulaHandle handle, const char **outError);

TABULA_ACCEL_EXPORT int64_t tabulaLength(struct TabulaArena *arena, TabulaHandle handle, const char **outError);
// out must have room for tabulaLength elements, buffer type must match
TABULA_ACCEL_EXPORT void tabulaReadFloat64(struct TabulaArena *arena, TabulaHandle handle, double *out, const char **outError);
TABULA_ACCEL_EXPORT void tabulaReadInt32(struct TabulaArena *arena, TabulaHandle handle, int32_t *out, const char **outError);

// function is a single TABULA_* bit
TABULA_ACCEL_EXPORT double tabulaReduce(struct TabulaArena *arena, TabulaHandle handle, int32_t function, const char **outError);

// groupIds has one entry per element, -1 for elements outside any group.
// Writes one float64 buffer handle per set bit of functionMask to outHandles, returns number written.
TABULA_ACCEL_EXPORT int32_t tabulaGroupReduce(struct TabulaArena *arena, TabulaHandle handle, const int32_t *groupIds, int64_t groupIdCount,
    int32_t groupCount, int32_t functionMask, TabulaHandle *outHandles, const char **outError);

// Stable ordering, out must have room for tabulaLength elements. NaN elements are nulls.
TABULA_ACCEL_EXPORT void tabulaSortIndices(struct TabulaArena *arena, TabulaHandle handle, int8_t ascending, int8_t nullsFirst,
    int64_t *out, const char **outError);
TABULA_ACCEL_EXPORT void tabulaSortIndices2(struct TabulaArena *arena, TabulaHandle first, TabulaHandle second,
    int8_t firstAscending, int8_t secondAscending, int8_t nullsFirst, int64_t *out, const char **outError);

TABULA_ACCEL_EXPORT TabulaHandle tabulaFilter(struct TabulaArena *arena, TabulaHandle handle, const uint8_t *mask, int64_t maskLength, const char **outError);

// out gets 1 for elements within tolerance of any candidate, NaN never matches; tolerance <= 0 means 1e-9
TABULA_ACCEL_EXPORT void tabulaIsinNumeric(struct TabulaArena *arena, TabulaHandle handle, const double *candidates, int64_t candidateCount,
    double tolerance, uint8_t *out, const char **outError);

// Strings are given as UTF-8 bytes plus count+1 offsets into them.
TABULA_ACCEL_EXPORT void tabulaIsinStrings(const char *values, const int64_t *valueOffsets, int64_t valueCount,
    const char *candidates, const int64_t *candidateOffsets, int64_t candidateCount, uint8_t *out, const char **outError);

#ifdef __cplusplus
}
#endif
