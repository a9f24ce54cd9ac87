#include <cstring>

#include "Accelerated.h"
#include "ArrowUtilities.h"
#include "HandleArena.h"
#include "Kernels.h"
#include "Core/Common.h"
#include "Core/Error.h"

struct TabulaArena
{
    HandleArena handles;
};

namespace
{

HandleArena &arenaOf(TabulaArena *arena)
{
    if(!arena)
        THROW("null arena pointer");
    return arena->handles;
}

void validateOutput(const void *out, const char *what)
{
    if(!out)
        THROW("null {} pointer", what);
}

template<typename ArrayType>
const ArrayType &accessTyped(HandleArena &arena, TabulaHandle handle, std::shared_ptr<arrow::Array> &keepAlive)
{
    keepAlive = arena.access(handle);
    return *throwingCast<const ArrayType *>(keepAlive.get());
}

std::shared_ptr<arrow::StringArray> stringArrayFrom(const char *data, const int64_t *offsets, int64_t count)
{
    if(count && (!data || !offsets))
        THROW("null string buffer for {} strings", count);

    arrow::StringBuilder builder;
    for(int64_t i = 0; i < count; i++)
    {
        const auto length = offsets[i + 1] - offsets[i];
        if(length < 0)
            THROW("string {} has negative length {}", i, length);
        checkStatus(builder.Append(data + offsets[i], (int32_t)length));
    }
    return std::static_pointer_cast<arrow::StringArray>(finish(builder));
}

}

extern "C"
{

TABULA_ACCEL_EXPORT void tabulaSetVerbosity(int8_t verbose)
{
    setVerbosity(verbose != 0);
}

TABULA_ACCEL_EXPORT TabulaArena *tabulaArenaNew(const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        return new TabulaArena();
    };
}

TABULA_ACCEL_EXPORT void tabulaArenaFree(TabulaArena *arena)
{
    delete arena;
}

TABULA_ACCEL_EXPORT void tabulaArenaFlush(TabulaArena *arena, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        arenaOf(arena).flush();
    };
}

TABULA_ACCEL_EXPORT int64_t tabulaArenaHandleCount(TabulaArena *arena, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        return arenaOf(arena).handleCount();
    };
}

TABULA_ACCEL_EXPORT int64_t tabulaArenaBytesAllocated(TabulaArena *arena, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        return arenaOf(arena).bytesAllocated();
    };
}

TABULA_ACCEL_EXPORT TabulaHandle tabulaRegisterFloat64(TabulaArena *arena, const double *values, int64_t length, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        if(length && !values)
            THROW("null buffer of length {}", length);
        return arenaOf(arena).add(toArray<arrow::Type::DOUBLE>(values, length));
    };
}

TABULA_ACCEL_EXPORT TabulaHandle tabulaRegisterInt32(TabulaArena *arena, const int32_t *values, int64_t length, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        if(length && !values)
            THROW("null buffer of length {}", length);
        return arenaOf(arena).add(toArray<arrow::Type::INT32>(values, length));
    };
}

TABULA_ACCEL_EXPORT void tabulaRelease(TabulaArena *arena, TabulaHandle handle, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        arenaOf(arena).release(handle);
    };
}

TABULA_ACCEL_EXPORT int64_t tabulaLength(TabulaArena *arena, TabulaHandle handle, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        return arenaOf(arena).access(handle)->length();
    };
}

TABULA_ACCEL_EXPORT void tabulaReadFloat64(TabulaArena *arena, TabulaHandle handle, double *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        std::shared_ptr<arrow::Array> keepAlive;
        auto &array = accessTyped<arrow::DoubleArray>(arenaOf(arena), handle, keepAlive);
        if(array.length())
        {
            validateOutput(out, "output");
            std::memcpy(out, array.raw_values(), array.length() * sizeof(double));
        }
    };
}

TABULA_ACCEL_EXPORT void tabulaReadInt32(TabulaArena *arena, TabulaHandle handle, int32_t *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        std::shared_ptr<arrow::Array> keepAlive;
        auto &array = accessTyped<arrow::Int32Array>(arenaOf(arena), handle, keepAlive);
        if(array.length())
        {
            validateOutput(out, "output");
            std::memcpy(out, array.raw_values(), array.length() * sizeof(int32_t));
        }
    };
}

TABULA_ACCEL_EXPORT double tabulaReduce(TabulaArena *arena, TabulaHandle handle, int32_t function, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto array = arenaOf(arena).access(handle);
        return reduceArray(*array, function);
    };
}

TABULA_ACCEL_EXPORT int32_t tabulaGroupReduce(TabulaArena *arena, TabulaHandle handle, const int32_t *groupIds, int64_t groupIdCount,
    int32_t groupCount, int32_t functionMask, TabulaHandle *outHandles, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto &handles = arenaOf(arena);
        auto array = handles.access(handle);
        if(groupIdCount != array->length())
            THROW("got {} group ids for {} elements", groupIdCount, array->length());
        if(groupIdCount)
            validateOutput(groupIds, "group ids");
        validateOutput(outHandles, "output handles");

        auto results = groupReduceArray(*array, groupIds, groupCount, functionMask);
        const auto added = handles.addAll(std::move(results));
        std::copy(added.begin(), added.end(), outHandles);
        return (int32_t)added.size();
    };
}

TABULA_ACCEL_EXPORT void tabulaSortIndices(TabulaArena *arena, TabulaHandle handle, int8_t ascending, int8_t nullsFirst,
    int64_t *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto array = arenaOf(arena).access(handle);
        auto indices = sortIndicesOf(*array, ascending != 0, nullsFirst != 0);
        if(!indices.empty())
        {
            validateOutput(out, "output");
            std::copy(indices.begin(), indices.end(), out);
        }
    };
}

TABULA_ACCEL_EXPORT void tabulaSortIndices2(TabulaArena *arena, TabulaHandle first, TabulaHandle second,
    int8_t firstAscending, int8_t secondAscending, int8_t nullsFirst, int64_t *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto &handles = arenaOf(arena);
        auto firstArray = handles.access(first);
        auto secondArray = handles.access(second);
        auto indices = sortIndicesOf(*firstArray, *secondArray, firstAscending != 0, secondAscending != 0, nullsFirst != 0);
        if(!indices.empty())
        {
            validateOutput(out, "output");
            std::copy(indices.begin(), indices.end(), out);
        }
    };
}

TABULA_ACCEL_EXPORT TabulaHandle tabulaFilter(TabulaArena *arena, TabulaHandle handle, const uint8_t *mask, int64_t maskLength, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto &handles = arenaOf(arena);
        auto array = handles.access(handle);
        if(maskLength != array->length())
            THROW("mask length {} does not match array length {}", maskLength, array->length());
        if(maskLength)
            validateOutput(mask, "mask");
        return handles.add(filterArray(*array, mask));
    };
}

TABULA_ACCEL_EXPORT void tabulaIsinNumeric(TabulaArena *arena, TabulaHandle handle, const double *candidates, int64_t candidateCount,
    double tolerance, uint8_t *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto array = arenaOf(arena).access(handle);
        if(candidateCount && !candidates)
            THROW("null candidate buffer of length {}", candidateCount);

        std::vector<double> candidateValues(candidates, candidates + candidateCount);
        if(array->length())
        {
            validateOutput(out, "output");
            isinNumeric(*array, candidateValues, tolerance, out);
        }
    };
}

TABULA_ACCEL_EXPORT void tabulaIsinStrings(const char *values, const int64_t *valueOffsets, int64_t valueCount,
    const char *candidates, const int64_t *candidateOffsets, int64_t candidateCount, uint8_t *out, const char **outError)
{
    return TRANSLATE_EXCEPTION(outError)
    {
        auto valueArray = stringArrayFrom(values, valueOffsets, valueCount);
        auto candidateArray = stringArrayFrom(candidates, candidateOffsets, candidateCount);
        if(valueCount)
        {
            validateOutput(out, "output");
            isinStrings(*valueArray, *candidateArray, out);
        }
    };
}

}
