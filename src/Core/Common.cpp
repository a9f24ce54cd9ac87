#include "Common.h"

bool isValidIndex(int64_t size, int64_t index)
{
    return index >= 0 && index < size;
}

void validateIndex(int64_t size, int64_t index)
{
    if(!isValidIndex(size, index))
        THROW_AS(UsageError, "wrong index={} when length={}", index, size);
}

void validateLength(const char *what, int64_t expected, int64_t actual)
{
    if(expected != actual)
        THROW_AS(UsageError, "length mismatch: {} has length {}, expected {}", what, actual, expected);
}
