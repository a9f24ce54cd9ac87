#pragma once

#include "Execution/NativeBackend.h"

// Backend bound to a tabula_accel copy linked into the executable, without dlopen.
// Only usable by targets that link tabula_accel.
inline NativeBackend::Functions linkedFunctions()
{
    NativeBackend::Functions functions;
#define TABULA_BIND_SYMBOL(name) functions.name = &::name;
    TABULA_ACCEL_FUNCTIONS(TABULA_BIND_SYMBOL)
#undef TABULA_BIND_SYMBOL
    return functions;
}

inline std::shared_ptr<NativeBackend> makeLinkedBackend()
{
    return std::make_shared<NativeBackend>("linked", linkedFunctions());
}
