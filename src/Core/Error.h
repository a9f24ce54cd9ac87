#pragma once
#include <string>
#include <type_traits>

#include "Common.h"

TABULA_EXPORT void setError(const char **outError, const char *errorToSet, const char *functionName) noexcept;
TABULA_EXPORT void clearError(const char **outError) noexcept;

template<typename Function>
auto translateExceptionToError(const char *functionName, const char **outError, Function &&f)
{
    using ResultType = std::invoke_result_t<Function>;
    constexpr auto returnVoid = std::is_same_v<void, ResultType>;

    try
    {
        clearError(outError);

        if constexpr(!returnVoid)
            return f();
        else
            f();
    }
    catch(std::exception &e)
    {
        setError(outError, e.what(), functionName);
    }
    catch(...)
    {
        setError(outError, "unknown exception", functionName);
    }

    if constexpr(!returnVoid)
        return ResultType{};
    else
        return;
}

struct ExceptionHelper
{
    const char *functionName;
    const char **outError;

    explicit ExceptionHelper(const char *functionName, const char **outError)
        : functionName(functionName), outError(outError)
    {}

    template<typename Function>
    auto operator<<(Function &&f) const noexcept
    {
        return translateExceptionToError(functionName, outError, std::forward<Function>(f));
    }
};

// Exceptions must not cross the accelerated backend's C ABI.
// TRANSLATE_EXCEPTION(outError) runs the lambda body that follows it; anything thrown there
// is caught and its message is written to *outError (thread-local storage, valid until the
// next failing call on the same thread). On success *outError is set to nullptr.
// The expression yields the body's return value, or a value-initialized one on failure.
// Body requires a semicolon after end.
#define TRANSLATE_EXCEPTION(OutError) ExceptionHelper(__FUNCTION__, OutError) << [&] () mutable
