#include "Error.h"

namespace
{
    const auto unknownInternalErrorText = "Unknown internal error encountered";
    thread_local std::string errorMessage;
}

void setError(const char **outError, const char *errorToSet, const char *functionName) noexcept
{
    if(!outError)
        return;

    try
    {
        if(functionName)
            errorMessage = std::string(functionName) + ": " + errorToSet;
        else
            errorMessage = errorToSet;

        *outError = errorMessage.c_str();
    }
    catch(std::exception &)
    {
        // message did not fit in memory, report at least something
        *outError = unknownInternalErrorText;
    }
}

void clearError(const char **outError) noexcept
{
    if(outError)
        *outError = nullptr;
}
