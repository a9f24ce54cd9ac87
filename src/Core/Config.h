#pragma once

#include <string>
#include <string_view>

#include "Common.h"

// Knobs of a single engine instance. Nothing here is global.
struct TABULA_EXPORT EngineConfig
{
    bool useAccelerated = true;
    std::string backendLibrary = "libtabula_accel.so";
    int64_t minAcceleratedLength = 0; // shorter columns go straight to the portable path
    double isinTolerance = 1e-9;
    bool verbose = false;

    // Keys: useAccelerated, backendLibrary, minAcceleratedLength, isinTolerance, verbose.
    // Unknown keys are ignored, malformed JSON or a value of wrong type is a UsageError.
    static EngineConfig fromJson(const char *jsonText);

    // Overrides base with TABULA_BACKEND, TABULA_ACCELERATED and TABULA_VERBOSE, when set.
    static EngineConfig fromEnvironment(EngineConfig base = {});
};

// "0", "false", "off", "no" (any case) and the empty string are false, everything else is true.
TABULA_EXPORT bool parseFlag(std::string_view text);
