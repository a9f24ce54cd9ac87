#pragma once

#include <memory>
#include <string_view>

#include "Core/Common.h"
#include "Core/Config.h"
#include "Execution/Backend.h"

class Column;

struct ExecutionStats
{
    int64_t accelerated = 0; // calls answered by the backend
    int64_t portable = 0;    // calls that never tried the backend
    int64_t fallbacks = 0;   // backend calls that failed and were recomputed portably
};

// Engine instance: configuration plus the optional accelerated backend.
// Every operation that can be accelerated takes one of these, there is no global default.
class TABULA_EXPORT ExecutionContext
{
    EngineConfig config_;
    std::shared_ptr<AcceleratedBackend> backend_;
    ExecutionStats stats_;

public:
    // portable only
    ExecutionContext();
    explicit ExecutionContext(EngineConfig config, std::shared_ptr<AcceleratedBackend> backend = nullptr);

    // Loads config.backendLibrary when useAccelerated is set. Missing library leaves the context portable.
    static ExecutionContext fromConfig(EngineConfig config);

    const EngineConfig &config() const { return config_; }
    AcceleratedBackend *backend() const { return backend_.get(); }
    const ExecutionStats &stats() const { return stats_; }
    void resetStats() { stats_ = {}; }

    // float64, or int32 without nulls, long enough to be worth the trip
    bool canAccelerate(const Column &column) const;
    // string column in dense storage
    bool canAccelerateStrings(const Column &column) const;

    // Runs accelerated(backend) when eligible, portable() otherwise or when the backend reports an error
    // or throws. Both branches must produce the same result.
    template<typename Accelerated, typename Portable>
    auto run(std::string_view operation, bool eligible, Accelerated &&accelerated, Portable &&portable) -> std::invoke_result_t<Portable>
    {
        using T = std::invoke_result_t<Portable>;
        if(eligible && backend_)
        {
            try
            {
                BackendResult<T> result = accelerated(*backend_);
                if(auto value = std::get_if<T>(&result))
                {
                    stats_.accelerated++;
                    return std::move(*value);
                }
                LOG("{}: backend {} failed, falling back to portable path: {}", operation, backend_->name(), std::get<BackendError>(result).message);
            }
            catch(std::exception &e)
            {
                LOG("{}: backend {} threw, falling back to portable path: {}", operation, backend_->name(), e.what());
            }
            stats_.fallbacks++;
            return portable();
        }

        stats_.portable++;
        return portable();
    }
};

// Copies a float64 or null-free int32 column into the backend.
TABULA_EXPORT BackendResult<OwnedHandle> registerColumn(AcceleratedBackend &backend, const Column &column);
