#include "ExecutionContext.h"

#include "Column.h"
#include "Execution/NativeBackend.h"

ExecutionContext::ExecutionContext()
{
    config_.useAccelerated = false;
}

ExecutionContext::ExecutionContext(EngineConfig config, std::shared_ptr<AcceleratedBackend> backend)
    : config_(std::move(config))
    , backend_(config_.useAccelerated ? std::move(backend) : nullptr)
{
}

ExecutionContext ExecutionContext::fromConfig(EngineConfig config)
{
    setVerbosity(config.verbose);
    if(!config.useAccelerated)
        return ExecutionContext(std::move(config));

    auto backend = NativeBackend::load(config.backendLibrary);
    if(!backend)
        LOG("continuing without accelerated backend");
    return ExecutionContext(std::move(config), std::move(backend));
}

bool ExecutionContext::canAccelerate(const Column &column) const
{
    if(!backend_ || !config_.useAccelerated || column.length() < config_.minAcceleratedLength)
        return false;

    switch(column.dtype())
    {
    case DType::Float64: return column.denseValues<double>() != nullptr;
    case DType::Int32:   return column.denseValues<int32_t>() != nullptr;
    default:             return false;
    }
}

bool ExecutionContext::canAccelerateStrings(const Column &column) const
{
    return backend_
        && config_.useAccelerated
        && column.length() >= config_.minAcceleratedLength
        && column.denseValues<std::string>() != nullptr;
}

BackendResult<OwnedHandle> registerColumn(AcceleratedBackend &backend, const Column &column)
{
    if(auto doubles = column.denseValues<double>())
        return backend.registerBuffer(*doubles);
    if(auto ints = column.denseValues<int32_t>())
        return backend.registerBuffer(*ints);
    return BackendError{ fmt::format("column '{}' of type {} cannot be registered in backend", column.name(), to_string(column.dtype())) };
}
