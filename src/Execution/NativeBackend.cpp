#include "NativeBackend.h"

#include <dlfcn.h>

#include <algorithm>

#include <boost/filesystem.hpp>

namespace
{

// Calls f(args..., &error). Failure reported by the library becomes BackendError.
template<typename F, typename ...Args>
auto callChecked(const char *what, F f, Args ...args) -> BackendResult<std::conditional_t<std::is_void_v<std::invoke_result_t<F, Args..., const char **>>, std::monostate, std::invoke_result_t<F, Args..., const char **>>>
{
    if(!f)
        return BackendError{ fmt::format("{} is not available", what) };

    const char *error = nullptr;
    if constexpr(std::is_void_v<std::invoke_result_t<F, Args..., const char **>>)
    {
        f(args..., &error);
        if(error)
            return BackendError{ error };
        return std::monostate{};
    }
    else
    {
        auto ret = f(args..., &error);
        if(error)
            return BackendError{ error };
        return ret;
    }
}

int8_t isAscending(SortOrder order)
{
    return order == SortOrder::Ascending;
}

int8_t isNullsFirst(NullPosition nulls)
{
    return nulls == NullPosition::Before;
}

void appendStrings(const std::vector<std::string> &strings, std::string &data, std::vector<int64_t> &offsets)
{
    offsets.reserve(strings.size() + 1);
    offsets.push_back(0);
    for(auto &s : strings)
    {
        data += s;
        offsets.push_back((int64_t)data.size());
    }
}

}

std::optional<int32_t> functionBit(AggregateFunction function)
{
    switch(function)
    {
    case AggregateFunction::Sum:      return TABULA_SUM;
    case AggregateFunction::Mean:     return TABULA_MEAN;
    case AggregateFunction::Count:    return TABULA_COUNT;
    case AggregateFunction::Minimum:  return TABULA_MIN;
    case AggregateFunction::Maximum:  return TABULA_MAX;
    case AggregateFunction::StdDev:   return TABULA_STD;
    case AggregateFunction::Variance: return TABULA_VAR;
    default:                          return std::nullopt;
    }
}

NativeBackend::NativeBackend(std::string name, Functions functions, void *library)
    : name_(std::move(name))
    , functions_(functions)
    , library_(library)
{
    const char *error = nullptr;
    arena_ = functions_.tabulaArenaNew(&error);
    if(error || !arena_)
    {
        if(library_)
            dlclose(library_);
        THROW("failed to create arena in backend {}: {}", name_, error ? error : "null arena");
    }
    functions_.tabulaSetVerbosity(Logger::instance().enabled.load());
}

NativeBackend::~NativeBackend()
{
    const char *error = nullptr;
    functions_.tabulaArenaFlush(arena_, &error);
    if(error)
        LOG("failed to flush arena of backend {}: {}", name_, error);

    functions_.tabulaArenaFree(arena_);
    if(library_)
        dlclose(library_);
}

std::shared_ptr<NativeBackend> NativeBackend::load(const std::string &libraryPath)
{
    const boost::filesystem::path path{libraryPath};
    if(path.has_parent_path() && !boost::filesystem::exists(path))
    {
        LOG("accelerated backend library {} does not exist", path.string());
        return nullptr;
    }

    // bare file names are left to the dynamic loader search path
    auto library = dlopen(libraryPath.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if(!library)
    {
        LOG("failed to load accelerated backend library {}: {}", libraryPath, dlerror());
        return nullptr;
    }

    Functions functions;
    bool complete = true;
#define TABULA_RESOLVE_SYMBOL(name)                                                  \
    functions.name = reinterpret_cast<decltype(functions.name)>(dlsym(library, #name)); \
    if(!functions.name)                                                              \
    {                                                                                \
        LOG("accelerated backend library {} lacks symbol {}", libraryPath, #name);   \
        complete = false;                                                            \
    }
    TABULA_ACCEL_FUNCTIONS(TABULA_RESOLVE_SYMBOL)
#undef TABULA_RESOLVE_SYMBOL

    if(!complete)
    {
        dlclose(library);
        return nullptr;
    }

    try
    {
        return std::make_shared<NativeBackend>(path.filename().string(), functions, library);
    }
    catch(std::exception &e)
    {
        // constructor already closed the library
        LOG("failed to initialize accelerated backend {}: {}", libraryPath, e.what());
        return nullptr;
    }
}

BackendResult<OwnedHandle> NativeBackend::registerBuffer(const std::vector<double> &values)
{
    return then(callChecked("register", functions_.tabulaRegisterFloat64, arena_, values.data(), (int64_t)values.size()),
        [&] (int64_t handle) -> BackendResult<OwnedHandle> { return adopt(handle); });
}

BackendResult<OwnedHandle> NativeBackend::registerBuffer(const std::vector<int32_t> &values)
{
    return then(callChecked("register", functions_.tabulaRegisterInt32, arena_, values.data(), (int64_t)values.size()),
        [&] (int64_t handle) -> BackendResult<OwnedHandle> { return adopt(handle); });
}

BackendResult<int64_t> NativeBackend::length(const OwnedHandle &handle)
{
    return callChecked("length", functions_.tabulaLength, arena_, handle.get());
}

BackendResult<std::vector<double>> NativeBackend::readFloat64(const OwnedHandle &handle)
{
    return then(length(handle), [&] (int64_t length) -> BackendResult<std::vector<double>>
    {
        std::vector<double> ret(length);
        return then(callChecked("read", functions_.tabulaReadFloat64, arena_, handle.get(), ret.data()),
            [&] (std::monostate) -> BackendResult<std::vector<double>> { return std::move(ret); });
    });
}

BackendResult<std::vector<int32_t>> NativeBackend::readInt32(const OwnedHandle &handle)
{
    return then(length(handle), [&] (int64_t length) -> BackendResult<std::vector<int32_t>>
    {
        std::vector<int32_t> ret(length);
        return then(callChecked("read", functions_.tabulaReadInt32, arena_, handle.get(), ret.data()),
            [&] (std::monostate) -> BackendResult<std::vector<int32_t>> { return std::move(ret); });
    });
}

BackendResult<double> NativeBackend::reduce(const OwnedHandle &handle, AggregateFunction function)
{
    const auto bit = functionBit(function);
    if(!bit)
        return BackendError{ fmt::format("{} is not computed by backend", to_string(function)) };
    return callChecked("reduce", functions_.tabulaReduce, arena_, handle.get(), *bit);
}

BackendResult<std::vector<OwnedHandle>> NativeBackend::groupReduce(const OwnedHandle &handle, const std::vector<int32_t> &groupIds,
    int32_t groupCount, const std::vector<AggregateFunction> &functions)
{
    int32_t mask = 0;
    for(auto function : functions)
    {
        const auto bit = functionBit(function);
        if(!bit)
            return BackendError{ fmt::format("{} is not computed by backend", to_string(function)) };
        mask |= *bit;
    }

    std::vector<TabulaHandle> rawHandles(functions.size());
    auto written = callChecked("groupReduce", functions_.tabulaGroupReduce, arena_, handle.get(),
        groupIds.data(), (int64_t)groupIds.size(), groupCount, mask, rawHandles.data());

    return then(written, [&] (int32_t count) -> BackendResult<std::vector<OwnedHandle>>
    {
        // adopt everything first, so nothing leaks on the error paths below
        std::vector<OwnedHandle> byBit;
        for(int32_t i = 0; i < count && i < (int32_t)rawHandles.size(); i++)
            byBit.push_back(adopt(rawHandles[i]));

        // results come in increasing bit order, callers want them in the order asked
        std::vector<int32_t> bits;
        for(int32_t bit = 1; bit <= mask; bit <<= 1)
            if(mask & bit)
                bits.push_back(bit);

        if(count != (int32_t)bits.size())
            return BackendError{ fmt::format("backend wrote {} results for {} functions", count, bits.size()) };

        std::vector<std::optional<OwnedHandle>> slots;
        for(auto &h : byBit)
            slots.emplace_back(std::move(h));

        std::vector<OwnedHandle> ret;
        for(auto function : functions)
        {
            const auto position = std::find(bits.begin(), bits.end(), *functionBit(function)) - bits.begin();
            if(!slots[position])
                return BackendError{ fmt::format("{} requested more than once", to_string(function)) };
            ret.push_back(std::move(*slots[position]));
            slots[position].reset();
        }
        return ret;
    });
}

BackendResult<Permutation> NativeBackend::sortIndices(const OwnedHandle &handle, SortOrder order, NullPosition nulls)
{
    return then(length(handle), [&] (int64_t length) -> BackendResult<Permutation>
    {
        Permutation ret(length);
        return then(callChecked("sortIndices", functions_.tabulaSortIndices, arena_, handle.get(), isAscending(order), isNullsFirst(nulls), ret.data()),
            [&] (std::monostate) -> BackendResult<Permutation> { return std::move(ret); });
    });
}

BackendResult<Permutation> NativeBackend::sortIndices(const OwnedHandle &first, const OwnedHandle &second,
    SortOrder firstOrder, SortOrder secondOrder, NullPosition nulls)
{
    return then(length(first), [&] (int64_t length) -> BackendResult<Permutation>
    {
        Permutation ret(length);
        return then(callChecked("sortIndices", functions_.tabulaSortIndices2, arena_, first.get(), second.get(),
            isAscending(firstOrder), isAscending(secondOrder), isNullsFirst(nulls), ret.data()),
            [&] (std::monostate) -> BackendResult<Permutation> { return std::move(ret); });
    });
}

BackendResult<OwnedHandle> NativeBackend::filter(const OwnedHandle &handle, const std::vector<uint8_t> &mask)
{
    return then(callChecked("filter", functions_.tabulaFilter, arena_, handle.get(), mask.data(), (int64_t)mask.size()),
        [&] (int64_t filtered) -> BackendResult<OwnedHandle> { return adopt(filtered); });
}

BackendResult<std::vector<uint8_t>> NativeBackend::isin(const OwnedHandle &handle, const std::vector<double> &candidates, double tolerance)
{
    return then(length(handle), [&] (int64_t length) -> BackendResult<std::vector<uint8_t>>
    {
        std::vector<uint8_t> ret(length);
        return then(callChecked("isin", functions_.tabulaIsinNumeric, arena_, handle.get(), candidates.data(), (int64_t)candidates.size(), tolerance, ret.data()),
            [&] (std::monostate) -> BackendResult<std::vector<uint8_t>> { return std::move(ret); });
    });
}

BackendResult<std::vector<uint8_t>> NativeBackend::isin(const std::vector<std::string> &values, const std::vector<std::string> &candidates)
{
    std::string valueData, candidateData;
    std::vector<int64_t> valueOffsets, candidateOffsets;
    appendStrings(values, valueData, valueOffsets);
    appendStrings(candidates, candidateData, candidateOffsets);

    std::vector<uint8_t> ret(values.size());
    return then(callChecked("isin", functions_.tabulaIsinStrings, valueData.data(), valueOffsets.data(), (int64_t)values.size(),
        candidateData.data(), candidateOffsets.data(), (int64_t)candidates.size(), ret.data()),
        [&] (std::monostate) -> BackendResult<std::vector<uint8_t>> { return std::move(ret); });
}

int64_t NativeBackend::liveHandleCount() const
{
    const char *error = nullptr;
    const auto ret = functions_.tabulaArenaHandleCount(arena_, &error);
    if(error)
        THROW("{}", error);
    return ret;
}

int64_t NativeBackend::bytesAllocated() const
{
    const char *error = nullptr;
    const auto ret = functions_.tabulaArenaBytesAllocated(arena_, &error);
    if(error)
        THROW("{}", error);
    return ret;
}

void NativeBackend::flush()
{
    const char *error = nullptr;
    functions_.tabulaArenaFlush(arena_, &error);
    if(error)
        THROW("{}", error);
}

std::optional<BackendError> NativeBackend::release(BackendHandle handle) noexcept
{
    const char *error = nullptr;
    functions_.tabulaRelease(arena_, handle, &error);
    if(error)
        return BackendError{ error };
    return std::nullopt;
}
