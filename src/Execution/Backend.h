#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <variant>
#include <vector>

#include "Core/Common.h"
#include "Analysis.h"
#include "Sort.h"

class AcceleratedBackend;

// Opaque id of a buffer living in the backend's arena.
using BackendHandle = int64_t;

// Backend call failed. Never thrown, always returned, so the dispatcher can fall back.
struct BackendError
{
    std::string message;
};

template<typename T>
using BackendResult = std::variant<T, BackendError>;

// Applies f to the success value, passing errors through. f must return BackendResult<U>.
template<typename T, typename F>
auto then(BackendResult<T> &&result, F &&f) -> std::invoke_result_t<F, T&>
{
    if(auto error = std::get_if<BackendError>(&result))
        return std::move(*error);
    return f(std::get<T>(result));
}

template<typename T, typename F>
auto then(BackendResult<T> &result, F &&f) -> std::invoke_result_t<F, T&>
{
    return then(std::move(result), std::forward<F>(f));
}

// Handle registered in the backend, released when this object dies.
// Only AcceleratedBackend implementations can mint one, callers cannot release raw handles.
class TABULA_EXPORT OwnedHandle
{
    AcceleratedBackend *backend_ = nullptr;
    BackendHandle handle_ = -1;

    OwnedHandle(AcceleratedBackend &backend, BackendHandle handle);
    friend class AcceleratedBackend;

public:
    OwnedHandle(OwnedHandle &&rhs) noexcept;
    OwnedHandle &operator=(OwnedHandle &&rhs) noexcept;
    OwnedHandle(const OwnedHandle &) = delete;
    OwnedHandle &operator=(const OwnedHandle &) = delete;
    ~OwnedHandle();

    BackendHandle get() const { return handle_; }
    bool valid() const { return backend_ != nullptr; }
};

// Seam between the engine and an accelerated implementation of the numeric kernels.
// Every result of the portable path must be reproduced exactly (floating point within rounding).
class TABULA_EXPORT AcceleratedBackend
{
    friend class OwnedHandle;

protected:
    OwnedHandle adopt(BackendHandle handle) { return OwnedHandle(*this, handle); }

    // called exactly once per adopted handle
    virtual std::optional<BackendError> release(BackendHandle handle) noexcept = 0;

public:
    virtual ~AcceleratedBackend() = default;

    virtual std::string name() const = 0;

    virtual BackendResult<OwnedHandle> registerBuffer(const std::vector<double> &values) = 0;
    virtual BackendResult<OwnedHandle> registerBuffer(const std::vector<int32_t> &values) = 0;
    virtual BackendResult<std::vector<double>> readFloat64(const OwnedHandle &handle) = 0;
    virtual BackendResult<std::vector<int32_t>> readInt32(const OwnedHandle &handle) = 0;

    // NaN elements are nulls
    virtual BackendResult<double> reduce(const OwnedHandle &handle, AggregateFunction function) = 0;

    // One float64 buffer per requested function, in the order of functions, each with groupCount values.
    // groupIds hold the group ordinal of each row, -1 for rows that belong to no group.
    virtual BackendResult<std::vector<OwnedHandle>> groupReduce(const OwnedHandle &handle, const std::vector<int32_t> &groupIds,
        int32_t groupCount, const std::vector<AggregateFunction> &functions) = 0;

    virtual BackendResult<Permutation> sortIndices(const OwnedHandle &handle, SortOrder order, NullPosition nulls) = 0;
    virtual BackendResult<Permutation> sortIndices(const OwnedHandle &first, const OwnedHandle &second,
        SortOrder firstOrder, SortOrder secondOrder, NullPosition nulls) = 0;

    // mask holds 0 or 1 per element
    virtual BackendResult<OwnedHandle> filter(const OwnedHandle &handle, const std::vector<uint8_t> &mask) = 0;

    virtual BackendResult<std::vector<uint8_t>> isin(const OwnedHandle &handle, const std::vector<double> &candidates, double tolerance) = 0;
    virtual BackendResult<std::vector<uint8_t>> isin(const std::vector<std::string> &values, const std::vector<std::string> &candidates) = 0;

    virtual int64_t liveHandleCount() const = 0;
    virtual int64_t bytesAllocated() const = 0;
    // releases every live handle, outstanding OwnedHandle objects become stale
    virtual void flush() = 0;
};
