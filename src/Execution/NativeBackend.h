#pragma once

#include <memory>
#include <string>

#include "Execution/Backend.h"
#include "accel/Accelerated.h"

// X(name) for every symbol of the accelerated library the engine uses
#define TABULA_ACCEL_FUNCTIONS(X) \
    X(tabulaSetVerbosity)         \
    X(tabulaArenaNew)             \
    X(tabulaArenaFree)            \
    X(tabulaArenaFlush)           \
    X(tabulaArenaHandleCount)     \
    X(tabulaArenaBytesAllocated)  \
    X(tabulaRegisterFloat64)      \
    X(tabulaRegisterInt32)        \
    X(tabulaRelease)              \
    X(tabulaLength)               \
    X(tabulaReadFloat64)          \
    X(tabulaReadInt32)            \
    X(tabulaReduce)               \
    X(tabulaGroupReduce)          \
    X(tabulaSortIndices)          \
    X(tabulaSortIndices2)         \
    X(tabulaFilter)               \
    X(tabulaIsinNumeric)          \
    X(tabulaIsinStrings)

// Accelerated backend talking to the tabula_accel C ABI, one arena per backend object.
class TABULA_EXPORT NativeBackend : public AcceleratedBackend
{
public:
    struct Functions
    {
#define TABULA_DECLARE_POINTER(name) decltype(&::name) name = nullptr;
        TABULA_ACCEL_FUNCTIONS(TABULA_DECLARE_POINTER)
#undef TABULA_DECLARE_POINTER
    };

    // library is the dlopen handle to close on destruction, nullptr when functions are linked in
    NativeBackend(std::string name, Functions functions, void *library = nullptr);
    NativeBackend(const NativeBackend &) = delete;
    NativeBackend &operator=(const NativeBackend &) = delete;
    ~NativeBackend() override;

    // nullptr when the library or any of its symbols cannot be found, the reason is logged
    static std::shared_ptr<NativeBackend> load(const std::string &libraryPath);

    std::string name() const override { return name_; }

    BackendResult<OwnedHandle> registerBuffer(const std::vector<double> &values) override;
    BackendResult<OwnedHandle> registerBuffer(const std::vector<int32_t> &values) override;
    BackendResult<std::vector<double>> readFloat64(const OwnedHandle &handle) override;
    BackendResult<std::vector<int32_t>> readInt32(const OwnedHandle &handle) override;

    BackendResult<double> reduce(const OwnedHandle &handle, AggregateFunction function) override;
    BackendResult<std::vector<OwnedHandle>> groupReduce(const OwnedHandle &handle, const std::vector<int32_t> &groupIds,
        int32_t groupCount, const std::vector<AggregateFunction> &functions) override;

    BackendResult<Permutation> sortIndices(const OwnedHandle &handle, SortOrder order, NullPosition nulls) override;
    BackendResult<Permutation> sortIndices(const OwnedHandle &first, const OwnedHandle &second,
        SortOrder firstOrder, SortOrder secondOrder, NullPosition nulls) override;

    BackendResult<OwnedHandle> filter(const OwnedHandle &handle, const std::vector<uint8_t> &mask) override;

    BackendResult<std::vector<uint8_t>> isin(const OwnedHandle &handle, const std::vector<double> &candidates, double tolerance) override;
    BackendResult<std::vector<uint8_t>> isin(const std::vector<std::string> &values, const std::vector<std::string> &candidates) override;

    int64_t liveHandleCount() const override;
    int64_t bytesAllocated() const override;
    void flush() override;

protected:
    std::optional<BackendError> release(BackendHandle handle) noexcept override;

private:
    std::string name_;
    Functions functions_;
    void *library_ = nullptr;
    TabulaArena *arena_ = nullptr;

    BackendResult<int64_t> length(const OwnedHandle &handle);
};

// C ABI bit of a numeric reduction, nullopt for first, last and size
TABULA_EXPORT std::optional<int32_t> functionBit(AggregateFunction function);
