#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <arrow/array.h>

// Owns the arrays whose handles were given out through the C ABI.
// Each registered array gets a new id, ids are never reused, also not after flush.
//
// Storage is thread-safe (internally synchronized with a lock).
class HandleArena
{
    mutable std::mutex mx;
    std::unordered_map<int64_t, std::shared_ptr<arrow::Array>> storage; // handle => array
    int64_t nextHandle = 1;
    int64_t bytes = 0;

public:
    HandleArena() = default;
    HandleArena(const HandleArena &) = delete;
    HandleArena &operator=(const HandleArena &) = delete;

    int64_t add(std::shared_ptr<arrow::Array> array);
    // all or nothing: if any add fails, the arrays added before it are released again
    std::vector<int64_t> addAll(std::vector<std::shared_ptr<arrow::Array>> arrays);
    std::shared_ptr<arrow::Array> access(int64_t handle) const;
    void release(int64_t handle);
    void flush();

    int64_t handleCount() const;
    int64_t bytesAllocated() const;
};
