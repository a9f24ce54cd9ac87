#include "HandleArena.h"

#include "Core/Common.h"

namespace
{

int64_t arrayBytes(const arrow::Array &array)
{
    int64_t ret = 0;
    for(auto &buffer : array.data()->buffers)
        if(buffer)
            ret += buffer->size();
    return ret;
}

}

int64_t HandleArena::add(std::shared_ptr<arrow::Array> array)
{
    if(!array)
        THROW("cannot register a null array");

    const auto size = arrayBytes(*array);
    std::unique_lock<std::mutex> lock{ mx };
    const auto handle = nextHandle++;
    storage.emplace(handle, std::move(array));
    bytes += size;
    return handle;
}

std::vector<int64_t> HandleArena::addAll(std::vector<std::shared_ptr<arrow::Array>> arrays)
{
    std::vector<int64_t> ret;
    ret.reserve(arrays.size());
    try
    {
        for(auto &array : arrays)
            ret.push_back(add(std::move(array)));
    }
    catch(...)
    {
        for(auto handle : ret)
            release(handle);
        throw;
    }
    return ret;
}

std::shared_ptr<arrow::Array> HandleArena::access(int64_t handle) const
{
    {
        std::unique_lock<std::mutex> lock{ mx };
        if(auto itr = storage.find(handle); itr != storage.end())
            return itr->second;
    }
    THROW("Cannot access handle {} -- was it previously registered?", handle);
}

void HandleArena::release(int64_t handle)
{
    std::shared_ptr<arrow::Array> released;
    {
        std::unique_lock<std::mutex> lock{ mx };
        if(auto itr = storage.find(handle); itr != storage.end())
        {
            released = std::move(itr->second);
            storage.erase(itr);
            bytes -= arrayBytes(*released);
        }
    }

    // array is freed outside the lock
    if(!released)
        THROW("Cannot release handle {} -- was it previously registered?", handle);
}

void HandleArena::flush()
{
    std::unordered_map<int64_t, std::shared_ptr<arrow::Array>> released;
    {
        std::unique_lock<std::mutex> lock{ mx };
        std::swap(released, storage);
        bytes = 0;
    }
    if(!released.empty())
        LOG("flushed {} live handles", released.size());
}

int64_t HandleArena::handleCount() const
{
    std::unique_lock<std::mutex> lock{ mx };
    return (int64_t)storage.size();
}

int64_t HandleArena::bytesAllocated() const
{
    std::unique_lock<std::mutex> lock{ mx };
    return bytes;
}
