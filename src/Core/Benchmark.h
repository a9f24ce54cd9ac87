#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "Common.h"

using namespace std::chrono_literals;

// returns pair [f(args...), elapsed time], nullptr standing in for a void result
template<typename F, typename ...Args>
auto callDuration(F &&func, Args &&...args)
{
    const auto start = std::chrono::steady_clock::now();
    if constexpr(std::is_void_v<std::invoke_result_t<F, Args...>>)
    {
        std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
        return std::make_pair(nullptr, std::chrono::steady_clock::now() - start);
    }
    else
    {
        auto ret = std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
        return std::make_pair(std::move(ret), std::chrono::steady_clock::now() - start);
    }
}

// Repeat until both the run count and the total time reach their minimum.
struct MeasureAtLeast
{
    int64_t requiredCount{};
    std::chrono::milliseconds requiredTime{};

    explicit MeasureAtLeast(int64_t requiredCount, std::chrono::milliseconds requiredTime = 0ms)
        : requiredCount(requiredCount), requiredTime(requiredTime)
    {}

    template<typename Duration>
    bool measuredEnough(int64_t count, Duration timeSpent) const
    {
        return requiredCount <= count && timeSpent >= requiredTime;
    }
};

struct MeasureSeries
{
    using Duration = std::chrono::microseconds;
    std::string name;
    std::vector<Duration> times;

    explicit MeasureSeries(std::string name)
        : name(std::move(name))
    {}

    Duration bestTime() const
    {
        if(times.empty())
            THROW("no measures of {}", name);
        return *std::min_element(times.begin(), times.end());
    }
};

template<typename F, typename ...Args>
auto measure(const std::string &text, const MeasureAtLeast &policy, F &&func, Args &&...args)
{
    using namespace std::chrono;

    MeasureSeries measures{text};
    const auto startTime = steady_clock::now();
    while(true)
    {
        auto [value, elapsed] = callDuration(func, args...);
        measures.times.push_back(duration_cast<microseconds>(elapsed));
        fmt::print("{} took {} ms, best: {} ms\n", text, measures.times.back().count() / 1000.0, measures.bestTime().count() / 1000.0);

        if(policy.measuredEnough((int64_t)measures.times.size(), steady_clock::now() - startTime))
            return std::make_pair(std::move(value), measures);
    }
}
