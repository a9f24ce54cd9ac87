#pragma once
#include <atomic>
#include <iostream>

#include <fmt/format.h>

class Logger
{
public:
    std::atomic_bool enabled{false};

    static Logger &instance()
    {
        static Logger logger;
        return logger;
    }
};

inline void setVerbosity(bool verbose)
{
    Logger::instance().enabled.store(verbose);
}

#define LOG(...) do                                           \
    {                                                         \
        if(Logger::instance().enabled.load())                 \
        {                                                     \
            fmt::print("C++ {}: ", __FUNCTION__);             \
            fmt::print(__VA_ARGS__); std::cout << std::endl;  \
        }                                                     \
    } while(0)
