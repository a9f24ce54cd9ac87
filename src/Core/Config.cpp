#include "Config.h"

#include <cstdlib>

#include <boost/algorithm/string/predicate.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace
{

const rapidjson::Value *findMember(const rapidjson::Value &object, const char *name)
{
    if(auto itr = object.FindMember(name); itr != object.MemberEnd())
        return &itr->value;
    return nullptr;
}

template<typename T>
void readSetting(const rapidjson::Value &object, const char *name, T &target)
{
    const auto value = findMember(object, name);
    if(!value)
        return;

    if constexpr(std::is_same_v<T, bool>)
    {
        if(!value->IsBool())
            THROW_AS(UsageError, "config setting '{}' must be a boolean", name);
        target = value->GetBool();
    }
    else if constexpr(std::is_same_v<T, int64_t>)
    {
        if(!value->IsInt64())
            THROW_AS(UsageError, "config setting '{}' must be an integer", name);
        target = value->GetInt64();
    }
    else if constexpr(std::is_same_v<T, double>)
    {
        if(!value->IsNumber())
            THROW_AS(UsageError, "config setting '{}' must be a number", name);
        target = value->GetDouble();
    }
    else if constexpr(std::is_same_v<T, std::string>)
    {
        if(!value->IsString())
            THROW_AS(UsageError, "config setting '{}' must be a string", name);
        target = std::string(value->GetString(), value->GetStringLength());
    }
    else
        static_assert(always_false_v<T>, "unsupported setting type");
}

std::optional<std::string> environmentVariable(const char *name)
{
    if(auto value = std::getenv(name))
        return std::string(value);
    return std::nullopt;
}

}

bool parseFlag(std::string_view text)
{
    for(auto falsy : { "", "0", "false", "off", "no" })
        if(boost::iequals(text, std::string_view(falsy)))
            return false;
    return true;
}

EngineConfig EngineConfig::fromJson(const char *jsonText)
{
    rapidjson::Document doc{};
    doc.Parse(jsonText);
    if(doc.HasParseError())
        THROW_AS(UsageError, "failed to parse config JSON: {}", rapidjson::GetParseError_En(doc.GetParseError()));
    if(!doc.IsObject())
        THROW_AS(UsageError, "config JSON must be an object");

    EngineConfig ret;
    readSetting(doc, "useAccelerated", ret.useAccelerated);
    readSetting(doc, "backendLibrary", ret.backendLibrary);
    readSetting(doc, "minAcceleratedLength", ret.minAcceleratedLength);
    readSetting(doc, "isinTolerance", ret.isinTolerance);
    readSetting(doc, "verbose", ret.verbose);

    if(ret.minAcceleratedLength < 0)
        THROW_AS(UsageError, "config setting 'minAcceleratedLength' must not be negative, got {}", ret.minAcceleratedLength);
    if(!(ret.isinTolerance >= 0))
        THROW_AS(UsageError, "config setting 'isinTolerance' must not be negative, got {}", ret.isinTolerance);
    return ret;
}

EngineConfig EngineConfig::fromEnvironment(EngineConfig base)
{
    if(auto library = environmentVariable("TABULA_BACKEND"))
        base.backendLibrary = *library;
    if(auto accelerated = environmentVariable("TABULA_ACCELERATED"))
        base.useAccelerated = parseFlag(*accelerated);
    if(auto verbose = environmentVariable("TABULA_VERBOSE"))
        base.verbose = parseFlag(*verbose);
    return base;
}
