#include "DType.h"

#include <boost/algorithm/string/predicate.hpp>

bool isNumeric(DType id)
{
    return visitDType(id, [] (auto idC) { return DTypeDescription<idC.value>::numeric; });
}

const char *to_string(DType id)
{
    return visitDType(id, [] (auto idC) { return DTypeDescription<idC.value>::name; });
}

std::ostream &operator<<(std::ostream &out, DType id)
{
    return out << to_string(id);
}

DType dtypeFromName(std::string_view name)
{
    for(auto id : { DType::Int32, DType::Float64, DType::String, DType::Bool, DType::DateTime })
        if(boost::iequals(name, to_string(id)))
            return id;

    LOG("unrecognized dtype name `{}`, using string", name);
    return DType::String;
}
