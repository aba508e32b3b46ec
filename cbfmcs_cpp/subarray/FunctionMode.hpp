#ifndef CBFMCS_CPP_SUBARRAY_FUNCTIONMODE_HPP
#define CBFMCS_CPP_SUBARRAY_FUNCTIONMODE_HPP

#include <boost/optional.hpp>
#include <string>

namespace cbfmcs_cpp {
namespace subarray {

enum class FunctionMode
{
    IDLE = 0,
    CORR,
    PSS_BF,
    PST_BF,
    VLBI
};

inline std::string to_string(FunctionMode mode)
{
    switch (mode)
    {
        case FunctionMode::IDLE: return "IDLE";
        case FunctionMode::CORR: return "CORR";
        case FunctionMode::PSS_BF: return "PSS-BF";
        case FunctionMode::PST_BF: return "PST-BF";
        case FunctionMode::VLBI: return "VLBI";
    }
    return "UNKNOWN";
}

inline boost::optional<FunctionMode> parse_function_mode(std::string const& name)
{
    if (name == "IDLE") return FunctionMode::IDLE;
    if (name == "CORR") return FunctionMode::CORR;
    if (name == "PSS-BF") return FunctionMode::PSS_BF;
    if (name == "PST-BF") return FunctionMode::PST_BF;
    if (name == "VLBI") return FunctionMode::VLBI;
    return boost::none;
}

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_FUNCTIONMODE_HPP
