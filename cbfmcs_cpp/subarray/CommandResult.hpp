#ifndef CBFMCS_CPP_SUBARRAY_COMMANDRESULT_HPP
#define CBFMCS_CPP_SUBARRAY_COMMANDRESULT_HPP

#include <string>

namespace cbfmcs_cpp {
namespace subarray {

enum class ResultCode
{
    OK = 0,
    FAILED,
    REJECTED
};

inline std::string to_string(ResultCode code)
{
    switch (code)
    {
        case ResultCode::OK: return "OK";
        case ResultCode::FAILED: return "FAILED";
        case ResultCode::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

struct CommandResult
{
    ResultCode code;
    std::string message;

    bool ok() const
    {
        return code == ResultCode::OK;
    }
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_COMMANDRESULT_HPP
