#ifndef CBFMCS_CPP_SUBARRAY_OBSSTATE_HPP
#define CBFMCS_CPP_SUBARRAY_OBSSTATE_HPP

#include "cbfmcs_cpp/common.hpp"

namespace cbfmcs_cpp {
namespace subarray {

enum class ObsState
{
    EMPTY = 0,
    RESOURCING,
    IDLE,
    CONFIGURING,
    READY,
    SCANNING,
    ABORTING,
    ABORTED,
    RESETTING,
    FAULT,
    RESTARTING
};

std::string to_string(ObsState state);

std::ostream& operator<<(std::ostream& stream, ObsState state);

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_OBSSTATE_HPP
