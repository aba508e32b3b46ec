#include "cbfmcs_cpp/subarray/ObsState.hpp"

namespace cbfmcs_cpp {
namespace subarray {

std::string to_string(ObsState state)
{
    switch (state)
    {
        case ObsState::EMPTY: return "EMPTY";
        case ObsState::RESOURCING: return "RESOURCING";
        case ObsState::IDLE: return "IDLE";
        case ObsState::CONFIGURING: return "CONFIGURING";
        case ObsState::READY: return "READY";
        case ObsState::SCANNING: return "SCANNING";
        case ObsState::ABORTING: return "ABORTING";
        case ObsState::ABORTED: return "ABORTED";
        case ObsState::RESETTING: return "RESETTING";
        case ObsState::FAULT: return "FAULT";
        case ObsState::RESTARTING: return "RESTARTING";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& stream, ObsState state)
{
    stream << to_string(state);
    return stream;
}

} //namespace subarray
} //namespace cbfmcs_cpp
