#include "cbfmcs_cpp/subarray/ObsStateMachine.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"

namespace cbfmcs_cpp {
namespace subarray {

std::string to_string(ObsCommand command)
{
    switch (command)
    {
        case ObsCommand::ADD_RECEPTORS: return "AddReceptors";
        case ObsCommand::REMOVE_RECEPTORS: return "RemoveReceptors";
        case ObsCommand::REMOVE_ALL_RECEPTORS: return "RemoveAllReceptors";
        case ObsCommand::CONFIGURE_SCAN: return "ConfigureScan";
        case ObsCommand::SCAN: return "Scan";
        case ObsCommand::END_SCAN: return "EndScan";
        case ObsCommand::GO_TO_IDLE: return "GoToIdle";
        case ObsCommand::ABORT: return "Abort";
        case ObsCommand::OBS_RESET: return "ObsReset";
        case ObsCommand::RESTART: return "Restart";
    }
    return "Unknown";
}

ObsStateMachine::ObsStateMachine()
    : _state(ObsState::EMPTY)
{
}

ObsStateMachine::~ObsStateMachine()
{
}

bool ObsStateMachine::is_allowed(ObsState state, ObsCommand command)
{
    switch (command)
    {
        case ObsCommand::ADD_RECEPTORS:
            return state == ObsState::EMPTY || state == ObsState::IDLE;
        case ObsCommand::REMOVE_RECEPTORS:
        case ObsCommand::REMOVE_ALL_RECEPTORS:
            return state == ObsState::IDLE;
        case ObsCommand::CONFIGURE_SCAN:
            return state == ObsState::IDLE || state == ObsState::READY;
        case ObsCommand::SCAN:
            return state == ObsState::READY;
        case ObsCommand::END_SCAN:
            return state == ObsState::SCANNING;
        case ObsCommand::GO_TO_IDLE:
            return state == ObsState::READY;
        case ObsCommand::ABORT:
            return state == ObsState::IDLE
                || state == ObsState::CONFIGURING
                || state == ObsState::READY
                || state == ObsState::SCANNING;
        case ObsCommand::OBS_RESET:
            return state == ObsState::ABORTED;
        case ObsCommand::RESTART:
            return state == ObsState::ABORTED || state == ObsState::FAULT;
    }
    return false;
}

boost::optional<ObsState> ObsStateMachine::transitional_state(ObsCommand command)
{
    switch (command)
    {
        case ObsCommand::ADD_RECEPTORS:
        case ObsCommand::REMOVE_RECEPTORS:
        case ObsCommand::REMOVE_ALL_RECEPTORS:
            return ObsState::RESOURCING;
        case ObsCommand::CONFIGURE_SCAN:
            return ObsState::CONFIGURING;
        case ObsCommand::ABORT:
            return ObsState::ABORTING;
        case ObsCommand::OBS_RESET:
            return ObsState::RESETTING;
        case ObsCommand::RESTART:
            return ObsState::RESTARTING;
        default:
            return boost::none;
    }
}

ObsState ObsStateMachine::success_state(ObsCommand command, bool has_resources)
{
    switch (command)
    {
        case ObsCommand::ADD_RECEPTORS:
        case ObsCommand::REMOVE_RECEPTORS:
        case ObsCommand::REMOVE_ALL_RECEPTORS:
        case ObsCommand::OBS_RESET:
            return has_resources ? ObsState::IDLE : ObsState::EMPTY;
        case ObsCommand::CONFIGURE_SCAN:
        case ObsCommand::END_SCAN:
            return ObsState::READY;
        case ObsCommand::SCAN:
            return ObsState::SCANNING;
        case ObsCommand::GO_TO_IDLE:
            return ObsState::IDLE;
        case ObsCommand::ABORT:
            return ObsState::ABORTED;
        case ObsCommand::RESTART:
            return ObsState::EMPTY;
    }
    return ObsState::FAULT;
}

ObsState ObsStateMachine::failure_state(ObsCommand command, bool has_resources)
{
    switch (command)
    {
        case ObsCommand::ADD_RECEPTORS:
        case ObsCommand::REMOVE_RECEPTORS:
        case ObsCommand::REMOVE_ALL_RECEPTORS:
            return has_resources ? ObsState::IDLE : ObsState::EMPTY;
        case ObsCommand::CONFIGURE_SCAN:
            return ObsState::IDLE;
        case ObsCommand::SCAN:
            return ObsState::READY;
        case ObsCommand::ABORT:
            return ObsState::ABORTED;
        default:
            return ObsState::FAULT;
    }
}

ObsState ObsStateMachine::state() const
{
    return _state.load();
}

ObsState ObsStateMachine::begin(ObsCommand command)
{
    ObsState current = _state.load();
    if (!is_allowed(current, command))
    {
        throw RejectedByState(std::string("Command ") + to_string(command)
            + " not permitted in current state " + to_string(current));
    }
    auto intermediate = transitional_state(command);
    if (intermediate)
    {
        transition(*intermediate);
    }
    return current;
}

void ObsStateMachine::complete(ObsCommand command, bool has_resources)
{
    transition(success_state(command, has_resources));
}

void ObsStateMachine::fail(ObsCommand command, bool has_resources)
{
    transition(failure_state(command, has_resources));
}

void ObsStateMachine::fault()
{
    transition(ObsState::FAULT);
}

void ObsStateMachine::transition(ObsState next)
{
    ObsState previous = _state.exchange(next);
    if (previous != next)
    {
        BOOST_LOG_TRIVIAL(info) << "obsState " << previous << " -> " << next;
    }
}

} //namespace subarray
} //namespace cbfmcs_cpp
