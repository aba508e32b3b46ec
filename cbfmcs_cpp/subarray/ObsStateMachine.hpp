#ifndef CBFMCS_CPP_SUBARRAY_OBSSTATEMACHINE_HPP
#define CBFMCS_CPP_SUBARRAY_OBSSTATEMACHINE_HPP

#include "cbfmcs_cpp/subarray/ObsState.hpp"
#include <boost/optional.hpp>
#include <atomic>

namespace cbfmcs_cpp {
namespace subarray {

enum class ObsCommand
{
    ADD_RECEPTORS = 0,
    REMOVE_RECEPTORS,
    REMOVE_ALL_RECEPTORS,
    CONFIGURE_SCAN,
    SCAN,
    END_SCAN,
    GO_TO_IDLE,
    ABORT,
    OBS_RESET,
    RESTART
};

std::string to_string(ObsCommand command);

/**
 * @brief      Observation state of a subarray and the transition
 *             table that governs it.
 *
 * @detail     The static members form the side-effect free table:
 *             which commands a state admits, the transitional state a
 *             command passes through, and where it lands on success or
 *             failure. The instance holds the authoritative state, which
 *             may be read from any thread. Mutation is expected to be
 *             serialised by the owner.
 */
class ObsStateMachine
{
public:
    ObsStateMachine();
    ~ObsStateMachine();
    ObsStateMachine(ObsStateMachine const&) = delete;

    static bool is_allowed(ObsState state, ObsCommand command);

    static boost::optional<ObsState> transitional_state(ObsCommand command);

    /**
     * @brief      Target state of a command that completed.
     *
     * @param      has_resources  Whether receptors remain assigned.
     */
    static ObsState success_state(ObsCommand command, bool has_resources);

    /**
     * @brief      Target state of a command whose action failed.
     */
    static ObsState failure_state(ObsCommand command, bool has_resources);

    ObsState state() const;

    /**
     * @brief      Check the guard for a command and enter its
     *             transitional state.
     *
     * @return     The state held before the command began.
     *
     * @note       Throws RejectedByState without changing state if
     *             the command is not permitted.
     */
    ObsState begin(ObsCommand command);

    void complete(ObsCommand command, bool has_resources);

    void fail(ObsCommand command, bool has_resources);

    void fault();

private:
    void transition(ObsState next);

private:
    std::atomic<ObsState> _state;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_OBSSTATEMACHINE_HPP
