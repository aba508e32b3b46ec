#include "cbfmcs_cpp/subarray/test/ObsStateMachineTester.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

ObsStateMachineTester::ObsStateMachineTester()
    : ::testing::Test()
{
}

ObsStateMachineTester::~ObsStateMachineTester()
{
}

void ObsStateMachineTester::SetUp()
{
}

void ObsStateMachineTester::TearDown()
{
}

TEST_F(ObsStateMachineTester, initial_state_is_empty)
{
    ObsStateMachine machine;
    ASSERT_EQ(machine.state(), ObsState::EMPTY);
}

TEST_F(ObsStateMachineTester, guard_table)
{
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::EMPTY, ObsCommand::ADD_RECEPTORS));
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::IDLE, ObsCommand::ADD_RECEPTORS));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::READY, ObsCommand::ADD_RECEPTORS));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::EMPTY, ObsCommand::REMOVE_RECEPTORS));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::EMPTY, ObsCommand::CONFIGURE_SCAN));
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::READY, ObsCommand::CONFIGURE_SCAN));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::IDLE, ObsCommand::SCAN));
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::SCANNING, ObsCommand::END_SCAN));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::EMPTY, ObsCommand::ABORT));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::FAULT, ObsCommand::ABORT));
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::CONFIGURING, ObsCommand::ABORT));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::FAULT, ObsCommand::OBS_RESET));
    EXPECT_TRUE(ObsStateMachine::is_allowed(ObsState::FAULT, ObsCommand::RESTART));
    EXPECT_FALSE(ObsStateMachine::is_allowed(ObsState::READY, ObsCommand::RESTART));
}

TEST_F(ObsStateMachineTester, targets_depend_on_remaining_resources)
{
    EXPECT_EQ(ObsStateMachine::success_state(ObsCommand::ADD_RECEPTORS, true), ObsState::IDLE);
    EXPECT_EQ(ObsStateMachine::success_state(ObsCommand::REMOVE_RECEPTORS, false), ObsState::EMPTY);
    EXPECT_EQ(ObsStateMachine::success_state(ObsCommand::OBS_RESET, true), ObsState::IDLE);
    EXPECT_EQ(ObsStateMachine::success_state(ObsCommand::RESTART, true), ObsState::EMPTY);
    EXPECT_EQ(ObsStateMachine::failure_state(ObsCommand::CONFIGURE_SCAN, true), ObsState::IDLE);
    EXPECT_EQ(ObsStateMachine::failure_state(ObsCommand::SCAN, true), ObsState::READY);
    EXPECT_EQ(ObsStateMachine::failure_state(ObsCommand::GO_TO_IDLE, true), ObsState::FAULT);
    EXPECT_FALSE(ObsStateMachine::transitional_state(ObsCommand::SCAN));
    EXPECT_EQ(*ObsStateMachine::transitional_state(ObsCommand::CONFIGURE_SCAN), ObsState::CONFIGURING);
}

TEST_F(ObsStateMachineTester, begin_enters_transitional_state)
{
    ObsStateMachine machine;
    ObsState previous = machine.begin(ObsCommand::ADD_RECEPTORS);
    EXPECT_EQ(previous, ObsState::EMPTY);
    EXPECT_EQ(machine.state(), ObsState::RESOURCING);
    machine.complete(ObsCommand::ADD_RECEPTORS, true);
    EXPECT_EQ(machine.state(), ObsState::IDLE);
    machine.begin(ObsCommand::CONFIGURE_SCAN);
    EXPECT_EQ(machine.state(), ObsState::CONFIGURING);
    machine.fail(ObsCommand::CONFIGURE_SCAN, true);
    EXPECT_EQ(machine.state(), ObsState::IDLE);
}

TEST_F(ObsStateMachineTester, rejected_command_leaves_state_unchanged)
{
    ObsStateMachine machine;
    try
    {
        machine.begin(ObsCommand::SCAN);
        FAIL() << "Scan accepted in EMPTY";
    }
    catch (RejectedByState& e)
    {
        EXPECT_NE(std::string(e.what()).find("not permitted in current state EMPTY"), std::string::npos);
    }
    EXPECT_EQ(machine.state(), ObsState::EMPTY);
}

TEST_F(ObsStateMachineTester, fault_is_left_by_restart_only)
{
    ObsStateMachine machine;
    machine.fault();
    EXPECT_THROW(machine.begin(ObsCommand::ADD_RECEPTORS), RejectedByState);
    EXPECT_THROW(machine.begin(ObsCommand::OBS_RESET), RejectedByState);
    machine.begin(ObsCommand::RESTART);
    EXPECT_EQ(machine.state(), ObsState::RESTARTING);
    machine.complete(ObsCommand::RESTART, false);
    EXPECT_EQ(machine.state(), ObsState::EMPTY);
}

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp
