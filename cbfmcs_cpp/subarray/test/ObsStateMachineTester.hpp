#ifndef CBFMCS_CPP_SUBARRAY_TEST_OBSSTATEMACHINETESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_OBSSTATEMACHINETESTER_HPP

#include "cbfmcs_cpp/subarray/ObsStateMachine.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ObsStateMachineTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ObsStateMachineTester();
    ~ObsStateMachineTester();
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_OBSSTATEMACHINETESTER_HPP
