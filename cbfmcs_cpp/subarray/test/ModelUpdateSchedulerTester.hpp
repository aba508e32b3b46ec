#ifndef CBFMCS_CPP_SUBARRAY_TEST_MODELUPDATESCHEDULERTESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_MODELUPDATESCHEDULERTESTER_HPP

#include "cbfmcs_cpp/subarray/ModelUpdateScheduler.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ModelUpdateSchedulerTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ModelUpdateSchedulerTester();
    ~ModelUpdateSchedulerTester();
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_MODELUPDATESCHEDULERTESTER_HPP
