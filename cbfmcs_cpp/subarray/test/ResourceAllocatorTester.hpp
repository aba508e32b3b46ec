#ifndef CBFMCS_CPP_SUBARRAY_TEST_RESOURCEALLOCATORTESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_RESOURCEALLOCATORTESTER_HPP

#include "cbfmcs_cpp/subarray/ResourceAllocator.hpp"
#include "cbfmcs_cpp/subarray/test/TestFleet.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ResourceAllocatorTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ResourceAllocatorTester();
    ~ResourceAllocatorTester();

protected:
    SubarrayConfig _config;
    SimulatedFleetGateway _fleet;
    HealthAggregator _health;
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_RESOURCEALLOCATORTESTER_HPP
