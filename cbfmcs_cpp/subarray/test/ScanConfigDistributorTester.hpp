#ifndef CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGDISTRIBUTORTESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGDISTRIBUTORTESTER_HPP

#include "cbfmcs_cpp/subarray/ScanConfigDistributor.hpp"
#include "cbfmcs_cpp/subarray/test/TestFleet.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ScanConfigDistributorTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ScanConfigDistributorTester();
    ~ScanConfigDistributorTester();

protected:
    SubarrayConfig _config;
    SimulatedFleetGateway _fleet;
    HealthAggregator _health;
    RecordingSink _sink;
    std::unique_ptr<ResourceAllocator> _allocator;
    std::unique_ptr<ModelUpdateScheduler> _scheduler;
    std::unique_ptr<ScanConfigDistributor> _distributor;
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGDISTRIBUTORTESTER_HPP
