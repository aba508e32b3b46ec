#ifndef CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGVALIDATORTESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGVALIDATORTESTER_HPP

#include "cbfmcs_cpp/subarray/ScanConfigValidator.hpp"
#include "cbfmcs_cpp/subarray/test/TestFleet.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ScanConfigValidatorTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ScanConfigValidatorTester();
    ~ScanConfigValidatorTester();

protected:
    SubarrayConfig _config;
    SimulatedFleetGateway _fleet;
    HealthAggregator _health;
    std::unique_ptr<ResourceAllocator> _allocator;
    std::unique_ptr<ScanConfigValidator> _validator;
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_SCANCONFIGVALIDATORTESTER_HPP
