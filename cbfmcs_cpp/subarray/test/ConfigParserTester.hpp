#ifndef CBFMCS_CPP_SUBARRAY_TEST_CONFIGPARSERTESTER_HPP
#define CBFMCS_CPP_SUBARRAY_TEST_CONFIGPARSERTESTER_HPP

#include "cbfmcs_cpp/subarray/ConfigParser.hpp"
#include <gtest/gtest.h>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

class ConfigParserTester: public ::testing::Test
{
protected:
    void SetUp() override;
    void TearDown() override;

public:
    ConfigParserTester();
    ~ConfigParserTester();
};

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_TEST_CONFIGPARSERTESTER_HPP
