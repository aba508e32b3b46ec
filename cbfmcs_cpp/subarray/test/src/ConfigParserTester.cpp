#include "cbfmcs_cpp/subarray/test/ConfigParserTester.hpp"
#include <sstream>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

std::string const minimal_xml =
    "<config>"
    "  <subarray><id>2</id><count_vcc>8</count_vcc><count_fsp>3</count_fsp></subarray>"
    "  <receptors>"
    "    <receptor id=\"1\" vcc=\"4\" k=\"11\"/>"
    "    <receptor id=\"7\" vcc=\"1\"/>"
    "  </receptors>"
    "</config>";

ConfigParserTester::ConfigParserTester()
    : ::testing::Test()
{
}

ConfigParserTester::~ConfigParserTester()
{
}

void ConfigParserTester::SetUp()
{
}

void ConfigParserTester::TearDown()
{
}

TEST_F(ConfigParserTester, parses_subarray_and_receptors)
{
    SubarrayConfig config;
    std::stringstream stream(minimal_xml);
    parse_xml_config(stream, config);
    EXPECT_EQ(config.subarray_id(), 2);
    EXPECT_EQ(config.count_vcc(), 8);
    EXPECT_EQ(config.count_fsp(), 3);
    ASSERT_EQ(config.receptor_map().size(), 2u);
    EXPECT_EQ(config.receptor(1).vcc_id, 4);
    EXPECT_EQ(config.receptor(1).k, 11);
    EXPECT_EQ(config.receptor(7).k, 0);
    EXPECT_FALSE(config.has_receptor(2));
    EXPECT_EQ(config.vcc_name(4), "mid_csp_cbf/vcc/004");
    EXPECT_EQ(config.fsp_name(3), "mid_csp_cbf/fsp/03");
    EXPECT_EQ(config.fsp_subarray_name(FunctionMode::CORR, 3), "mid_csp_cbf/fspCorrSubarray/03_02");
}

TEST_F(ConfigParserTester, naming_and_telemetry_override_defaults)
{
    std::string const xml =
        "<config>"
        "  <subarray><id>1</id><count_vcc>2</count_vcc><count_fsp>2</count_fsp></subarray>"
        "  <naming>"
        "    <vcc>lab/vcc/</vcc>"
        "    <fsp>lab/fsp/</fsp>"
        "    <fsp_subarray mode=\"PSS-BF\">lab/pss/</fsp_subarray>"
        "  </naming>"
        "  <telemetry><node>lab/telstate</node></telemetry>"
        "  <receptors><receptor id=\"1\" vcc=\"2\" k=\"3\"/></receptors>"
        "</config>";
    SubarrayConfig config;
    std::stringstream stream(xml);
    parse_xml_config(stream, config);
    EXPECT_EQ(config.vcc_name(2), "lab/vcc/002");
    EXPECT_EQ(config.fsp_name(1), "lab/fsp/01");
    EXPECT_EQ(config.fsp_subarray_name(FunctionMode::PSS_BF, 1), "lab/pss/01_01");
    EXPECT_EQ(config.fsp_subarray_name(FunctionMode::CORR, 1), "mid_csp_cbf/fspCorrSubarray/01_01");
    EXPECT_EQ(config.telemetry_node(), "lab/telstate");
}

TEST_F(ConfigParserTester, receptor_outside_vcc_range_is_rejected)
{
    std::string const xml =
        "<config>"
        "  <subarray><id>1</id><count_vcc>2</count_vcc><count_fsp>2</count_fsp></subarray>"
        "  <receptors><receptor id=\"1\" vcc=\"3\"/></receptors>"
        "</config>";
    SubarrayConfig config;
    std::stringstream stream(xml);
    EXPECT_THROW(parse_xml_config(stream, config), std::runtime_error);
}

TEST_F(ConfigParserTester, duplicate_vcc_is_rejected)
{
    std::string const xml =
        "<config>"
        "  <subarray><id>1</id><count_vcc>2</count_vcc><count_fsp>2</count_fsp></subarray>"
        "  <receptors><receptor id=\"1\" vcc=\"1\"/><receptor id=\"2\" vcc=\"1\"/></receptors>"
        "</config>";
    SubarrayConfig config;
    std::stringstream stream(xml);
    EXPECT_THROW(parse_xml_config(stream, config), std::runtime_error);
}

TEST_F(ConfigParserTester, missing_mandatory_key_is_rejected)
{
    std::string const xml =
        "<config>"
        "  <subarray><id>1</id><count_fsp>2</count_fsp></subarray>"
        "  <receptors/>"
        "</config>";
    SubarrayConfig config;
    std::stringstream stream(xml);
    EXPECT_THROW(parse_xml_config(stream, config), std::runtime_error);
}

TEST_F(ConfigParserTester, unknown_file_is_rejected)
{
    SubarrayConfig config;
    EXPECT_THROW(parse_xml_config(std::string("/nonexistent/subarray.xml"), config), std::runtime_error);
}

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp
