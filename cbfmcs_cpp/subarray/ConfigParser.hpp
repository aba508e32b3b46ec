#ifndef CBFMCS_CPP_SUBARRAY_CONFIGPARSER_HPP
#define CBFMCS_CPP_SUBARRAY_CONFIGPARSER_HPP

#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <string>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Populate a SubarrayConfig from an XML file.
 *
 * @detail     Expected layout:
 *
 *             <config>
 *               <subarray>
 *                 <id>1</id>
 *                 <count_vcc>4</count_vcc>
 *                 <count_fsp>4</count_fsp>
 *               </subarray>
 *               <naming>
 *                 <vcc>mid_csp_cbf/vcc/</vcc>
 *                 <fsp>mid_csp_cbf/fsp/</fsp>
 *                 <fsp_subarray mode="CORR">mid_csp_cbf/fspCorrSubarray/</fsp_subarray>
 *               </naming>
 *               <telemetry>
 *                 <node>ska_mid/tm_leaf_node/csp_subarray_01</node>
 *               </telemetry>
 *               <receptors>
 *                 <receptor id="1" vcc="1" k="11"/>
 *               </receptors>
 *             </config>
 *
 *             The naming and telemetry sections are optional.
 */
void parse_xml_config(std::string const& config_filename, SubarrayConfig& config);

void parse_xml_config(std::istream& stream, SubarrayConfig& config);

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_CONFIGPARSER_HPP
