#ifndef CBFMCS_CPP_SUBARRAY_SUBARRAYCONFIG_HPP
#define CBFMCS_CPP_SUBARRAY_SUBARRAYCONFIG_HPP

#include "cbfmcs_cpp/subarray/FunctionMode.hpp"
#include "cbfmcs_cpp/common.hpp"
#include <map>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Static description of one receptor as supplied
 *             by the array configuration.
 */
struct ReceptorInfo
{
    int receptor_id;
    int vcc_id;
    int k; // frequency offset index
};

/**
 * @brief      Class for wrapping the subarray configuration.
 *
 * @detail     Holds the identity of the subarray, the size of the
 *             fleet it draws from, the naming scheme of fleet nodes,
 *             the telemetry source and the receptor to VCC mapping.
 */
class SubarrayConfig
{
public:
    typedef std::map<int, ReceptorInfo> ReceptorMap;

public:
    SubarrayConfig();
    ~SubarrayConfig();

    /**
     * @brief      Get the subarray identifier (1 based)
     */
    int subarray_id() const;

    /**
     * @brief      Set the subarray identifier (1 based)
     */
    void subarray_id(int id);

    /**
     * @brief      Get the number of VCC nodes in the fleet
     */
    int count_vcc() const;

    /**
     * @brief      Set the number of VCC nodes in the fleet
     */
    void count_vcc(int count);

    /**
     * @brief      Get the number of FSP nodes in the fleet
     */
    int count_fsp() const;

    /**
     * @brief      Set the number of FSP nodes in the fleet
     */
    void count_fsp(int count);

    std::string const& vcc_prefix() const;
    void vcc_prefix(std::string const& prefix);

    std::string const& fsp_prefix() const;
    void fsp_prefix(std::string const& prefix);

    /**
     * @brief      Get the name prefix of the per subarray function
     *             mode nodes hosted by each FSP.
     */
    std::string const& fsp_subarray_prefix(FunctionMode mode) const;

    /**
     * @brief      Set the name prefix of the per subarray function
     *             mode nodes hosted by each FSP.
     */
    void fsp_subarray_prefix(FunctionMode mode, std::string const& prefix);

    /**
     * @brief      Get the name of the node publishing telemetry models
     *             (delayModel, jonesMatrix, beamWeights)
     */
    std::string const& telemetry_node() const;

    /**
     * @brief      Set the name of the node publishing telemetry models
     */
    void telemetry_node(std::string const& node);

    ReceptorMap const& receptor_map() const;

    /**
     * @brief      Add a receptor to the receptor map
     *
     * @note       Throws std::runtime_error on a duplicate receptor
     *             or VCC identifier.
     */
    void add_receptor(ReceptorInfo const& receptor);

    bool has_receptor(int receptor_id) const;

    ReceptorInfo const& receptor(int receptor_id) const;

    std::string vcc_name(int vcc_id) const;
    std::string fsp_name(int fsp_id) const;
    std::string fsp_subarray_name(FunctionMode mode, int fsp_id) const;

private:
    int _subarray_id;
    int _count_vcc;
    int _count_fsp;
    std::string _vcc_prefix;
    std::string _fsp_prefix;
    std::map<FunctionMode, std::string> _fsp_subarray_prefixes;
    std::string _telemetry_node;
    ReceptorMap _receptor_map;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SUBARRAYCONFIG_HPP
