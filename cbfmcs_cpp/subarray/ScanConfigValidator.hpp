#ifndef CBFMCS_CPP_SUBARRAY_SCANCONFIGVALIDATOR_HPP
#define CBFMCS_CPP_SUBARRAY_SCANCONFIGVALIDATOR_HPP

#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include "cbfmcs_cpp/subarray/ResourceAllocator.hpp"
#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <set>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Parses and validates scan configuration documents.
 *
 * @detail     Checks run in a fixed order and stop at the first
 *             failure, which is reported by throwing ValidationFailed
 *             with a single reason. Fleet state (VCC and FSP State,
 *             FSP function mode and membership, subscription point
 *             liveness) is read through the gateway; failures to reach
 *             the fleet propagate as RemoteCallFailed.
 *
 *             The returned configuration is normalised: defaults are
 *             written into its document, so validating the serialised
 *             result again yields an identical document.
 */
class ScanConfigValidator
{
public:
    ScanConfigValidator(SubarrayConfig const& config,
        FleetGateway& fleet,
        ResourceAllocator const& allocator);
    ~ScanConfigValidator();
    ScanConfigValidator(ScanConfigValidator const&) = delete;

    ScanConfiguration validate(std::string const& document) const;

    /**
     * @brief      Check for a well formed dotted quad IPv4 address.
     */
    static bool is_ipv4(std::string const& address);

private:
    typedef boost::property_tree::ptree ptree;

    void check_header(ptree& common, ScanConfiguration& config) const;
    void check_vccs_on() const;
    void check_band(ptree& common, ScanConfiguration& config) const;
    void check_offsets(ptree& cbf, ScanConfiguration& config) const;
    void check_subscription_points(ptree& cbf, ScanConfiguration& config) const;
    void check_search_windows(ptree& cbf, ScanConfiguration& config) const;
    void check_search_window_tuning(double tuning, ScanConfiguration const& config) const;
    FspConfiguration check_fsp(ptree& entry, ScanConfiguration const& config, std::set<int>& seen) const;
    void check_corr(ptree& entry, ScanConfiguration const& config, FspConfiguration& fsp) const;
    void check_pss(ptree& entry) const;
    void check_pst(ptree& entry) const;
    std::vector<int> check_receptors(ptree const& node, std::string const& key) const;

private:
    SubarrayConfig const& _config;
    FleetGateway& _fleet;
    ResourceAllocator const& _allocator;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SCANCONFIGVALIDATOR_HPP
