#ifndef CBFMCS_CPP_SUBARRAY_SCANCONFIGDISTRIBUTOR_HPP
#define CBFMCS_CPP_SUBARRAY_SCANCONFIGDISTRIBUTOR_HPP

#include "cbfmcs_cpp/subarray/ChannelLinkDistributor.hpp"
#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include "cbfmcs_cpp/subarray/HealthAggregator.hpp"
#include "cbfmcs_cpp/subarray/ModelUpdateScheduler.hpp"
#include "cbfmcs_cpp/subarray/NodeGroup.hpp"
#include "cbfmcs_cpp/subarray/ResourceAllocator.hpp"
#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <mutex>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Pushes a validated scan configuration to the fleet and
 *             drives the configured nodes through scans.
 *
 * @detail     Owns the node group assignments of the subarray: the
 *             FSP group and one group of FSP subarray nodes per function
 *             mode. A node is always placed in its group before any
 *             command is sent to it.
 *
 *             All methods except output_links_distribution() and
 *             on_destination_addresses() must be serialised by the
 *             caller.
 */
class ScanConfigDistributor
{
public:
    ScanConfigDistributor(SubarrayConfig const& config,
        FleetGateway& fleet,
        ResourceAllocator& allocator,
        HealthAggregator& health,
        ModelUpdateScheduler& scheduler);
    ~ScanConfigDistributor();
    ScanConfigDistributor(ScanConfigDistributor const&) = delete;

    /**
     * @brief      Configure the fleet for a scan.
     *
     * @detail     Throws RemoteCallFailed if any node fails. The partial
     *             configuration is left for deconfigure() to remove.
     */
    void distribute(ScanConfiguration const& config);

    /**
     * @brief      Return every configured node to idle and clear all
     *             node group assignments.
     *
     * @detail     Idempotent. Fleet failures are logged and skipped.
     *             Nothing is sent to the fleet if nothing is configured.
     */
    void deconfigure();

    bool configured() const;

    /**
     * @brief      Whether any function mode node group has members.
     */
    bool has_assignments() const;

    void scan(int scan_id);
    void end_scan();

    /**
     * @brief      Abort every configured node. Failures are logged.
     */
    void abort();

    /**
     * @brief      Reset every configured node. Failures are logged.
     */
    void obs_reset();

    /**
     * @brief      Send a due model entry to its destination groups.
     *
     * @detail     Delay models and Jones matrices go to the VCC and FSP
     *             groups, beam weights to the FSP group only. A
     *             destination type of "vcc" or "fsp" restricts delivery
     *             to that group. Failures are logged.
     */
    void fan_out(ModelEntry const& entry);

    NodeGroup const& fsp_group() const;

    NodeGroup const& mode_group(FunctionMode mode) const;

    /**
     * @brief      JSON layout of correlator output channels on output
     *             links, empty when not configured.
     */
    std::string output_links_distribution() const;

    /**
     * @brief      Forward a visibility destination address document to
     *             the correlator FSP subarray nodes.
     *
     * @detail     Documents are accepted once output links are published
     *             and until the next scan, abort or deconfigure. A
     *             document arriving while the configuration is still
     *             being distributed is held and forwarded when the links
     *             are published. The document's configId must name the
     *             distributed configuration and every receiveAddresses
     *             entry must name an FSP configured for correlation.
     *             A document identical to the last forwarded one is
     *             dropped. May be called from any thread.
     *
     * @return     true if the document was forwarded.
     */
    bool on_destination_addresses(std::string const& document);

private:
    typedef boost::property_tree::ptree ptree;

    NodeGroup& group(FunctionMode mode);
    std::vector<NodeGroup*> mode_groups();
    void configure_bands(ScanConfiguration const& config);
    std::string vcc_payload(ScanConfiguration const& config) const;
    void subscribe_telemetry(ScanConfiguration const& config);
    ptree fsp_payload(FspConfiguration const& fsp, ScanConfiguration const& config) const;
    std::string configure_fsp(FspConfiguration const& fsp);
    void publish_output_links(ScanConfiguration const& config);
    bool forward_destination_addresses(std::string const& document);
    void accept_destination_addresses(bool accept);
    std::size_t issue_each(NodeGroup const& group, std::string const& command, std::string const& payload);

private:
    SubarrayConfig const& _config;
    FleetGateway& _fleet;
    ResourceAllocator& _allocator;
    HealthAggregator& _health;
    ModelUpdateScheduler& _scheduler;
    ChannelLinkDistributor _link_distributor;
    NodeGroup _fsp_group;
    NodeGroup _corr_group;
    NodeGroup _pss_group;
    NodeGroup _pst_group;
    NodeGroup _vlbi_group;
    std::vector<SubscriptionId> _telemetry_subscriptions;
    std::vector<SubscriptionId> _fsp_subscriptions;
    bool _configured;
    mutable std::mutex _output_links_mutex;
    std::string _output_links;
    std::mutex _destination_mutex;
    std::string _destination_config_id;
    bool _awaiting_links;
    bool _links_published;
    bool _accept_destinations;
    std::string _held_destinations;
    std::string _last_destinations;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SCANCONFIGDISTRIBUTOR_HPP
