#ifndef CBFMCS_CPP_SUBARRAY_SUBARRAY_HPP
#define CBFMCS_CPP_SUBARRAY_SUBARRAY_HPP

#include "cbfmcs_cpp/subarray/CommandResult.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include "cbfmcs_cpp/subarray/HealthAggregator.hpp"
#include "cbfmcs_cpp/subarray/ModelUpdateScheduler.hpp"
#include "cbfmcs_cpp/subarray/ObsStateMachine.hpp"
#include "cbfmcs_cpp/subarray/ResourceAllocator.hpp"
#include "cbfmcs_cpp/subarray/ScanConfigDistributor.hpp"
#include "cbfmcs_cpp/subarray/ScanConfigValidator.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <mutex>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      The subarray orchestrator.
 *
 * @detail     Owns the observation state of one subarray together with
 *             its receptor allocation, scan configuration and model
 *             update scheduling. Lifecycle commands are serialised by a
 *             command lock and never throw: each returns a result code
 *             and a message. Attribute accessors may be called from any
 *             thread at any time.
 *
 *             Model entries that fall due are fanned out under the same
 *             command lock, so they never interleave with a lifecycle
 *             transition.
 */
class Subarray: public ModelUpdateSink
{
public:
    Subarray(SubarrayConfig const& config, FleetGateway& fleet);
    ~Subarray();
    Subarray(Subarray const&) = delete;

    CommandResult add_receptors(std::vector<int> const& receptor_ids);
    CommandResult remove_receptors(std::vector<int> const& receptor_ids);
    CommandResult remove_all_receptors();
    CommandResult configure_scan(std::string const& configuration);
    CommandResult scan(int scan_id);
    CommandResult end_scan();
    CommandResult go_to_idle();
    CommandResult abort();
    CommandResult obs_reset();
    CommandResult restart();

    ObsState obs_state() const override;
    int subarray_id() const;
    int scan_id() const;
    std::string config_id() const;
    std::string frequency_band() const;
    std::vector<int> receptors() const;
    std::vector<NodeStatus> vcc_status() const;
    std::vector<NodeStatus> fsp_status() const;
    std::string output_links_distribution() const;

    void apply_model_update(ModelEntry const& entry) override;

    ModelUpdateScheduler& scheduler();

private:
    CommandResult rejected(ObsCommand command, RejectedByState const& error) const;
    CommandResult resourcing_result(ObsCommand command, AllocationResult const& result);
    CommandResult fault(ObsCommand command, std::string const& reason);
    void clear_configuration();
    void check_idle_invariants() const;

private:
    SubarrayConfig const& _config;
    std::mutex _command_mutex;
    mutable std::mutex _attribute_mutex;
    ObsStateMachine _state;
    HealthAggregator _health;
    ResourceAllocator _allocator;
    ScanConfigValidator _validator;
    ModelUpdateScheduler _scheduler;
    ScanConfigDistributor _distributor;
    int _scan_id;
    std::string _config_id;
    std::string _frequency_band;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SUBARRAY_HPP
