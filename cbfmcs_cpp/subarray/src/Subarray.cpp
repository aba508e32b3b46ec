#include "cbfmcs_cpp/subarray/Subarray.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include <boost/algorithm/string/join.hpp>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    CommandResult succeeded(ObsCommand command)
    {
        return CommandResult{ResultCode::OK, to_string(command) + " completed OK"};
    }

    CommandResult failed(ObsCommand command, std::string const& reason)
    {
        return CommandResult{ResultCode::FAILED, to_string(command) + " failed: " + reason};
    }

} //namespace detail

Subarray::Subarray(SubarrayConfig const& config, FleetGateway& fleet)
    : _config(config)
    , _allocator(config, fleet, _health)
    , _validator(config, fleet, _allocator)
    , _scheduler(*this)
    , _distributor(config, fleet, _allocator, _health, _scheduler)
    , _scan_id(0)
{
    BOOST_LOG_TRIVIAL(info) << "Subarray " << _config.subarray_id() << " created in state " << _state.state();
    _scheduler.start();
}

Subarray::~Subarray()
{
    // Dispatcher threads may be waiting on the command lock
    _scheduler.stop();
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _distributor.deconfigure();
        _allocator.release_all();
    }
    catch (std::exception& e)
    {
        BOOST_LOG_TRIVIAL(error) << "Error while releasing subarray " << _config.subarray_id()
                                 << ": " << e.what();
    }
}

CommandResult Subarray::rejected(ObsCommand command, RejectedByState const& error) const
{
    BOOST_LOG_TRIVIAL(warning) << "Rejected " << to_string(command) << ": " << error.what();
    return CommandResult{ResultCode::REJECTED, error.what()};
}

CommandResult Subarray::fault(ObsCommand command, std::string const& reason)
{
    BOOST_LOG_TRIVIAL(error) << to_string(command) << " failed with an unexpected error, "
                             << "subarray " << _config.subarray_id() << " entering FAULT: " << reason;
    _state.fault();
    return detail::failed(command, reason);
}

CommandResult Subarray::resourcing_result(ObsCommand command, AllocationResult const& result)
{
    bool const has_resources = !_allocator.empty();
    if (result.ok())
    {
        _state.complete(command, has_resources);
        return detail::succeeded(command);
    }
    _state.fail(command, has_resources);
    return detail::failed(command, boost::algorithm::join(result.errors, "; "));
}

void Subarray::clear_configuration()
{
    std::lock_guard<std::mutex> lock(_attribute_mutex);
    _scan_id = 0;
    _config_id.clear();
    _frequency_band.clear();
}

void Subarray::check_idle_invariants() const
{
    if (_distributor.has_assignments())
    {
        throw InternalInconsistency("Function mode node groups not empty on return to IDLE");
    }
}

CommandResult Subarray::add_receptors(std::vector<int> const& receptor_ids)
{
    ObsCommand const command = ObsCommand::ADD_RECEPTORS;
    std::lock_guard<std::mutex> lock(_command_mutex);
    if (receptor_ids.empty())
    {
        return detail::failed(command, "no receptor ids given");
    }
    try
    {
        _state.begin(command);
        return resourcing_result(command, _allocator.allocate(receptor_ids));
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::remove_receptors(std::vector<int> const& receptor_ids)
{
    ObsCommand const command = ObsCommand::REMOVE_RECEPTORS;
    std::lock_guard<std::mutex> lock(_command_mutex);
    if (receptor_ids.empty())
    {
        return detail::failed(command, "no receptor ids given");
    }
    try
    {
        _state.begin(command);
        return resourcing_result(command, _allocator.release(receptor_ids));
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::remove_all_receptors()
{
    ObsCommand const command = ObsCommand::REMOVE_ALL_RECEPTORS;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
        return resourcing_result(command, _allocator.release_all());
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::configure_scan(std::string const& configuration)
{
    ObsCommand const command = ObsCommand::CONFIGURE_SCAN;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    try
    {
        // A new configuration supersedes the previous one wholesale
        _distributor.deconfigure();
        clear_configuration();
        ScanConfiguration const config = _validator.validate(configuration);
        _distributor.distribute(config);
        {
            std::lock_guard<std::mutex> attribute_lock(_attribute_mutex);
            _config_id = config.config_id;
            _frequency_band = to_string(config.frequency_band);
        }
        _state.complete(command, !_allocator.empty());
        BOOST_LOG_TRIVIAL(info) << "Scan configuration " << config.config_id << " applied";
        return detail::succeeded(command);
    }
    catch (ValidationFailed& e)
    {
        BOOST_LOG_TRIVIAL(error) << e.what();
        _distributor.deconfigure();
        clear_configuration();
        _state.fail(command, !_allocator.empty());
        return detail::failed(command, e.what());
    }
    catch (RemoteCallFailed& e)
    {
        BOOST_LOG_TRIVIAL(error) << "Failed to configure fleet: " << e.what();
        _distributor.deconfigure();
        clear_configuration();
        _state.fail(command, !_allocator.empty());
        return detail::failed(command, e.what());
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::scan(int scan_id)
{
    ObsCommand const command = ObsCommand::SCAN;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    if (scan_id <= 0)
    {
        _state.fail(command, !_allocator.empty());
        return detail::failed(command, std::string("invalid scan id ") + std::to_string(scan_id));
    }
    try
    {
        _distributor.scan(scan_id);
        {
            std::lock_guard<std::mutex> attribute_lock(_attribute_mutex);
            _scan_id = scan_id;
        }
        _state.complete(command, !_allocator.empty());
        return detail::succeeded(command);
    }
    catch (RemoteCallFailed& e)
    {
        BOOST_LOG_TRIVIAL(error) << "Failed to start scan " << scan_id << ": " << e.what();
        _state.fail(command, !_allocator.empty());
        return detail::failed(command, e.what());
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::end_scan()
{
    ObsCommand const command = ObsCommand::END_SCAN;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
        _distributor.end_scan();
        {
            std::lock_guard<std::mutex> attribute_lock(_attribute_mutex);
            _scan_id = 0;
        }
        _state.complete(command, !_allocator.empty());
        return detail::succeeded(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::go_to_idle()
{
    ObsCommand const command = ObsCommand::GO_TO_IDLE;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
        _distributor.deconfigure();
        clear_configuration();
        check_idle_invariants();
        _state.complete(command, !_allocator.empty());
        return detail::succeeded(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::abort()
{
    ObsCommand const command = ObsCommand::ABORT;
    std::lock_guard<std::mutex> lock(_command_mutex);
    ObsState previous = ObsState::EMPTY;
    try
    {
        previous = _state.begin(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    if (previous == ObsState::SCANNING)
    {
        try
        {
            _distributor.end_scan();
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(error) << "Failed to end active scan during abort: " << e.what();
        }
    }
    _distributor.abort();
    {
        std::lock_guard<std::mutex> attribute_lock(_attribute_mutex);
        _scan_id = 0;
    }
    _state.complete(command, !_allocator.empty());
    return detail::succeeded(command);
}

CommandResult Subarray::obs_reset()
{
    ObsCommand const command = ObsCommand::OBS_RESET;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
        _distributor.obs_reset();
        _distributor.deconfigure();
        clear_configuration();
        bool const has_resources = !_allocator.empty();
        if (has_resources)
        {
            check_idle_invariants();
        }
        _state.complete(command, has_resources);
        return detail::succeeded(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

CommandResult Subarray::restart()
{
    ObsCommand const command = ObsCommand::RESTART;
    std::lock_guard<std::mutex> lock(_command_mutex);
    try
    {
        _state.begin(command);
        _distributor.deconfigure();
        clear_configuration();
        AllocationResult const result = _allocator.release_all();
        if (!result.ok() || !_allocator.empty())
        {
            throw InternalInconsistency(std::string("Receptors could not be released: ")
                + boost::algorithm::join(result.errors, "; "));
        }
        _state.complete(command, false);
        return detail::succeeded(command);
    }
    catch (RejectedByState& e)
    {
        return rejected(command, e);
    }
    catch (std::exception& e)
    {
        return fault(command, e.what());
    }
}

ObsState Subarray::obs_state() const
{
    return _state.state();
}

int Subarray::subarray_id() const
{
    return _config.subarray_id();
}

int Subarray::scan_id() const
{
    std::lock_guard<std::mutex> lock(_attribute_mutex);
    return _scan_id;
}

std::string Subarray::config_id() const
{
    std::lock_guard<std::mutex> lock(_attribute_mutex);
    return _config_id;
}

std::string Subarray::frequency_band() const
{
    std::lock_guard<std::mutex> lock(_attribute_mutex);
    return _frequency_band;
}

std::vector<int> Subarray::receptors() const
{
    return _allocator.receptors();
}

std::vector<NodeStatus> Subarray::vcc_status() const
{
    return _health.view(NodeClass::VCC);
}

std::vector<NodeStatus> Subarray::fsp_status() const
{
    return _health.view(NodeClass::FSP);
}

std::string Subarray::output_links_distribution() const
{
    return _distributor.output_links_distribution();
}

ModelUpdateScheduler& Subarray::scheduler()
{
    return _scheduler;
}

void Subarray::apply_model_update(ModelEntry const& entry)
{
    std::lock_guard<std::mutex> lock(_command_mutex);
    ObsState const state = _state.state();
    if (state != ObsState::READY && state != ObsState::SCANNING)
    {
        BOOST_LOG_TRIVIAL(warning) << "Dropping " << to_string(entry.type) << " update for epoch "
                                   << entry.epoch << ": obsState is " << state;
        return;
    }
    _distributor.fan_out(entry);
}

} //namespace subarray
} //namespace cbfmcs_cpp
