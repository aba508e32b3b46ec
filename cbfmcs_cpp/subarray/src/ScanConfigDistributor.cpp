#include "cbfmcs_cpp/subarray/ScanConfigDistributor.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include <set>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    std::string model_command(ModelType type)
    {
        switch (type)
        {
            case ModelType::DELAY_MODEL: return "UpdateDelayModel";
            case ModelType::JONES_MATRIX: return "UpdateJonesMatrix";
            case ModelType::BEAM_WEIGHTS: return "UpdateBeamWeights";
        }
        throw std::runtime_error("Unknown model type");
    }

} //namespace detail

ScanConfigDistributor::ScanConfigDistributor(SubarrayConfig const& config,
    FleetGateway& fleet,
    ResourceAllocator& allocator,
    HealthAggregator& health,
    ModelUpdateScheduler& scheduler)
    : _config(config)
    , _fleet(fleet)
    , _allocator(allocator)
    , _health(health)
    , _scheduler(scheduler)
    , _fsp_group("fsp")
    , _corr_group("fsp_corr_subarray")
    , _pss_group("fsp_pss_subarray")
    , _pst_group("fsp_pst_subarray")
    , _vlbi_group("fsp_vlbi_subarray")
    , _configured(false)
    , _awaiting_links(false)
    , _links_published(false)
    , _accept_destinations(false)
{
}

ScanConfigDistributor::~ScanConfigDistributor()
{
}

NodeGroup const& ScanConfigDistributor::mode_group(FunctionMode mode) const
{
    switch (mode)
    {
        case FunctionMode::CORR: return _corr_group;
        case FunctionMode::PSS_BF: return _pss_group;
        case FunctionMode::PST_BF: return _pst_group;
        case FunctionMode::VLBI: return _vlbi_group;
        default:
            throw InternalInconsistency(std::string("No node group for function mode ") + to_string(mode));
    }
}

NodeGroup& ScanConfigDistributor::group(FunctionMode mode)
{
    return const_cast<NodeGroup&>(static_cast<ScanConfigDistributor const&>(*this).mode_group(mode));
}

NodeGroup const& ScanConfigDistributor::fsp_group() const
{
    return _fsp_group;
}

std::vector<NodeGroup*> ScanConfigDistributor::mode_groups()
{
    return {&_corr_group, &_pss_group, &_pst_group, &_vlbi_group};
}

bool ScanConfigDistributor::configured() const
{
    return _configured;
}

bool ScanConfigDistributor::has_assignments() const
{
    return !_fsp_group.empty() || !_corr_group.empty() || !_pss_group.empty()
        || !_pst_group.empty() || !_vlbi_group.empty();
}

std::string ScanConfigDistributor::output_links_distribution() const
{
    std::lock_guard<std::mutex> lock(_output_links_mutex);
    return _output_links;
}

void ScanConfigDistributor::distribute(ScanConfiguration const& config)
{
    BOOST_LOG_TRIVIAL(info) << "Distributing scan configuration " << config.config_id;
    _configured = true;
    {
        std::lock_guard<std::mutex> lock(_destination_mutex);
        _destination_config_id = config.config_id;
        _awaiting_links = true;
    }

    configure_bands(config);
    _fleet.call_group(_allocator.vcc_group(), "ConfigureScan", vcc_payload(config));
    for (auto const& window: config.search_windows)
    {
        _fleet.call_group(_allocator.vcc_group(), "ConfigureSearchWindow",
            json::serialize(window.document));
    }
    subscribe_telemetry(config);

    // Nodes join their groups here, before the first ConfigureScan is sent.
    std::vector<std::pair<FunctionMode, std::pair<std::string, std::string>>> scans;
    for (auto const& fsp: config.fsp)
    {
        std::string node = configure_fsp(fsp);
        scans.push_back(std::make_pair(fsp.function_mode,
            std::make_pair(node, json::serialize(fsp_payload(fsp, config)))));
    }
    for (auto mode: {FunctionMode::CORR, FunctionMode::PSS_BF, FunctionMode::PST_BF, FunctionMode::VLBI})
    {
        for (auto const& scan: scans)
        {
            if (scan.first != mode)
            {
                continue;
            }
            if (!group(mode).contains(scan.second.first))
            {
                throw InternalInconsistency(std::string("Node ") + scan.second.first
                    + " is not in group " + group(mode).name());
            }
            _fleet.call(scan.second.first, "ConfigureScan", scan.second.second);
        }
    }
    publish_output_links(config);
    BOOST_LOG_TRIVIAL(info) << "Scan configuration " << config.config_id << " distributed to "
                            << _allocator.vcc_group().size() << " VCCs and "
                            << _fsp_group.size() << " FSPs";
}

void ScanConfigDistributor::configure_bands(ScanConfiguration const& config)
{
    auto const& params = band_parameters(config.frequency_band);
    for (int receptor_id: _allocator.receptors())
    {
        auto const& receptor = _allocator.receptor_info(receptor_id);
        ptree payload;
        payload.put("frequency_band", params.name);
        payload.put("dish_sample_rate", dish_sample_rate(config.frequency_band, receptor.k));
        payload.put("samples_per_frame", params.samples_per_frame);
        _fleet.call(_allocator.vcc_name(receptor_id), "ConfigureBand", json::serialize(payload));
    }
}

std::string ScanConfigDistributor::vcc_payload(ScanConfiguration const& config) const
{
    ptree payload;
    payload.put("config_id", config.config_id);
    payload.put("frequency_band", to_string(config.frequency_band));
    if (is_band_5(config.frequency_band))
    {
        payload.put_child("band_5_tuning", json::array(std::vector<double>{
            config.band_5_tuning.first, config.band_5_tuning.second}));
    }
    payload.put("frequency_band_offset_stream1", config.frequency_band_offset_stream1);
    payload.put("frequency_band_offset_stream2", config.frequency_band_offset_stream2);
    ptree fsp_list;
    for (auto const& fsp: config.fsp)
    {
        ptree item;
        item.put("fsp_id", fsp.fsp_id);
        item.put("function_mode", to_string(fsp.function_mode));
        if (fsp.function_mode == FunctionMode::CORR)
        {
            item.put("frequency_slice_id", fsp.frequency_slice_id);
        }
        fsp_list.push_back(std::make_pair("", item));
    }
    payload.add_child("fsp", fsp_list);
    return json::serialize(payload);
}

void ScanConfigDistributor::subscribe_telemetry(ScanConfiguration const& config)
{
    std::vector<std::pair<ModelType, std::string>> points = {
        {ModelType::DELAY_MODEL, config.delay_model_subscription_point},
        {ModelType::JONES_MATRIX, config.jones_matrix_subscription_point},
        {ModelType::BEAM_WEIGHTS, config.beam_weights_subscription_point}
    };
    ModelUpdateScheduler& scheduler = _scheduler;
    for (auto const& point: points)
    {
        if (point.second.empty())
        {
            continue;
        }
        auto reference = split_attribute_reference(point.second);
        ModelType type = point.first;
        auto callback = [&scheduler, type](ChangeEvent const& event)
        {
            if (event.error)
            {
                BOOST_LOG_TRIVIAL(error) << "Error event on " << event.node << "/" << event.attribute
                                         << ": " << event.error_message;
                return;
            }
            if (event.value.empty())
            {
                return;
            }
            scheduler.on_model_document(type, event.value);
        };
        _telemetry_subscriptions.push_back(
            _fleet.subscribe(reference.first, NodeClass::TELEMETRY, reference.second, callback));
        BOOST_LOG_TRIVIAL(info) << "Subscribed to " << to_string(type) << " at " << point.second;
    }

    if (!config.vis_destination_address_subscription_point.empty())
    {
        auto reference = split_attribute_reference(config.vis_destination_address_subscription_point);
        ScanConfigDistributor* distributor = this;
        auto callback = [distributor](ChangeEvent const& event)
        {
            if (event.error)
            {
                BOOST_LOG_TRIVIAL(error) << "Error event on " << event.node << "/" << event.attribute
                                         << ": " << event.error_message;
                return;
            }
            if (event.value.empty())
            {
                return;
            }
            distributor->on_destination_addresses(event.value);
        };
        _telemetry_subscriptions.push_back(
            _fleet.subscribe(reference.first, NodeClass::TELEMETRY, reference.second, callback));
        BOOST_LOG_TRIVIAL(info) << "Subscribed to visibility destination addresses at "
                                << config.vis_destination_address_subscription_point;
    }
}

std::string ScanConfigDistributor::configure_fsp(FspConfiguration const& fsp)
{
    std::string const node = _config.fsp_name(fsp.fsp_id);
    _fsp_group.add(node);
    if (_fleet.read_attribute(node, "functionMode") == to_string(FunctionMode::IDLE))
    {
        _fleet.call(node, "SetFunctionMode", to_string(fsp.function_mode));
    }
    _fleet.call(node, "AddSubarrayMembership", std::to_string(_config.subarray_id()));

    _health.track(NodeClass::FSP, node);
    HealthAggregator& health = _health;
    auto callback = [&health](ChangeEvent const& event)
    {
        health.on_change_event(event);
    };
    _fsp_subscriptions.push_back(_fleet.subscribe(node, NodeClass::FSP, "State", callback));
    _fsp_subscriptions.push_back(_fleet.subscribe(node, NodeClass::FSP, "healthState", callback));

    std::string const subarray_node = _config.fsp_subarray_name(fsp.function_mode, fsp.fsp_id);
    group(fsp.function_mode).add(subarray_node);
    return subarray_node;
}

ScanConfigDistributor::ptree ScanConfigDistributor::fsp_payload(FspConfiguration const& fsp,
    ScanConfiguration const& config) const
{
    ptree payload = fsp.document;
    payload.put("config_id", config.config_id);
    payload.put("subarray_id", _config.subarray_id());
    payload.put("frequency_band", to_string(config.frequency_band));
    if (is_band_5(config.frequency_band))
    {
        payload.put_child("band_5_tuning", json::array(std::vector<double>{
            config.band_5_tuning.first, config.band_5_tuning.second}));
    }
    payload.put("frequency_band_offset_stream1", config.frequency_band_offset_stream1);
    payload.put("frequency_band_offset_stream2", config.frequency_band_offset_stream2);
    payload.put("channel_offset", fsp.function_mode == FunctionMode::CORR ? fsp.channel_offset : 1);

    std::vector<int> subarray_vccs = _allocator.vcc_ids();
    payload.put_child("subarray_vcc_ids", json::array(subarray_vccs));

    std::vector<int> fsp_receptors = fsp.receptors;
    if (fsp_receptors.empty())
    {
        fsp_receptors = _allocator.receptors();
    }
    std::vector<int> fsp_vccs;
    ptree rates;
    for (int receptor_id: fsp_receptors)
    {
        auto const& receptor = _allocator.receptor_info(receptor_id);
        fsp_vccs.push_back(receptor.vcc_id);
        ptree rate;
        rate.put("vcc_id", receptor.vcc_id);
        rate.put("fs_sample_rate", fs_sample_rate(config.frequency_band, receptor.k));
        rates.push_back(std::make_pair("", rate));
    }
    payload.put_child("fsp_vcc_ids", json::array(fsp_vccs));
    payload.put_child("fs_sample_rates", rates);
    return payload;
}

void ScanConfigDistributor::publish_output_links(ScanConfiguration const& config)
{
    std::vector<FspOutputLinks> layout;
    for (auto const& fsp: config.fsp)
    {
        if (fsp.function_mode == FunctionMode::CORR && !fsp.channel_averaging_map.empty())
        {
            layout.push_back(_link_distributor.distribute(fsp, config));
        }
    }
    if (layout.empty())
    {
        std::lock_guard<std::mutex> lock(_destination_mutex);
        _awaiting_links = false;
        if (!_held_destinations.empty())
        {
            BOOST_LOG_TRIVIAL(warning) << "Dropping visibility destination addresses, configuration "
                                       << config.config_id << " has no correlator output links";
            _held_destinations.clear();
        }
        return;
    }
    std::string links = json::serialize(ChannelLinkDistributor::to_ptree(config.config_id, layout));
    _fleet.call_group(_corr_group, "AddChannels", links);
    {
        std::lock_guard<std::mutex> lock(_output_links_mutex);
        _output_links = links;
    }
    BOOST_LOG_TRIVIAL(info) << "Output links assigned for " << layout.size() << " FSPs";

    std::lock_guard<std::mutex> lock(_destination_mutex);
    _awaiting_links = false;
    _links_published = true;
    _accept_destinations = true;
    if (!_held_destinations.empty())
    {
        std::string held;
        held.swap(_held_destinations);
        forward_destination_addresses(held);
    }
}

bool ScanConfigDistributor::on_destination_addresses(std::string const& document)
{
    std::lock_guard<std::mutex> lock(_destination_mutex);
    if (document == _last_destinations)
    {
        BOOST_LOG_TRIVIAL(debug) << "Ignoring repeated visibility destination addresses";
        return false;
    }
    if (_awaiting_links)
    {
        BOOST_LOG_TRIVIAL(debug) << "Holding visibility destination addresses until output links are published";
        _held_destinations = document;
        return false;
    }
    if (!_accept_destinations)
    {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring visibility destination addresses for subarray "
                                   << _config.subarray_id() << ", no published output links to address";
        return false;
    }
    return forward_destination_addresses(document);
}

bool ScanConfigDistributor::forward_destination_addresses(std::string const& document)
{
    try
    {
        ptree tree = json::parse(document);
        std::string const config_id = tree.get<std::string>("configId");
        if (config_id != _destination_config_id)
        {
            BOOST_LOG_TRIVIAL(warning) << "Ignoring visibility destination addresses for configuration "
                                       << config_id << ", configured is " << _destination_config_id;
            return false;
        }
        for (auto const& item: tree.get_child("receiveAddresses"))
        {
            int const fsp_id = item.second.get<int>("fspId");
            if (!_corr_group.contains(_config.fsp_subarray_name(FunctionMode::CORR, fsp_id)))
            {
                BOOST_LOG_TRIVIAL(error) << "Ignoring visibility destination addresses, FSP " << fsp_id
                                         << " is not configured for correlation in subarray "
                                         << _config.subarray_id();
                return false;
            }
        }
    }
    catch (boost::property_tree::ptree_error& e)
    {
        BOOST_LOG_TRIVIAL(error) << "Malformed visibility destination addresses: " << e.what();
        return false;
    }
    _last_destinations = document;
    std::size_t failures = issue_each(_corr_group, "AddChannelAddresses", document);
    BOOST_LOG_TRIVIAL(info) << "Visibility destination addresses sent to " << _corr_group.size()
                            << " correlator FSPs" << (failures ? " with failures" : "");
    return true;
}

void ScanConfigDistributor::accept_destination_addresses(bool accept)
{
    std::lock_guard<std::mutex> lock(_destination_mutex);
    _accept_destinations = accept && _links_published;
}

std::size_t ScanConfigDistributor::issue_each(NodeGroup const& group,
    std::string const& command,
    std::string const& payload)
{
    std::size_t failures = 0;
    for (auto const& node: group.members())
    {
        try
        {
            _fleet.call(node, command, payload);
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(error) << command << " failed on " << node << ": " << e.what();
            ++failures;
        }
    }
    return failures;
}

void ScanConfigDistributor::deconfigure()
{
    {
        std::lock_guard<std::mutex> lock(_destination_mutex);
        _awaiting_links = false;
        _links_published = false;
        _accept_destinations = false;
        _held_destinations.clear();
        _last_destinations.clear();
        _destination_config_id.clear();
    }

    for (auto id: _telemetry_subscriptions)
    {
        try
        {
            _fleet.unsubscribe(id);
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "Failed to unsubscribe from telemetry: " << e.what();
        }
    }
    _telemetry_subscriptions.clear();

    if (_configured)
    {
        BOOST_LOG_TRIVIAL(info) << "Deconfiguring subarray " << _config.subarray_id();
        issue_each(_fsp_group, "RemoveSubarrayMembership", std::to_string(_config.subarray_id()));
        for (auto* mode_group: mode_groups())
        {
            issue_each(*mode_group, "GoToIdle", "");
        }
        issue_each(_allocator.vcc_group(), "GoToIdle", "");
    }

    for (auto id: _fsp_subscriptions)
    {
        try
        {
            _fleet.unsubscribe(id);
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "Failed to unsubscribe from FSP events: " << e.what();
        }
    }
    _fsp_subscriptions.clear();
    _health.untrack_all(NodeClass::FSP);

    _fsp_group.remove_all();
    for (auto* mode_group: mode_groups())
    {
        mode_group->remove_all();
    }
    _scheduler.reset_history();
    {
        std::lock_guard<std::mutex> lock(_output_links_mutex);
        _output_links.clear();
    }
    _configured = false;
}

void ScanConfigDistributor::scan(int scan_id)
{
    std::string const payload = std::to_string(scan_id);
    _fleet.call_group(_allocator.vcc_group(), "Scan", payload);
    for (auto* mode_group: mode_groups())
    {
        _fleet.call_group(*mode_group, "Scan", payload);
    }
    accept_destination_addresses(false);
}

void ScanConfigDistributor::end_scan()
{
    _fleet.call_group(_allocator.vcc_group(), "EndScan", "");
    for (auto* mode_group: mode_groups())
    {
        _fleet.call_group(*mode_group, "EndScan", "");
    }
    accept_destination_addresses(true);
}

void ScanConfigDistributor::abort()
{
    accept_destination_addresses(false);
    issue_each(_allocator.vcc_group(), "Abort", "");
    for (auto* mode_group: mode_groups())
    {
        issue_each(*mode_group, "Abort", "");
    }
}

void ScanConfigDistributor::obs_reset()
{
    issue_each(_allocator.vcc_group(), "ObsReset", "");
    for (auto* mode_group: mode_groups())
    {
        issue_each(*mode_group, "ObsReset", "");
    }
}

void ScanConfigDistributor::fan_out(ModelEntry const& entry)
{
    std::string const command = detail::model_command(entry.type);
    bool to_vcc = entry.type != ModelType::BEAM_WEIGHTS
        && (entry.destination_type.empty() || entry.destination_type == "vcc");
    bool to_fsp = entry.destination_type.empty() || entry.destination_type == "fsp";
    if (!to_vcc && !to_fsp)
    {
        BOOST_LOG_TRIVIAL(warning) << "No destination for " << to_string(entry.type)
                                   << " with destinationType '" << entry.destination_type << "'";
        return;
    }
    std::size_t failures = 0;
    if (to_vcc)
    {
        failures += issue_each(_allocator.vcc_group(), command, entry.payload);
    }
    if (to_fsp)
    {
        failures += issue_each(_fsp_group, command, entry.payload);
    }
    BOOST_LOG_TRIVIAL(info) << "Applied " << to_string(entry.type) << " for epoch "
                            << std::setprecision(15) << entry.epoch
                            << (failures ? " with failures" : "");
}

} //namespace subarray
} //namespace cbfmcs_cpp
