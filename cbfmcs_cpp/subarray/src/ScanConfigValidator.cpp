#include "cbfmcs_cpp/subarray/ScanConfigValidator.hpp"
#include "cbfmcs_cpp/subarray/constants.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cmath>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    typedef boost::property_tree::ptree ptree;

    void reject(std::string const& reason)
    {
        BOOST_LOG_TRIVIAL(error) << reason;
        throw ValidationFailed(reason + " Aborting configuration.");
    }

    template <typename T>
    T get_required(ptree const& node, std::string const& key, std::string const& owner)
    {
        auto child = node.get_child_optional(key);
        if (!child)
        {
            reject(owner + " specified, but '" + key + "' not given.");
        }
        auto value = child->get_value_optional<T>();
        if (!value || !child->empty())
        {
            reject(std::string("'") + key + "' is malformed (received '"
                + child->get_value<std::string>() + "').");
        }
        return *value;
    }

    bool get_int_pair(ptree const& item, int& first, int& second)
    {
        if (item.size() != 2)
        {
            return false;
        }
        auto it = item.begin();
        auto a = it->second.get_value_optional<int>();
        ++it;
        auto b = it->second.get_value_optional<int>();
        if (!a || !b)
        {
            return false;
        }
        first = *a;
        second = *b;
        return true;
    }

    std::vector<std::string> membership(std::string const& value)
    {
        std::vector<std::string> ids;
        if (!value.empty())
        {
            boost::split(ids, value, boost::is_any_of(","));
        }
        return ids;
    }

} //namespace detail

ScanConfigValidator::ScanConfigValidator(SubarrayConfig const& config,
    FleetGateway& fleet,
    ResourceAllocator const& allocator)
    : _config(config)
    , _fleet(fleet)
    , _allocator(allocator)
{
}

ScanConfigValidator::~ScanConfigValidator()
{
}

bool ScanConfigValidator::is_ipv4(std::string const& address)
{
    std::vector<std::string> parts;
    boost::split(parts, address, boost::is_any_of("."));
    if (parts.size() != 4)
    {
        return false;
    }
    for (auto const& part: parts)
    {
        if (part.empty() || part.size() > 3)
        {
            return false;
        }
        if (!std::all_of(part.begin(), part.end(), [](char c){ return c >= '0' && c <= '9'; }))
        {
            return false;
        }
        if (std::stoi(part) > 255)
        {
            return false;
        }
    }
    return true;
}

ScanConfiguration ScanConfigValidator::validate(std::string const& document) const
{
    ptree doc;
    try
    {
        doc = json::parse(document);
    }
    catch (boost::property_tree::json_parser_error& e)
    {
        detail::reject(std::string("Scan configuration object is not a valid JSON object: ") + e.what() + ".");
    }

    auto common = doc.get_child_optional("common");
    if (!common)
    {
        detail::reject("Scan configuration has no 'common' section.");
    }
    auto cbf = doc.get_child_optional("cbf");
    if (!cbf)
    {
        detail::reject("Scan configuration has no 'cbf' section.");
    }
    auto fsp_list = cbf->get_child_optional("fsp");
    if (!fsp_list)
    {
        detail::reject("Scan configuration has no 'fsp' list.");
    }

    ScanConfiguration config;
    config.band_5_tuning = std::make_pair(0.0, 0.0);
    config.frequency_band_offset_stream1 = 0.0;
    config.frequency_band_offset_stream2 = 0.0;

    check_header(*common, config);
    check_vccs_on();
    check_band(*common, config);
    check_offsets(*cbf, config);
    check_subscription_points(*cbf, config);
    check_search_windows(*cbf, config);

    std::set<int> seen;
    for (auto& item: *fsp_list)
    {
        config.fsp.push_back(check_fsp(item.second, config, seen));
    }

    config.document = doc;
    BOOST_LOG_TRIVIAL(info) << "Scan configuration " << config.config_id << " is valid";
    return config;
}

void ScanConfigValidator::check_header(ptree& common, ScanConfiguration& config) const
{
    config.config_id = detail::get_required<std::string>(common, "config_id", "Scan configuration");
    if (config.config_id.empty())
    {
        detail::reject("'config_id' must not be empty.");
    }
    auto subarray_id = common.get_child_optional("subarray_id");
    if (subarray_id)
    {
        auto id = subarray_id->get_value_optional<int>();
        if (!id || *id != _config.subarray_id())
        {
            detail::reject(std::string("'subarray_id' ") + subarray_id->get_value<std::string>()
                + " does not match subarray " + std::to_string(_config.subarray_id()) + ".");
        }
    }
}

void ScanConfigValidator::check_vccs_on() const
{
    for (int receptor_id: _allocator.receptors())
    {
        if (_fleet.read_attribute(_allocator.vcc_name(receptor_id), "State") != "ON")
        {
            detail::reject(std::string("VCC ") + std::to_string(_allocator.receptor_info(receptor_id).vcc_id)
                + " is not ON.");
        }
    }
}

void ScanConfigValidator::check_band(ptree& common, ScanConfiguration& config) const
{
    std::string name = detail::get_required<std::string>(common, "frequency_band", "Scan configuration");
    auto band = parse_frequency_band(name);
    if (!band)
    {
        detail::reject(std::string("'frequency_band' must be one of [1, 2, 3, 4, 5a, 5b] (received ")
            + name + ").");
    }
    config.frequency_band = *band;
    if (!is_band_5(*band))
    {
        return;
    }

    auto tuning_node = common.get_child_optional("band_5_tuning");
    if (!tuning_node)
    {
        common.put_child("band_5_tuning", json::array(std::vector<int>{0, 0}));
        return;
    }
    std::vector<double> tuning;
    try
    {
        tuning = json::values<double>(*tuning_node, "band_5_tuning");
    }
    catch (std::invalid_argument& e)
    {
        detail::reject(e.what() + std::string("."));
    }
    if (tuning.size() != 2)
    {
        detail::reject("'band_5_tuning' must be an array of length 2.");
    }
    config.band_5_tuning = std::make_pair(tuning[0], tuning[1]);
    if (tuning[0] == 0.0 && tuning[1] == 0.0)
    {
        return;
    }
    auto const& params = band_parameters(*band);
    for (double value: tuning)
    {
        if (value * 1e9 < params.start || value * 1e9 > params.stop)
        {
            std::stringstream msg;
            msg << "Elements in 'band_5_tuning' must be floats between "
                << params.start / 1e9 << " and " << params.stop / 1e9
                << " (received " << value << ") for a 'frequency_band' of " << params.name << ".";
            detail::reject(msg.str());
        }
    }
}

void ScanConfigValidator::check_offsets(ptree& cbf, ScanConfiguration& config) const
{
    auto check = [&](std::string const& key, double& target)
    {
        auto child = cbf.get_child_optional(key);
        if (!child)
        {
            cbf.put<int>(key, 0);
            target = 0.0;
            return;
        }
        auto value = child->get_value_optional<double>();
        if (!value || !child->empty())
        {
            detail::reject(std::string("'") + key + "' is malformed.");
        }
        if (std::fabs(*value) > constants::max_stream_offset)
        {
            std::stringstream msg;
            msg << "Absolute value of '" << key << "' must be at most half of the frequency slice bandwidth ("
                << static_cast<long>(constants::max_stream_offset) << " Hz), received " << *value << ".";
            detail::reject(msg.str());
        }
        target = *value;
    };
    check("frequency_band_offset_stream1", config.frequency_band_offset_stream1);
    check("frequency_band_offset_stream2", config.frequency_band_offset_stream2);
}

void ScanConfigValidator::check_subscription_points(ptree& cbf, ScanConfiguration& config) const
{
    std::vector<std::pair<std::string, std::string*>> points = {
        {"delay_model_subscription_point", &config.delay_model_subscription_point},
        {"jones_matrix_subscription_point", &config.jones_matrix_subscription_point},
        {"beam_weights_subscription_point", &config.beam_weights_subscription_point},
        {"vis_destination_address_subscription_point", &config.vis_destination_address_subscription_point}
    };
    for (auto& point: points)
    {
        auto reference = cbf.get_optional<std::string>(point.first);
        if (!reference)
        {
            continue;
        }
        try
        {
            split_attribute_reference(*reference);
        }
        catch (std::invalid_argument& e)
        {
            detail::reject(std::string("'") + point.first + "' is malformed: " + e.what() + ".");
        }
        if (!_fleet.probe(*reference))
        {
            detail::reject(std::string("Attribute ") + *reference + " given by '" + point.first
                + "' not found.");
        }
        *point.second = *reference;
    }
}

void ScanConfigValidator::check_search_window_tuning(double tuning, ScanConfiguration const& config) const
{
    auto const& params = band_parameters(config.frequency_band);
    if (!is_band_5(config.frequency_band))
    {
        if (tuning < params.start || tuning > params.stop)
        {
            detail::reject("'search_window_tuning' must be within observed band.");
        }
        return;
    }
    auto const& t = config.band_5_tuning;
    if (t.first == 0.0 && t.second == 0.0)
    {
        return;
    }
    double const half = constants::band_5_stream_bw / 2.0;
    bool in_stream1 = std::fabs(tuning - t.first * 1e9) <= half;
    bool in_stream2 = std::fabs(tuning - t.second * 1e9) <= half;
    if (!in_stream1 && !in_stream2)
    {
        detail::reject("'search_window_tuning' must be within observed band.");
    }
}

void ScanConfigValidator::check_search_windows(ptree& cbf, ScanConfiguration& config) const
{
    auto windows = cbf.get_child_optional("search_window");
    if (!windows)
    {
        return;
    }
    if (windows->size() > constants::max_search_windows)
    {
        detail::reject("'search_window' must be an array of maximum length 2.");
    }
    std::set<int> ids;
    for (auto& item: *windows)
    {
        auto& window = item.second;
        SearchWindowConfiguration sw;
        sw.search_window_id = detail::get_required<int>(window, "search_window_id", "Search window");
        if (sw.search_window_id != 1 && sw.search_window_id != 2)
        {
            detail::reject("'search_window_id' must be 1 or 2.");
        }
        if (!ids.insert(sw.search_window_id).second)
        {
            detail::reject(std::string("Search window ") + std::to_string(sw.search_window_id)
                + " is configured more than once.");
        }
        double tuning = detail::get_required<double>(window, "search_window_tuning", "Search window");
        check_search_window_tuning(tuning, config);
        sw.tdc_enable = detail::get_required<bool>(window, "tdc_enable", "Search window");
        if (sw.tdc_enable)
        {
            detail::get_required<int>(window, "tdc_num_bits", "Search window");
            auto destinations = window.get_child_optional("tdc_destination_address");
            if (!destinations)
            {
                detail::reject("Search window specified with TDC enabled, but 'tdc_destination_address' not given.");
            }
            for (auto const& destination: *destinations)
            {
                int receptor_id = detail::get_required<int>(destination.second, "receptor_id",
                    "TDC destination address");
                if (!_allocator.is_assigned(receptor_id))
                {
                    detail::reject(std::string("'tdc_destination_address' receptor ")
                        + std::to_string(receptor_id) + " does not belong to subarray "
                        + std::to_string(_config.subarray_id()) + ".");
                }
            }
        }
        sw.document = window;
        config.search_windows.push_back(sw);
    }
}

std::vector<int> ScanConfigValidator::check_receptors(ptree const& node, std::string const& key) const
{
    std::vector<int> receptors;
    try
    {
        receptors = json::values<int>(node, key);
    }
    catch (std::invalid_argument& e)
    {
        detail::reject(e.what() + std::string("."));
    }
    for (int receptor_id: receptors)
    {
        if (!_allocator.is_assigned(receptor_id))
        {
            detail::reject(std::string("Receptor ") + std::to_string(receptor_id)
                + " does not belong to subarray " + std::to_string(_config.subarray_id()) + ".");
        }
    }
    return receptors;
}

FspConfiguration ScanConfigValidator::check_fsp(ptree& entry, ScanConfiguration const& config,
    std::set<int>& seen) const
{
    FspConfiguration fsp = FspConfiguration();
    fsp.fsp_id = detail::get_required<int>(entry, "fsp_id", "FSP");
    if (fsp.fsp_id < 1 || fsp.fsp_id > _config.count_fsp())
    {
        detail::reject(std::string("'fsp_id' must be an integer in the range [1, ")
            + std::to_string(_config.count_fsp()) + "].");
    }
    if (!seen.insert(fsp.fsp_id).second)
    {
        detail::reject(std::string("FSP ") + std::to_string(fsp.fsp_id) + " is configured more than once.");
    }

    std::string const node = _config.fsp_name(fsp.fsp_id);
    if (_fleet.read_attribute(node, "State") != "ON")
    {
        detail::reject(std::string("FSP ") + std::to_string(fsp.fsp_id) + " is not ON.");
    }
    auto owners = detail::membership(_fleet.read_attribute(node, "subarrayMembership"));
    if (!owners.empty()
        && std::find(owners.begin(), owners.end(), std::to_string(_config.subarray_id())) == owners.end())
    {
        detail::reject(std::string("FSP ") + std::to_string(fsp.fsp_id) + " is in use by another subarray.");
    }

    std::string mode_name = detail::get_required<std::string>(entry, "function_mode", "FSP");
    auto mode = parse_function_mode(mode_name);
    if (!mode || *mode == FunctionMode::IDLE)
    {
        detail::reject(std::string("'function_mode' must be one of [CORR, PSS-BF, PST-BF, VLBI] (received ")
            + mode_name + ").");
    }
    fsp.function_mode = *mode;
    std::string bound = _fleet.read_attribute(node, "functionMode");
    if (bound != to_string(FunctionMode::IDLE) && bound != mode_name)
    {
        detail::reject(std::string("FSP ") + std::to_string(fsp.fsp_id)
            + " is bound to function mode " + bound + ".");
    }

    switch (fsp.function_mode)
    {
        case FunctionMode::CORR:
            check_corr(entry, config, fsp);
            break;
        case FunctionMode::PSS_BF:
            check_pss(entry);
            break;
        case FunctionMode::PST_BF:
            check_pst(entry);
            break;
        default:
            break;
    }
    fsp.document = entry;
    return fsp;
}

void ScanConfigValidator::check_corr(ptree& entry, ScanConfiguration const& config, FspConfiguration& fsp) const
{
    auto receptors = entry.get_child_optional("receptors");
    if (receptors)
    {
        fsp.receptors = check_receptors(*receptors, "receptors");
    }
    else
    {
        fsp.receptors = _allocator.receptors();
        entry.put_child("receptors", json::array(fsp.receptors));
    }

    auto const& params = band_parameters(config.frequency_band);
    fsp.frequency_slice_id = detail::get_required<int>(entry, "frequency_slice_id", "FSP");
    if (fsp.frequency_slice_id < 1 || fsp.frequency_slice_id > params.num_frequency_slices)
    {
        detail::reject(std::string("'frequency_slice_id' must be an integer in the range [1, ")
            + std::to_string(params.num_frequency_slices) + "] for a 'frequency_band' of "
            + params.name + ".");
    }

    fsp.zoom_factor = detail::get_required<int>(entry, "zoom_factor", "FSP");
    if (fsp.zoom_factor < 0 || fsp.zoom_factor > static_cast<int>(constants::max_zoom_factor))
    {
        detail::reject("'zoom_factor' must be an integer in the range [0, 6].");
    }
    if (fsp.zoom_factor > 0)
    {
        fsp.zoom_window_tuning = detail::get_required<double>(entry, "zoom_window_tuning", "FSP");
        auto const& t = config.band_5_tuning;
        // Without a tuning there is no band 5 slice to place the window in
        if (is_band_5(config.frequency_band) && t.first == 0.0 && t.second == 0.0)
        {
            detail::reject("'zoom_window_tuning' requires 'band_5_tuning' for a 'frequency_band' of "
                + band_parameters(config.frequency_band).name + ".");
        }
        double start = frequency_slice_start(config.frequency_band, fsp.frequency_slice_id,
            t, config.frequency_band_offset_stream1, config.frequency_band_offset_stream2);
        double stop = start + constants::frequency_slice_bw;
        double tuning = fsp.zoom_window_tuning * 1e3;
        if (tuning < start || tuning > stop)
        {
            detail::reject("'zoom_window_tuning' must be within observed frequency slice.");
        }
    }

    fsp.integration_factor = detail::get_required<int>(entry, "integration_factor", "FSP");
    int const min_factor = static_cast<int>(constants::min_integration_factor);
    int const max_factor = static_cast<int>(constants::max_integration_multiple) * min_factor;
    if (fsp.integration_factor < min_factor || fsp.integration_factor > max_factor
        || fsp.integration_factor % min_factor != 0)
    {
        detail::reject(std::string("'integration_factor' must be an integer in the range [1, 10] multiplied by ")
            + std::to_string(min_factor) + ".");
    }

    if (entry.get_child_optional("channel_offset"))
    {
        fsp.channel_offset = detail::get_required<int>(entry, "channel_offset", "FSP");
        if (fsp.channel_offset < 0)
        {
            detail::reject("'channel_offset' must be a non-negative integer.");
        }
    }
    else
    {
        fsp.channel_offset = 1;
        entry.put<int>("channel_offset", fsp.channel_offset);
    }

    auto link_map = entry.get_child_optional("output_link_map");
    if (link_map)
    {
        for (auto const& item: *link_map)
        {
            int channel, link;
            if (!detail::get_int_pair(item.second, channel, link))
            {
                detail::reject("'output_link_map' must be a list of integer pairs.");
            }
        }
    }

    auto averaging = entry.get_child_optional("channel_averaging_map");
    if (averaging)
    {
        if (averaging->size() != constants::num_channel_groups)
        {
            detail::reject("'channel_averaging_map' must be an 2D array of dimensions 2x20.");
        }
        static std::set<int> const factors = {0, 1, 2, 3, 4, 6, 8};
        int group = 0;
        for (auto const& item: *averaging)
        {
            int first_channel, factor;
            if (!detail::get_int_pair(item.second, first_channel, factor))
            {
                detail::reject("'channel_averaging_map' must be an 2D array of dimensions 2x20.");
            }
            int expected = group * static_cast<int>(constants::channels_per_group) + 1;
            if (first_channel != expected)
            {
                detail::reject(std::string("'channel_averaging_map'[") + std::to_string(group)
                    + "][0] is not the channel ID of the first channel in a group (received "
                    + std::to_string(first_channel) + ").");
            }
            if (!factors.count(factor))
            {
                detail::reject(std::string("'channel_averaging_map'[") + std::to_string(group)
                    + "][1] must be one of [0, 1, 2, 3, 4, 6, 8] (received "
                    + std::to_string(factor) + ").");
            }
            fsp.channel_averaging_map.push_back(std::make_pair(first_channel, factor));
            ++group;
        }
    }

    auto hosts = entry.get_child_optional("output_host");
    if (hosts)
    {
        for (auto const& item: *hosts)
        {
            bool ok = item.second.size() == 2;
            if (ok)
            {
                auto it = item.second.begin();
                ok = static_cast<bool>(it->second.get_value_optional<int>());
                ++it;
                ok = ok && is_ipv4(it->second.get_value<std::string>());
            }
            if (!ok)
            {
                detail::reject("'output_host' must be a list of [channel, IPv4 address] pairs.");
            }
        }
    }
}

void ScanConfigValidator::check_pss(ptree& entry) const
{
    int window = detail::get_required<int>(entry, "search_window_id", "FSP");
    if (window != 1 && window != 2)
    {
        detail::reject("'search_window_id' must be 1 or 2.");
    }
    auto beams = entry.get_child_optional("search_beam");
    if (!beams)
    {
        detail::reject("FSP specified for PSS-BF, but 'search_beam' not given.");
    }
    if (beams->size() > constants::max_search_beams)
    {
        detail::reject(std::string("Number of 'search_beam' entries must not exceed ")
            + std::to_string(constants::max_search_beams) + ".");
    }
    std::set<int> ids;
    for (auto const& item: *beams)
    {
        auto const& beam = item.second;
        int beam_id = detail::get_required<int>(beam, "search_beam_id", "Search beam");
        if (beam_id < 1 || beam_id > constants::max_search_beam_id)
        {
            detail::reject("'search_beam_id' must be within range 1-1500.");
        }
        if (!ids.insert(beam_id).second)
        {
            detail::reject(std::string("'search_beam_id' ") + std::to_string(beam_id) + " is duplicated.");
        }
        auto receptors = beam.get_child_optional("receptor_ids");
        if (!receptors)
        {
            detail::reject("Search beam specified, but 'receptor_ids' not given.");
        }
        check_receptors(*receptors, "receptor_ids");
        detail::get_required<bool>(beam, "enable_output", "Search beam");
        detail::get_required<int>(beam, "averaging_interval", "Search beam");
        std::string address = detail::get_required<std::string>(beam,
            "search_beam_destination_address", "Search beam");
        if (!is_ipv4(address))
        {
            detail::reject(std::string("'search_beam_destination_address' ") + address
                + " is not a valid IPv4 address.");
        }
    }
}

void ScanConfigValidator::check_pst(ptree& entry) const
{
    auto beams = entry.get_child_optional("timing_beam");
    if (!beams)
    {
        detail::reject("FSP specified for PST-BF, but 'timing_beam' not given.");
    }
    if (beams->size() > constants::max_timing_beams)
    {
        detail::reject(std::string("Number of 'timing_beam' entries must not exceed ")
            + std::to_string(constants::max_timing_beams) + ".");
    }
    std::set<int> ids;
    for (auto const& item: *beams)
    {
        auto const& beam = item.second;
        int beam_id = detail::get_required<int>(beam, "timing_beam_id", "Timing beam");
        if (beam_id < 1 || beam_id > constants::max_timing_beam_id)
        {
            detail::reject("'timing_beam_id' must be within range 1-16.");
        }
        if (!ids.insert(beam_id).second)
        {
            detail::reject(std::string("'timing_beam_id' ") + std::to_string(beam_id) + " is duplicated.");
        }
        auto receptors = beam.get_child_optional("receptor_ids");
        if (!receptors)
        {
            detail::reject("Timing beam specified, but 'receptor_ids' not given.");
        }
        check_receptors(*receptors, "receptor_ids");
        detail::get_required<bool>(beam, "enable_output", "Timing beam");
        std::string address = detail::get_required<std::string>(beam,
            "timing_beam_destination_address", "Timing beam");
        if (!is_ipv4(address))
        {
            detail::reject(std::string("'timing_beam_destination_address' ") + address
                + " is not a valid IPv4 address.");
        }
    }
}

} //namespace subarray
} //namespace cbfmcs_cpp
