#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    std::string zero_padded(int value, int width)
    {
        std::stringstream stream;
        stream << std::setw(width) << std::setfill('0') << value;
        return stream.str();
    }

} //namespace detail

SubarrayConfig::SubarrayConfig()
    : _subarray_id(1)
    , _count_vcc(4)
    , _count_fsp(4)
    , _vcc_prefix("mid_csp_cbf/vcc/")
    , _fsp_prefix("mid_csp_cbf/fsp/")
    , _telemetry_node("ska_mid/tm_leaf_node/csp_subarray_01")
{
    _fsp_subarray_prefixes[FunctionMode::CORR] = "mid_csp_cbf/fspCorrSubarray/";
    _fsp_subarray_prefixes[FunctionMode::PSS_BF] = "mid_csp_cbf/fspPssSubarray/";
    _fsp_subarray_prefixes[FunctionMode::PST_BF] = "mid_csp_cbf/fspPstSubarray/";
    _fsp_subarray_prefixes[FunctionMode::VLBI] = "mid_csp_cbf/fspVlbiSubarray/";
}

SubarrayConfig::~SubarrayConfig()
{
}

int SubarrayConfig::subarray_id() const
{
    return _subarray_id;
}

void SubarrayConfig::subarray_id(int id)
{
    if (id < 1)
    {
        throw std::runtime_error(std::string("Invalid subarray id: ") + std::to_string(id));
    }
    _subarray_id = id;
}

std::string const& SubarrayConfig::telemetry_node() const
{
    return _telemetry_node;
}

void SubarrayConfig::telemetry_node(std::string const& node)
{
    _telemetry_node = node;
}

int SubarrayConfig::count_vcc() const
{
    return _count_vcc;
}

void SubarrayConfig::count_vcc(int count)
{
    _count_vcc = count;
}

int SubarrayConfig::count_fsp() const
{
    return _count_fsp;
}

void SubarrayConfig::count_fsp(int count)
{
    _count_fsp = count;
}

std::string const& SubarrayConfig::vcc_prefix() const
{
    return _vcc_prefix;
}

void SubarrayConfig::vcc_prefix(std::string const& prefix)
{
    _vcc_prefix = prefix;
}

std::string const& SubarrayConfig::fsp_prefix() const
{
    return _fsp_prefix;
}

void SubarrayConfig::fsp_prefix(std::string const& prefix)
{
    _fsp_prefix = prefix;
}

std::string const& SubarrayConfig::fsp_subarray_prefix(FunctionMode mode) const
{
    auto it = _fsp_subarray_prefixes.find(mode);
    if (it == _fsp_subarray_prefixes.end())
    {
        throw std::runtime_error(std::string("No FSP subarray nodes for function mode ")
            + to_string(mode));
    }
    return it->second;
}

void SubarrayConfig::fsp_subarray_prefix(FunctionMode mode, std::string const& prefix)
{
    _fsp_subarray_prefixes[mode] = prefix;
}

SubarrayConfig::ReceptorMap const& SubarrayConfig::receptor_map() const
{
    return _receptor_map;
}

void SubarrayConfig::add_receptor(ReceptorInfo const& receptor)
{
    if (_receptor_map.count(receptor.receptor_id))
    {
        throw std::runtime_error(std::string("Duplicate receptor id in receptor map: ")
            + std::to_string(receptor.receptor_id));
    }
    for (auto const& entry: _receptor_map)
    {
        if (entry.second.vcc_id == receptor.vcc_id)
        {
            throw std::runtime_error(std::string("VCC ") + std::to_string(receptor.vcc_id)
                + " is mapped to both receptor " + std::to_string(entry.first)
                + " and receptor " + std::to_string(receptor.receptor_id));
        }
    }
    _receptor_map[receptor.receptor_id] = receptor;
}

bool SubarrayConfig::has_receptor(int receptor_id) const
{
    return _receptor_map.count(receptor_id) != 0;
}

ReceptorInfo const& SubarrayConfig::receptor(int receptor_id) const
{
    auto it = _receptor_map.find(receptor_id);
    if (it == _receptor_map.end())
    {
        throw std::runtime_error(std::string("Unknown receptor id: ") + std::to_string(receptor_id));
    }
    return it->second;
}

std::string SubarrayConfig::vcc_name(int vcc_id) const
{
    return _vcc_prefix + detail::zero_padded(vcc_id, 3);
}

std::string SubarrayConfig::fsp_name(int fsp_id) const
{
    return _fsp_prefix + detail::zero_padded(fsp_id, 2);
}

std::string SubarrayConfig::fsp_subarray_name(FunctionMode mode, int fsp_id) const
{
    return fsp_subarray_prefix(mode) + detail::zero_padded(fsp_id, 2)
        + "_" + detail::zero_padded(_subarray_id, 2);
}

} //namespace subarray
} //namespace cbfmcs_cpp
