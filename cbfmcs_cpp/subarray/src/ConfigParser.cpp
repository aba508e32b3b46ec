#include "cbfmcs_cpp/subarray/ConfigParser.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <fstream>

namespace pt = boost::property_tree;

namespace cbfmcs_cpp {
namespace subarray {
namespace detail
{
    void parse_naming(pt::ptree const& tree, SubarrayConfig& config)
    {
        auto vcc = tree.get_optional<std::string>("vcc");
        if (vcc)
        {
            config.vcc_prefix(*vcc);
        }
        auto fsp = tree.get_optional<std::string>("fsp");
        if (fsp)
        {
            config.fsp_prefix(*fsp);
        }
        for (auto const& node: tree)
        {
            if (node.first != "fsp_subarray")
            {
                continue;
            }
            std::string mode_name = node.second.get<std::string>("<xmlattr>.mode");
            auto mode = parse_function_mode(mode_name);
            if (!mode || *mode == FunctionMode::IDLE)
            {
                throw std::runtime_error(std::string("Unknown function mode in naming section: ") + mode_name);
            }
            config.fsp_subarray_prefix(*mode, node.second.get_value<std::string>());
        }
    }

    ReceptorInfo parse_receptor(pt::ptree const& tree, int count_vcc)
    {
        ReceptorInfo receptor;
        receptor.receptor_id = tree.get<int>("<xmlattr>.id");
        receptor.vcc_id = tree.get<int>("<xmlattr>.vcc");
        receptor.k = tree.get<int>("<xmlattr>.k", 0);
        if (receptor.vcc_id < 1 || receptor.vcc_id > count_vcc)
        {
            throw std::runtime_error(std::string("Receptor ") + std::to_string(receptor.receptor_id)
                + " maps to VCC " + std::to_string(receptor.vcc_id)
                + " outside the range [1, " + std::to_string(count_vcc) + "]");
        }
        return receptor;
    }
} //namespace detail

void parse_xml_config(std::istream& stream, SubarrayConfig& config)
{
    pt::ptree tree;
    pt::read_xml(stream, tree);

    //Parse subarray information
    auto const& subarray = tree.get_child("config.subarray");
    config.subarray_id(subarray.get<int>("id"));
    config.count_vcc(subarray.get<int>("count_vcc"));
    config.count_fsp(subarray.get<int>("count_fsp"));
    if (config.count_vcc() < 1 || config.count_fsp() < 1)
    {
        throw std::runtime_error("count_vcc and count_fsp must be positive");
    }

    //Parse optional node naming
    auto naming = tree.get_child_optional("config.naming");
    if (naming)
    {
        detail::parse_naming(*naming, config);
    }

    //Parse optional telemetry source
    auto telemetry = tree.get_optional<std::string>("config.telemetry.node");
    if (telemetry)
    {
        config.telemetry_node(*telemetry);
    }

    //Parse receptor map
    for (auto const& node: tree.get_child("config.receptors"))
    {
        if (node.first != "receptor")
        {
            continue;
        }
        config.add_receptor(detail::parse_receptor(node.second, config.count_vcc()));
    }
    BOOST_LOG_TRIVIAL(info) << "Parsed configuration for subarray " << config.subarray_id()
                            << " with " << config.receptor_map().size() << " receptors";
}

void parse_xml_config(std::string const& config_filename, SubarrayConfig& config)
{
    std::ifstream stream(config_filename);
    if (!stream.is_open())
    {
        throw std::runtime_error(std::string("Unable to open configuration file: ") + config_filename);
    }
    parse_xml_config(stream, config);
}

} //namespace subarray
} //namespace cbfmcs_cpp
