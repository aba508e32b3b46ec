#include "cbfmcs_cpp/subarray/FleetGateway.hpp"

namespace cbfmcs_cpp {
namespace subarray {

std::string to_string(NodeClass node_class)
{
    switch (node_class)
    {
        case NodeClass::VCC: return "VCC";
        case NodeClass::FSP: return "FSP";
        case NodeClass::FSP_SUBARRAY: return "FSP_SUBARRAY";
        case NodeClass::TELEMETRY: return "TELEMETRY";
    }
    return "UNKNOWN";
}

std::pair<std::string, std::string> split_attribute_reference(std::string const& reference)
{
    auto pos = reference.rfind('/');
    if (pos == std::string::npos || pos == 0 || pos + 1 == reference.size())
    {
        throw std::invalid_argument(std::string("Malformed attribute reference: '") + reference + "'");
    }
    return std::make_pair(reference.substr(0, pos), reference.substr(pos + 1));
}

FleetGateway::~FleetGateway()
{
}

std::vector<std::string> FleetGateway::call_group(NodeGroup const& group,
    std::string const& command,
    std::string const& payload)
{
    BOOST_LOG_TRIVIAL(debug) << "Issuing " << command << " to group "
                             << group.name() << " (" << group.size() << " members)";
    std::vector<std::string> replies;
    replies.reserve(group.size());
    for (auto const& node: group.members())
    {
        replies.push_back(call(node, command, payload));
    }
    return replies;
}

} //namespace subarray
} //namespace cbfmcs_cpp
