#include "cbfmcs_cpp/subarray/SimulatedFleetGateway.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string.hpp>
#include <algorithm>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    std::vector<std::string> split_membership(std::string const& value)
    {
        std::vector<std::string> ids;
        if (value.empty())
        {
            return ids;
        }
        boost::split(ids, value, boost::is_any_of(","));
        return ids;
    }

    std::string json_field(std::string const& payload, std::string const& key)
    {
        boost::property_tree::ptree tree;
        std::stringstream stream(payload);
        boost::property_tree::json_parser::read_json(stream, tree);
        return tree.get<std::string>(key);
    }

} //namespace detail

SimulatedFleetGateway::SimulatedFleetGateway()
    : _next_subscription_id(1)
{
}

SimulatedFleetGateway::~SimulatedFleetGateway()
{
}

void SimulatedFleetGateway::add_node(std::string const& node, NodeClass node_class,
    std::map<std::string, std::string> const& attributes)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_nodes.count(node))
    {
        return;
    }
    SimulatedNode sim_node;
    sim_node.node_class = node_class;
    sim_node.attributes = attributes;
    sim_node.offline = false;
    sim_node.failing_subscriptions = false;
    _nodes[node] = sim_node;
}

void SimulatedFleetGateway::populate(SubarrayConfig const& config)
{
    for (int vcc_id = 1; vcc_id <= config.count_vcc(); ++vcc_id)
    {
        add_node(config.vcc_name(vcc_id), NodeClass::VCC, {
            {"State", "ON"},
            {"healthState", "OK"},
            {"obsState", "IDLE"},
            {"subarrayMembership", "0"},
            {"frequencyBand", ""}
        });
    }
    for (int fsp_id = 1; fsp_id <= config.count_fsp(); ++fsp_id)
    {
        add_node(config.fsp_name(fsp_id), NodeClass::FSP, {
            {"State", "ON"},
            {"healthState", "OK"},
            {"functionMode", "IDLE"},
            {"subarrayMembership", ""}
        });
        for (auto mode: {FunctionMode::CORR, FunctionMode::PSS_BF,
                         FunctionMode::PST_BF, FunctionMode::VLBI})
        {
            add_node(config.fsp_subarray_name(mode, fsp_id), NodeClass::FSP_SUBARRAY, {
                {"State", "ON"},
                {"healthState", "OK"},
                {"obsState", "IDLE"}
            });
        }
    }
    add_node(config.telemetry_node(), NodeClass::TELEMETRY, {
        {"State", "ON"},
        {"delayModel", ""},
        {"jonesMatrix", ""},
        {"beamWeights", ""},
        {"visDestinationAddress", ""}
    });
}

bool SimulatedFleetGateway::has_node(std::string const& node) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _nodes.count(node) != 0;
}

SimulatedFleetGateway::SimulatedNode& SimulatedFleetGateway::node_or_throw(std::string const& node)
{
    auto it = _nodes.find(node);
    if (it == _nodes.end())
    {
        throw RemoteCallFailed(std::string("Node ") + node + " does not exist");
    }
    if (it->second.offline)
    {
        throw RemoteCallFailed(std::string("Node ") + node + " is not reachable");
    }
    return it->second;
}

std::string SimulatedFleetGateway::call(std::string const& node,
    std::string const& command,
    std::string const& payload)
{
    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto& sim_node = node_or_throw(node);
        if (sim_node.failing_commands.count(command))
        {
            throw RemoteCallFailed(std::string("Node ") + node + " failed command " + command);
        }
        _commands.push_back(CommandRecord{node, command, payload});
        apply_command(node, sim_node, command, payload, changed);
    }
    for (auto const& attribute: changed)
    {
        std::string value;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            value = _nodes[node].attributes[attribute];
        }
        notify(node, attribute, value, false, "");
    }
    return "OK";
}

void SimulatedFleetGateway::apply_command(std::string const& node_name, SimulatedNode& node,
    std::string const& command, std::string const& payload,
    std::vector<std::string>& changed)
{
    auto set = [&](std::string const& attribute, std::string const& value)
    {
        if (node.attributes[attribute] != value)
        {
            node.attributes[attribute] = value;
            changed.push_back(attribute);
        }
    };

    if (command == "ConfigureScan" || command == "EndScan")
    {
        set("obsState", "READY");
    }
    else if (command == "Scan")
    {
        set("obsState", "SCANNING");
    }
    else if (command == "GoToIdle" || command == "ObsReset")
    {
        set("obsState", "IDLE");
    }
    else if (command == "Abort")
    {
        set("obsState", "ABORTED");
    }
    else if (command == "ConfigureBand")
    {
        try
        {
            set("frequencyBand", detail::json_field(payload, "frequency_band"));
        }
        catch (std::exception& e)
        {
            throw RemoteCallFailed(std::string("Node ") + node_name
                + " rejected ConfigureBand payload: " + e.what());
        }
    }
    else if (command == "SetFunctionMode")
    {
        auto mode = parse_function_mode(payload);
        if (!mode)
        {
            throw RemoteCallFailed(std::string("Node ") + node_name
                + " rejected function mode '" + payload + "'");
        }
        set("functionMode", payload);
    }
    else if (command == "AddSubarrayMembership")
    {
        auto ids = detail::split_membership(node.attributes["subarrayMembership"]);
        if (std::find(ids.begin(), ids.end(), payload) == ids.end())
        {
            ids.push_back(payload);
        }
        set("subarrayMembership", boost::algorithm::join(ids, ","));
    }
    else if (command == "RemoveSubarrayMembership")
    {
        auto ids = detail::split_membership(node.attributes["subarrayMembership"]);
        ids.erase(std::remove(ids.begin(), ids.end(), payload), ids.end());
        set("subarrayMembership", boost::algorithm::join(ids, ","));
        if (ids.empty())
        {
            set("functionMode", "IDLE");
        }
    }
}

std::string SimulatedFleetGateway::read_attribute(std::string const& node,
    std::string const& attribute)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto& sim_node = node_or_throw(node);
    auto it = sim_node.attributes.find(attribute);
    if (it == sim_node.attributes.end())
    {
        throw RemoteCallFailed(std::string("Node ") + node + " has no attribute " + attribute);
    }
    return it->second;
}

void SimulatedFleetGateway::write_attribute(std::string const& node,
    std::string const& attribute,
    std::string const& value)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto& sim_node = node_or_throw(node);
        if (sim_node.failing_commands.count(std::string("write:") + attribute))
        {
            throw RemoteCallFailed(std::string("Node ") + node + " refused write of " + attribute);
        }
        sim_node.attributes[attribute] = value;
    }
    notify(node, attribute, value, false, "");
}

SubscriptionId SimulatedFleetGateway::subscribe(std::string const& node,
    NodeClass node_class,
    std::string const& attribute,
    EventCallback callback)
{
    SubscriptionId id;
    std::string initial_value;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto& sim_node = node_or_throw(node);
        if (sim_node.failing_subscriptions)
        {
            throw RemoteCallFailed(std::string("Subscription to ") + node + "/" + attribute + " failed");
        }
        id = _next_subscription_id++;
        _subscriptions[id] = Subscription{node, node_class, attribute, callback};
        auto it = sim_node.attributes.find(attribute);
        if (it != sim_node.attributes.end())
        {
            initial_value = it->second;
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Subscription " << id << " on " << node << "/" << attribute;
    if (!initial_value.empty())
    {
        ChangeEvent event{node, node_class, attribute, initial_value, false, ""};
        callback(event);
    }
    return id;
}

void SimulatedFleetGateway::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_subscriptions.erase(id) == 0)
    {
        throw RemoteCallFailed(std::string("Unknown subscription id ") + std::to_string(id));
    }
}

bool SimulatedFleetGateway::probe(std::string const& reference)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _nodes.find(reference);
    if (it != _nodes.end())
    {
        return !it->second.offline;
    }
    auto pos = reference.rfind('/');
    if (pos == std::string::npos)
    {
        return false;
    }
    it = _nodes.find(reference.substr(0, pos));
    if (it == _nodes.end() || it->second.offline)
    {
        return false;
    }
    return it->second.attributes.count(reference.substr(pos + 1)) != 0;
}

void SimulatedFleetGateway::push_event(std::string const& node, std::string const& attribute,
    std::string const& value)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _nodes.find(node);
        if (it == _nodes.end())
        {
            throw std::runtime_error(std::string("Cannot push event for unknown node ") + node);
        }
        it->second.attributes[attribute] = value;
    }
    notify(node, attribute, value, false, "");
}

void SimulatedFleetGateway::push_error_event(std::string const& node, std::string const& attribute,
    std::string const& message)
{
    notify(node, attribute, "", true, message);
}

void SimulatedFleetGateway::notify(std::string const& node, std::string const& attribute,
    std::string const& value, bool error, std::string const& message)
{
    std::vector<std::pair<EventCallback, ChangeEvent>> pending;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto const& entry: _subscriptions)
        {
            auto const& subscription = entry.second;
            if (subscription.node == node && subscription.attribute == attribute)
            {
                ChangeEvent event{node, subscription.node_class, attribute, value, error, message};
                pending.push_back(std::make_pair(subscription.callback, event));
            }
        }
    }
    for (auto& item: pending)
    {
        item.first(item.second);
    }
}

void SimulatedFleetGateway::set_offline(std::string const& node, bool offline)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _nodes.find(node);
    if (it == _nodes.end())
    {
        throw std::runtime_error(std::string("Unknown node ") + node);
    }
    it->second.offline = offline;
}

void SimulatedFleetGateway::fail_command(std::string const& node, std::string const& command, bool fail)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _nodes.find(node);
    if (it == _nodes.end())
    {
        throw std::runtime_error(std::string("Unknown node ") + node);
    }
    if (fail)
    {
        it->second.failing_commands.insert(command);
    }
    else
    {
        it->second.failing_commands.erase(command);
    }
}

void SimulatedFleetGateway::fail_subscriptions(std::string const& node, bool fail)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _nodes.find(node);
    if (it == _nodes.end())
    {
        throw std::runtime_error(std::string("Unknown node ") + node);
    }
    it->second.failing_subscriptions = fail;
}

std::vector<CommandRecord> SimulatedFleetGateway::commands() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _commands;
}

std::vector<CommandRecord> SimulatedFleetGateway::commands(std::string const& command) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<CommandRecord> matching;
    for (auto const& record: _commands)
    {
        if (record.command == command)
        {
            matching.push_back(record);
        }
    }
    return matching;
}

std::size_t SimulatedFleetGateway::count(std::string const& command) const
{
    return commands(command).size();
}

std::size_t SimulatedFleetGateway::count(std::string const& node, std::string const& command) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::count_if(_commands.begin(), _commands.end(),
        [&](CommandRecord const& record)
        {
            return record.node == node && record.command == command;
        });
}

void SimulatedFleetGateway::clear_commands()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _commands.clear();
}

std::size_t SimulatedFleetGateway::subscription_count() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _subscriptions.size();
}

std::size_t SimulatedFleetGateway::subscription_count(std::string const& node) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t n = 0;
    for (auto const& entry: _subscriptions)
    {
        if (entry.second.node == node)
        {
            ++n;
        }
    }
    return n;
}

} //namespace subarray
} //namespace cbfmcs_cpp
