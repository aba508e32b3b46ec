#include "cbfmcs_cpp/subarray/HealthAggregator.hpp"
#include <algorithm>

namespace cbfmcs_cpp {
namespace subarray {

char const* const HealthAggregator::unknown = "UNKNOWN";

HealthAggregator::HealthAggregator()
{
}

HealthAggregator::~HealthAggregator()
{
}

std::vector<NodeStatus>::iterator HealthAggregator::find(std::vector<NodeStatus>& entries,
    std::string const& node)
{
    return std::find_if(entries.begin(), entries.end(),
        [&](NodeStatus const& status)
        {
            return status.node == node;
        });
}

void HealthAggregator::track(NodeClass node_class, std::string const& node)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto& entries = _views[node_class];
    if (find(entries, node) != entries.end())
    {
        return;
    }
    entries.push_back(NodeStatus{node, unknown, unknown});
}

void HealthAggregator::untrack(NodeClass node_class, std::string const& node)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto& entries = _views[node_class];
    auto it = find(entries, node);
    if (it != entries.end())
    {
        entries.erase(it);
    }
}

void HealthAggregator::untrack_all(NodeClass node_class)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _views[node_class].clear();
}

bool HealthAggregator::is_tracked(NodeClass node_class, std::string const& node) const
{
    return static_cast<bool>(status(node_class, node));
}

bool HealthAggregator::on_change_event(ChangeEvent const& event)
{
    if (event.error)
    {
        BOOST_LOG_TRIVIAL(error) << "Error event on " << event.node << "/" << event.attribute
                                 << ": " << event.error_message;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    auto& entries = _views[event.node_class];
    auto it = find(entries, event.node);
    if (it == entries.end())
    {
        BOOST_LOG_TRIVIAL(warning) << "Discarding " << event.attribute << " event from untracked "
                                   << to_string(event.node_class) << " node " << event.node;
        return false;
    }
    // The last reported value no longer holds once the attribute errors
    std::string value = event.error ? std::string(unknown) : event.value;
    if (event.attribute == "State")
    {
        it->state = value;
    }
    else if (event.attribute == "healthState")
    {
        it->health_state = value;
    }
    else
    {
        BOOST_LOG_TRIVIAL(debug) << "Ignoring event for attribute " << event.attribute
                                 << " of " << event.node;
        return false;
    }
    BOOST_LOG_TRIVIAL(debug) << event.node << " " << event.attribute << " = " << value;
    return true;
}

std::vector<NodeStatus> HealthAggregator::view(NodeClass node_class) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _views.find(node_class);
    if (it == _views.end())
    {
        return std::vector<NodeStatus>();
    }
    return it->second;
}

boost::optional<NodeStatus> HealthAggregator::status(NodeClass node_class, std::string const& node) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _views.find(node_class);
    if (it == _views.end())
    {
        return boost::none;
    }
    for (auto const& entry: it->second)
    {
        if (entry.node == node)
        {
            return entry;
        }
    }
    return boost::none;
}

} //namespace subarray
} //namespace cbfmcs_cpp
