#include "cbfmcs_cpp/subarray/NodeGroup.hpp"
#include <algorithm>

namespace cbfmcs_cpp {
namespace subarray {

NodeGroup::NodeGroup(std::string const& name)
    : _name(name)
{
}

NodeGroup::~NodeGroup()
{
}

std::string const& NodeGroup::name() const
{
    return _name;
}

bool NodeGroup::add(std::string const& node)
{
    if (contains(node))
    {
        return false;
    }
    BOOST_LOG_TRIVIAL(debug) << "Adding " << node << " to group " << _name;
    _members.push_back(node);
    return true;
}

bool NodeGroup::remove(std::string const& node)
{
    auto it = std::find(_members.begin(), _members.end(), node);
    if (it == _members.end())
    {
        return false;
    }
    BOOST_LOG_TRIVIAL(debug) << "Removing " << node << " from group " << _name;
    _members.erase(it);
    return true;
}

void NodeGroup::remove_all()
{
    _members.clear();
}

bool NodeGroup::contains(std::string const& node) const
{
    return std::find(_members.begin(), _members.end(), node) != _members.end();
}

bool NodeGroup::empty() const
{
    return _members.empty();
}

std::size_t NodeGroup::size() const
{
    return _members.size();
}

std::vector<std::string> const& NodeGroup::members() const
{
    return _members;
}

} //namespace subarray
} //namespace cbfmcs_cpp
