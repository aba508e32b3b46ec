#ifndef CBFMCS_CPP_SUBARRAY_HEALTHAGGREGATOR_HPP
#define CBFMCS_CPP_SUBARRAY_HEALTHAGGREGATOR_HPP

#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include <boost/optional.hpp>
#include <map>
#include <mutex>

namespace cbfmcs_cpp {
namespace subarray {

struct NodeStatus
{
    std::string node;
    std::string state;
    std::string health_state;
};

/**
 * @brief      Last known liveness and health of the nodes assigned
 *             to a subarray.
 *
 * @detail     Views are kept per node class in the order the nodes
 *             were tracked. Only change events for tracked nodes are
 *             applied. The aggregator carries its own lock and is safe
 *             to update from event callback threads.
 */
class HealthAggregator
{
public:
    static char const* const unknown;

public:
    HealthAggregator();
    ~HealthAggregator();
    HealthAggregator(HealthAggregator const&) = delete;

    void track(NodeClass node_class, std::string const& node);
    void untrack(NodeClass node_class, std::string const& node);
    void untrack_all(NodeClass node_class);
    bool is_tracked(NodeClass node_class, std::string const& node) const;

    /**
     * @brief      Apply a State or healthState change event.
     *
     * @detail     An error event sets the affected value to unknown.
     *
     * @return     true if the event updated a tracked node.
     */
    bool on_change_event(ChangeEvent const& event);

    std::vector<NodeStatus> view(NodeClass node_class) const;

    boost::optional<NodeStatus> status(NodeClass node_class, std::string const& node) const;

private:
    std::vector<NodeStatus>::iterator find(std::vector<NodeStatus>& entries, std::string const& node);

private:
    mutable std::mutex _mutex;
    std::map<NodeClass, std::vector<NodeStatus>> _views;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_HEALTHAGGREGATOR_HPP
