#ifndef CBFMCS_CPP_SUBARRAY_SIMULATEDFLEETGATEWAY_HPP
#define CBFMCS_CPP_SUBARRAY_SIMULATEDFLEETGATEWAY_HPP

#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <map>
#include <set>
#include <mutex>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Record of one command received by a simulated node.
 */
struct CommandRecord
{
    std::string node;
    std::string command;
    std::string payload;
};

/**
 * @brief      In-process fleet of VCC, FSP, FSP subarray and
 *             telemetry nodes.
 *
 * @detail     Nodes keep a string attribute table and react to the
 *             lifecycle commands the subarray sends them by updating
 *             their obsState, function mode and membership attributes.
 *             Every command is recorded. Faults can be injected per node
 *             or per command. Attribute changes are pushed to subscribers
 *             on the calling thread, outside the internal lock.
 */
class SimulatedFleetGateway: public FleetGateway
{
public:
    SimulatedFleetGateway();
    ~SimulatedFleetGateway();
    SimulatedFleetGateway(SimulatedFleetGateway const&) = delete;

    std::string call(std::string const& node,
        std::string const& command,
        std::string const& payload) override;

    std::string read_attribute(std::string const& node,
        std::string const& attribute) override;

    void write_attribute(std::string const& node,
        std::string const& attribute,
        std::string const& value) override;

    SubscriptionId subscribe(std::string const& node,
        NodeClass node_class,
        std::string const& attribute,
        EventCallback callback) override;

    void unsubscribe(SubscriptionId id) override;

    bool probe(std::string const& reference) override;

    /**
     * @brief      Create every node that the given configuration refers to.
     *
     * @detail     Nodes that already exist are left untouched so that
     *             several subarrays may share one simulated fleet.
     */
    void populate(SubarrayConfig const& config);

    void add_node(std::string const& node, NodeClass node_class,
        std::map<std::string, std::string> const& attributes);

    bool has_node(std::string const& node) const;

    /**
     * @brief      Set an attribute and push a change event to its subscribers.
     */
    void push_event(std::string const& node, std::string const& attribute,
        std::string const& value);

    /**
     * @brief      Push an error event without changing the attribute.
     */
    void push_error_event(std::string const& node, std::string const& attribute,
        std::string const& message);

    /**
     * @brief      Take a node offline. Offline nodes fail every call
     *             and every probe.
     */
    void set_offline(std::string const& node, bool offline);

    /**
     * @brief      Make a single command fail on a node.
     *
     * @note       Use "write:<attribute>" to make writes of an
     *             attribute fail.
     */
    void fail_command(std::string const& node, std::string const& command, bool fail);

    /**
     * @brief      Make subscriptions on a node fail.
     */
    void fail_subscriptions(std::string const& node, bool fail);

    std::vector<CommandRecord> commands() const;
    std::vector<CommandRecord> commands(std::string const& command) const;
    std::size_t count(std::string const& command) const;
    std::size_t count(std::string const& node, std::string const& command) const;
    void clear_commands();

    std::size_t subscription_count() const;
    std::size_t subscription_count(std::string const& node) const;

private:
    struct SimulatedNode
    {
        NodeClass node_class;
        std::map<std::string, std::string> attributes;
        std::set<std::string> failing_commands;
        bool offline;
        bool failing_subscriptions;
    };

    struct Subscription
    {
        std::string node;
        NodeClass node_class;
        std::string attribute;
        EventCallback callback;
    };

    SimulatedNode& node_or_throw(std::string const& node);
    void apply_command(std::string const& node_name, SimulatedNode& node,
        std::string const& command, std::string const& payload,
        std::vector<std::string>& changed);
    void notify(std::string const& node, std::string const& attribute,
        std::string const& value, bool error, std::string const& message);

private:
    mutable std::mutex _mutex;
    std::map<std::string, SimulatedNode> _nodes;
    std::map<SubscriptionId, Subscription> _subscriptions;
    std::vector<CommandRecord> _commands;
    SubscriptionId _next_subscription_id;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SIMULATEDFLEETGATEWAY_HPP
