#ifndef CBFMCS_CPP_SUBARRAY_FLEETGATEWAY_HPP
#define CBFMCS_CPP_SUBARRAY_FLEETGATEWAY_HPP

#include "cbfmcs_cpp/subarray/NodeGroup.hpp"
#include "cbfmcs_cpp/common.hpp"
#include <functional>

namespace cbfmcs_cpp {
namespace subarray {

enum class NodeClass
{
    VCC = 0,
    FSP,
    FSP_SUBARRAY,
    TELEMETRY
};

std::string to_string(NodeClass node_class);

/**
 * @brief      A change event pushed by a fleet node for one attribute.
 *
 * @detail     The node class is fixed when the subscription is made so
 *             that consumers never have to infer it from the node name.
 */
struct ChangeEvent
{
    std::string node;
    NodeClass node_class;
    std::string attribute;
    std::string value;
    bool error;
    std::string error_message;
};

typedef std::function<void(ChangeEvent const&)> EventCallback;
typedef std::size_t SubscriptionId;

/**
 * @brief      Split an attribute reference of the form
 *             "<node>/<attribute>" at its last separator.
 *
 * @note       Throws std::invalid_argument if either part is empty.
 */
std::pair<std::string, std::string> split_attribute_reference(std::string const& reference);

/**
 * @brief      Interface to the fleet of remote processing nodes.
 *
 * @detail     Implementations report any failure to reach a node, or a
 *             failure returned by it, by throwing RemoteCallFailed.
 *             Payloads and replies are JSON strings.
 */
class FleetGateway
{
public:
    virtual ~FleetGateway();

    /**
     * @brief      Invoke a command on a single node and wait for its reply.
     */
    virtual std::string call(std::string const& node,
        std::string const& command,
        std::string const& payload) = 0;

    /**
     * @brief      Invoke a command on every member of a group in order.
     *
     * @detail     The call stops at the first failing member.
     *
     * @return     The replies in member order.
     */
    virtual std::vector<std::string> call_group(NodeGroup const& group,
        std::string const& command,
        std::string const& payload);

    virtual std::string read_attribute(std::string const& node,
        std::string const& attribute) = 0;

    virtual void write_attribute(std::string const& node,
        std::string const& attribute,
        std::string const& value) = 0;

    /**
     * @brief      Register for change events on a node attribute.
     *
     * @detail     Events are tagged with the given node class. The
     *             callback may be invoked on any thread.
     */
    virtual SubscriptionId subscribe(std::string const& node,
        NodeClass node_class,
        std::string const& attribute,
        EventCallback callback) = 0;

    virtual void unsubscribe(SubscriptionId id) = 0;

    /**
     * @brief      Single liveness check of a node or attribute reference.
     *
     * @detail     Never throws and never retries.
     */
    virtual bool probe(std::string const& reference) = 0;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_FLEETGATEWAY_HPP
