#ifndef CBFMCS_CPP_SUBARRAY_NODEGROUP_HPP
#define CBFMCS_CPP_SUBARRAY_NODEGROUP_HPP

#include "cbfmcs_cpp/common.hpp"

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      A named, ordered set of fleet node references that
 *             are addressed together.
 */
class NodeGroup
{
public:
    explicit NodeGroup(std::string const& name);
    ~NodeGroup();

    std::string const& name() const;

    /**
     * @brief      Append a node if not already a member.
     *
     * @return     true if the node was added.
     */
    bool add(std::string const& node);

    bool remove(std::string const& node);
    void remove_all();
    bool contains(std::string const& node) const;
    bool empty() const;
    std::size_t size() const;
    std::vector<std::string> const& members() const;

private:
    std::string _name;
    std::vector<std::string> _members;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_NODEGROUP_HPP
