#ifndef CBFMCS_CPP_SUBARRAY_RESOURCEALLOCATOR_HPP
#define CBFMCS_CPP_SUBARRAY_RESOURCEALLOCATOR_HPP

#include "cbfmcs_cpp/subarray/FleetGateway.hpp"
#include "cbfmcs_cpp/subarray/HealthAggregator.hpp"
#include "cbfmcs_cpp/subarray/NodeGroup.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include <mutex>

namespace cbfmcs_cpp {
namespace subarray {

struct AllocationResult
{
    std::vector<int> processed;
    std::vector<std::string> errors;

    bool ok() const
    {
        return errors.empty();
    }
};

/**
 * @brief      Owns the exclusive assignment of receptors, and the VCCs
 *             backing them, to one subarray.
 *
 * @detail     Ownership of a VCC is recorded in its subarrayMembership
 *             attribute (0 means unowned). Each receptor is claimed or
 *             released as a unit: the membership write, the State and
 *             healthState subscriptions and the assigned set change
 *             together or not at all.
 *
 *             Mutating calls must be serialised by the caller. Read
 *             accessors may be used from any thread.
 */
class ResourceAllocator
{
public:
    ResourceAllocator(SubarrayConfig const& config,
        FleetGateway& fleet,
        HealthAggregator& health);
    ~ResourceAllocator();
    ResourceAllocator(ResourceAllocator const&) = delete;

    /**
     * @brief      Claim receptors for this subarray.
     *
     * @detail     Unknown receptors and receptors owned by another
     *             subarray are reported per id and skipped. Receptors
     *             already assigned here are skipped with a warning.
     *
     * @return     The ids newly claimed and the per id errors.
     */
    AllocationResult allocate(std::vector<int> const& receptor_ids);

    /**
     * @brief      Release receptors back to the unowned pool.
     *
     * @return     The ids released and the per id errors.
     */
    AllocationResult release(std::vector<int> const& receptor_ids);

    /**
     * @brief      Release a snapshot of every assigned receptor.
     */
    AllocationResult release_all();

    /**
     * @brief      Assigned receptors in the order they were claimed.
     */
    std::vector<int> receptors() const;

    bool is_assigned(int receptor_id) const;

    bool empty() const;

    /**
     * @brief      VCC ids of the assigned receptors, in receptor order.
     */
    std::vector<int> vcc_ids() const;

    /**
     * @brief      The group of VCC nodes backing the assigned receptors.
     *
     * @note       Not synchronised. Only use from the command path.
     */
    NodeGroup const& vcc_group() const;

    std::string vcc_name(int receptor_id) const;

    ReceptorInfo const& receptor_info(int receptor_id) const;

private:
    void claim(ReceptorInfo const& receptor);
    void unclaim(int receptor_id);

private:
    struct Claim
    {
        int receptor_id;
        std::string vcc;
        std::vector<SubscriptionId> subscriptions;
    };

    SubarrayConfig const& _config;
    FleetGateway& _fleet;
    HealthAggregator& _health;
    mutable std::mutex _mutex;
    std::vector<Claim> _claims;
    NodeGroup _vcc_group;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_RESOURCEALLOCATOR_HPP
