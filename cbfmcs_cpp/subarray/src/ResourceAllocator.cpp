#include "cbfmcs_cpp/subarray/ResourceAllocator.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include <algorithm>

namespace cbfmcs_cpp {
namespace subarray {

ResourceAllocator::ResourceAllocator(SubarrayConfig const& config,
    FleetGateway& fleet,
    HealthAggregator& health)
    : _config(config)
    , _fleet(fleet)
    , _health(health)
    , _vcc_group("vcc")
{
}

ResourceAllocator::~ResourceAllocator()
{
}

AllocationResult ResourceAllocator::allocate(std::vector<int> const& receptor_ids)
{
    AllocationResult result;
    for (int receptor_id: receptor_ids)
    {
        if (!_config.has_receptor(receptor_id))
        {
            std::string msg = std::string("Invalid receptor ") + std::to_string(receptor_id)
                + ": not present in the receptor map";
            BOOST_LOG_TRIVIAL(error) << msg;
            result.errors.push_back(msg);
            continue;
        }
        if (is_assigned(receptor_id))
        {
            BOOST_LOG_TRIVIAL(warning) << "Receptor " << receptor_id
                                       << " already assigned to subarray " << _config.subarray_id();
            continue;
        }
        try
        {
            claim(_config.receptor(receptor_id));
            result.processed.push_back(receptor_id);
        }
        catch (ResourceConflict& e)
        {
            BOOST_LOG_TRIVIAL(error) << e.what();
            result.errors.push_back(e.what());
        }
        catch (std::exception& e)
        {
            std::string msg = std::string("Failed to assign receptor ") + std::to_string(receptor_id)
                + ": " + e.what();
            BOOST_LOG_TRIVIAL(error) << msg;
            result.errors.push_back(msg);
        }
    }
    return result;
}

void ResourceAllocator::claim(ReceptorInfo const& receptor)
{
    std::string const vcc = _config.vcc_name(receptor.vcc_id);
    std::string const previous = _fleet.read_attribute(vcc, "subarrayMembership");
    int const owner = std::stoi(previous);
    if (owner != 0 && owner != _config.subarray_id())
    {
        throw ResourceConflict(std::string("Receptor ") + std::to_string(receptor.receptor_id)
            + " already in use by subarray " + std::to_string(owner));
    }
    _fleet.write_attribute(vcc, "subarrayMembership", std::to_string(_config.subarray_id()));

    Claim claim{receptor.receptor_id, vcc, {}};
    _health.track(NodeClass::VCC, vcc);
    HealthAggregator& health = _health;
    auto callback = [&health](ChangeEvent const& event)
    {
        health.on_change_event(event);
    };
    try
    {
        claim.subscriptions.push_back(_fleet.subscribe(vcc, NodeClass::VCC, "State", callback));
        claim.subscriptions.push_back(_fleet.subscribe(vcc, NodeClass::VCC, "healthState", callback));
    }
    catch (std::exception& e)
    {
        BOOST_LOG_TRIVIAL(warning) << "Rolling back assignment of receptor " << receptor.receptor_id
                                   << ": " << e.what();
        for (auto id: claim.subscriptions)
        {
            try
            {
                _fleet.unsubscribe(id);
            }
            catch (std::exception& inner)
            {
                BOOST_LOG_TRIVIAL(error) << "Failed to unsubscribe during rollback: " << inner.what();
            }
        }
        _health.untrack(NodeClass::VCC, vcc);
        try
        {
            _fleet.write_attribute(vcc, "subarrayMembership", previous);
        }
        catch (std::exception& inner)
        {
            BOOST_LOG_TRIVIAL(error) << "Failed to restore membership of " << vcc << ": " << inner.what();
        }
        throw;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _claims.push_back(claim);
    _vcc_group.add(vcc);
    BOOST_LOG_TRIVIAL(info) << "Receptor " << receptor.receptor_id << " (" << vcc
                            << ") assigned to subarray " << _config.subarray_id();
}

AllocationResult ResourceAllocator::release(std::vector<int> const& receptor_ids)
{
    AllocationResult result;
    for (int receptor_id: receptor_ids)
    {
        if (!is_assigned(receptor_id))
        {
            BOOST_LOG_TRIVIAL(warning) << "Receptor " << receptor_id
                                       << " not assigned to subarray " << _config.subarray_id()
                                       << ", nothing to release";
            continue;
        }
        try
        {
            unclaim(receptor_id);
            result.processed.push_back(receptor_id);
        }
        catch (std::exception& e)
        {
            std::string msg = std::string("Failed to release receptor ") + std::to_string(receptor_id)
                + ": " + e.what();
            BOOST_LOG_TRIVIAL(error) << msg;
            result.errors.push_back(msg);
        }
    }
    return result;
}

void ResourceAllocator::unclaim(int receptor_id)
{
    Claim claim;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = std::find_if(_claims.begin(), _claims.end(),
            [&](Claim const& c){ return c.receptor_id == receptor_id; });
        if (it == _claims.end())
        {
            throw InternalInconsistency(std::string("No claim held for receptor ")
                + std::to_string(receptor_id));
        }
        claim = *it;
    }

    // Ownership is released first so that a failure leaves the claim intact.
    _fleet.write_attribute(claim.vcc, "subarrayMembership", "0");
    for (auto id: claim.subscriptions)
    {
        try
        {
            _fleet.unsubscribe(id);
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(warning) << "Failed to unsubscribe from " << claim.vcc << ": " << e.what();
        }
    }
    _health.untrack(NodeClass::VCC, claim.vcc);

    std::lock_guard<std::mutex> lock(_mutex);
    _claims.erase(std::remove_if(_claims.begin(), _claims.end(),
        [&](Claim const& c){ return c.receptor_id == receptor_id; }), _claims.end());
    _vcc_group.remove(claim.vcc);
    BOOST_LOG_TRIVIAL(info) << "Receptor " << receptor_id << " (" << claim.vcc
                            << ") released from subarray " << _config.subarray_id();
}

AllocationResult ResourceAllocator::release_all()
{
    return release(receptors());
}

std::vector<int> ResourceAllocator::receptors() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<int> ids;
    ids.reserve(_claims.size());
    for (auto const& claim: _claims)
    {
        ids.push_back(claim.receptor_id);
    }
    return ids;
}

bool ResourceAllocator::is_assigned(int receptor_id) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::any_of(_claims.begin(), _claims.end(),
        [&](Claim const& c){ return c.receptor_id == receptor_id; });
}

bool ResourceAllocator::empty() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _claims.empty();
}

std::vector<int> ResourceAllocator::vcc_ids() const
{
    std::vector<int> ids;
    for (int receptor_id: receptors())
    {
        ids.push_back(_config.receptor(receptor_id).vcc_id);
    }
    return ids;
}

NodeGroup const& ResourceAllocator::vcc_group() const
{
    return _vcc_group;
}

std::string ResourceAllocator::vcc_name(int receptor_id) const
{
    return _config.vcc_name(_config.receptor(receptor_id).vcc_id);
}

ReceptorInfo const& ResourceAllocator::receptor_info(int receptor_id) const
{
    return _config.receptor(receptor_id);
}

} //namespace subarray
} //namespace cbfmcs_cpp
