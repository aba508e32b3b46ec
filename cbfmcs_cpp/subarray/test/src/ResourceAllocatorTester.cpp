#include "cbfmcs_cpp/subarray/test/ResourceAllocatorTester.hpp"

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

ResourceAllocatorTester::ResourceAllocatorTester()
    : ::testing::Test()
{
}

ResourceAllocatorTester::~ResourceAllocatorTester()
{
}

void ResourceAllocatorTester::SetUp()
{
    populate_test_config(_config);
    _fleet.populate(_config);
}

void ResourceAllocatorTester::TearDown()
{
}

TEST_F(ResourceAllocatorTester, allocate_keeps_request_order)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    auto result = allocator.allocate({1, 3, 4, 2});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.processed, std::vector<int>({1, 3, 4, 2}));
    EXPECT_EQ(allocator.receptors(), std::vector<int>({1, 3, 4, 2}));
    EXPECT_EQ(allocator.vcc_ids(), std::vector<int>({1, 3, 4, 2}));
    for (int id = 1; id <= 4; ++id)
    {
        EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(id), "subarrayMembership"), "1");
        EXPECT_EQ(_fleet.subscription_count(_config.vcc_name(id)), 2u);
    }
    EXPECT_EQ(allocator.vcc_group().size(), 4u);
    auto view = _health.view(NodeClass::VCC);
    ASSERT_EQ(view.size(), 4u);
    EXPECT_EQ(view[1].node, _config.vcc_name(3));
    // Initial values are delivered on subscription
    EXPECT_EQ(view[1].state, "ON");
    EXPECT_EQ(view[1].health_state, "OK");
}

TEST_F(ResourceAllocatorTester, vcc_error_event_shows_unknown_health)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    ASSERT_TRUE(allocator.allocate({2}).ok());
    _fleet.push_error_event(_config.vcc_name(2), "healthState", "connection lost");
    auto status = _health.status(NodeClass::VCC, _config.vcc_name(2));
    ASSERT_TRUE(static_cast<bool>(status));
    EXPECT_EQ(status->health_state, HealthAggregator::unknown);
    EXPECT_EQ(status->state, "ON");
    _fleet.push_event(_config.vcc_name(2), "healthState", "DEGRADED");
    EXPECT_EQ(_health.status(NodeClass::VCC, _config.vcc_name(2))->health_state, "DEGRADED");
}

TEST_F(ResourceAllocatorTester, receptor_owned_by_another_subarray_is_not_claimed)
{
    _fleet.write_attribute(_config.vcc_name(3), "subarrayMembership", "2");
    ResourceAllocator allocator(_config, _fleet, _health);
    auto result = allocator.allocate({1, 3});
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("already in use by subarray 2"), std::string::npos);
    EXPECT_EQ(result.processed, std::vector<int>({1}));
    EXPECT_FALSE(allocator.is_assigned(3));
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(3), "subarrayMembership"), "2");
    EXPECT_EQ(_fleet.subscription_count(_config.vcc_name(3)), 0u);
    EXPECT_FALSE(_health.is_tracked(NodeClass::VCC, _config.vcc_name(3)));
}

TEST_F(ResourceAllocatorTester, unknown_receptor_is_reported)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    auto result = allocator.allocate({9, 2});
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Invalid receptor 9: not present in the receptor map");
    EXPECT_EQ(allocator.receptors(), std::vector<int>({2}));
}

TEST_F(ResourceAllocatorTester, reallocation_is_skipped)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    allocator.allocate({2});
    auto result = allocator.allocate({2});
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.processed.empty());
    EXPECT_EQ(allocator.receptors(), std::vector<int>({2}));
    EXPECT_EQ(_fleet.subscription_count(_config.vcc_name(2)), 2u);
}

TEST_F(ResourceAllocatorTester, release_then_allocate_restores_assignment)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    allocator.allocate({1, 2});
    auto released = allocator.release({2});
    ASSERT_TRUE(released.ok());
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(2), "subarrayMembership"), "0");
    EXPECT_EQ(_fleet.subscription_count(_config.vcc_name(2)), 0u);
    EXPECT_FALSE(_health.is_tracked(NodeClass::VCC, _config.vcc_name(2)));
    EXPECT_EQ(allocator.receptors(), std::vector<int>({1}));

    allocator.allocate({2});
    EXPECT_EQ(allocator.receptors(), std::vector<int>({1, 2}));
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(2), "subarrayMembership"), "1");
    EXPECT_EQ(_fleet.subscription_count(_config.vcc_name(2)), 2u);
}

TEST_F(ResourceAllocatorTester, release_of_unassigned_receptor_is_a_no_op)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    allocator.allocate({1});
    _fleet.clear_commands();
    auto result = allocator.release({3});
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.processed.empty());
    EXPECT_EQ(allocator.receptors(), std::vector<int>({1}));
}

TEST_F(ResourceAllocatorTester, failed_subscription_rolls_back_membership)
{
    _fleet.fail_subscriptions(_config.vcc_name(4), true);
    ResourceAllocator allocator(_config, _fleet, _health);
    auto result = allocator.allocate({4});
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(allocator.empty());
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(4), "subarrayMembership"), "0");
    EXPECT_FALSE(_health.is_tracked(NodeClass::VCC, _config.vcc_name(4)));
    EXPECT_EQ(_fleet.subscription_count(), 0u);
}

TEST_F(ResourceAllocatorTester, release_all_empties_the_set)
{
    ResourceAllocator allocator(_config, _fleet, _health);
    allocator.allocate({4, 1, 3});
    auto result = allocator.release_all();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.processed, std::vector<int>({4, 1, 3}));
    EXPECT_TRUE(allocator.empty());
    EXPECT_TRUE(allocator.vcc_group().empty());
    EXPECT_TRUE(_health.view(NodeClass::VCC).empty());
    for (int id = 1; id <= 4; ++id)
    {
        EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(id), "subarrayMembership"), "0");
    }
}

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp
