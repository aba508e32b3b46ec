#include "cbfmcs_cpp/subarray/test/HealthAggregatorTester.hpp"

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

ChangeEvent make_event(NodeClass node_class, std::string const& node,
    std::string const& attribute, std::string const& value)
{
    return ChangeEvent{node, node_class, attribute, value, false, ""};
}

HealthAggregatorTester::HealthAggregatorTester()
    : ::testing::Test()
{
}

HealthAggregatorTester::~HealthAggregatorTester()
{
}

void HealthAggregatorTester::SetUp()
{
}

void HealthAggregatorTester::TearDown()
{
}

TEST_F(HealthAggregatorTester, tracked_nodes_start_unknown)
{
    HealthAggregator health;
    health.track(NodeClass::VCC, "vcc/003");
    auto status = health.status(NodeClass::VCC, "vcc/003");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->state, HealthAggregator::unknown);
    EXPECT_EQ(status->health_state, HealthAggregator::unknown);
}

TEST_F(HealthAggregatorTester, views_keep_insertion_order)
{
    HealthAggregator health;
    health.track(NodeClass::VCC, "vcc/003");
    health.track(NodeClass::VCC, "vcc/001");
    health.track(NodeClass::VCC, "vcc/002");
    health.track(NodeClass::VCC, "vcc/001");
    health.track(NodeClass::FSP, "fsp/01");
    auto view = health.view(NodeClass::VCC);
    ASSERT_EQ(view.size(), 3u);
    EXPECT_EQ(view[0].node, "vcc/003");
    EXPECT_EQ(view[1].node, "vcc/001");
    EXPECT_EQ(view[2].node, "vcc/002");
    EXPECT_EQ(health.view(NodeClass::FSP).size(), 1u);
}

TEST_F(HealthAggregatorTester, events_update_tracked_nodes)
{
    HealthAggregator health;
    health.track(NodeClass::VCC, "vcc/001");
    EXPECT_TRUE(health.on_change_event(make_event(NodeClass::VCC, "vcc/001", "State", "ON")));
    EXPECT_TRUE(health.on_change_event(make_event(NodeClass::VCC, "vcc/001", "healthState", "DEGRADED")));
    EXPECT_FALSE(health.on_change_event(make_event(NodeClass::VCC, "vcc/001", "obsState", "READY")));
    auto status = health.status(NodeClass::VCC, "vcc/001");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->state, "ON");
    EXPECT_EQ(status->health_state, "DEGRADED");
}

TEST_F(HealthAggregatorTester, events_for_untracked_nodes_are_discarded)
{
    HealthAggregator health;
    health.track(NodeClass::VCC, "vcc/001");
    // Same name under another node class is a different node
    EXPECT_FALSE(health.on_change_event(make_event(NodeClass::FSP, "vcc/001", "State", "OFF")));
    EXPECT_FALSE(health.on_change_event(make_event(NodeClass::VCC, "vcc/002", "State", "OFF")));
    EXPECT_EQ(health.status(NodeClass::VCC, "vcc/001")->state, HealthAggregator::unknown);
    EXPECT_FALSE(health.status(NodeClass::VCC, "vcc/002"));
}

TEST_F(HealthAggregatorTester, error_event_marks_attribute_unknown)
{
    HealthAggregator health;
    health.track(NodeClass::FSP, "fsp/01");
    EXPECT_TRUE(health.on_change_event(make_event(NodeClass::FSP, "fsp/01", "State", "ON")));
    EXPECT_TRUE(health.on_change_event(make_event(NodeClass::FSP, "fsp/01", "healthState", "OK")));
    ChangeEvent event = make_event(NodeClass::FSP, "fsp/01", "State", "");
    event.error = true;
    event.error_message = "device not exported";
    EXPECT_TRUE(health.on_change_event(event));
    EXPECT_EQ(health.status(NodeClass::FSP, "fsp/01")->state, HealthAggregator::unknown);
    EXPECT_EQ(health.status(NodeClass::FSP, "fsp/01")->health_state, "OK");

    event.attribute = "healthState";
    EXPECT_TRUE(health.on_change_event(event));
    EXPECT_EQ(health.status(NodeClass::FSP, "fsp/01")->health_state, HealthAggregator::unknown);

    // Errors from untracked nodes change nothing
    event.node = "fsp/02";
    EXPECT_FALSE(health.on_change_event(event));
    EXPECT_FALSE(health.status(NodeClass::FSP, "fsp/02"));
}

TEST_F(HealthAggregatorTester, untrack_removes_entries)
{
    HealthAggregator health;
    health.track(NodeClass::FSP, "fsp/01");
    health.track(NodeClass::FSP, "fsp/02");
    health.untrack(NodeClass::FSP, "fsp/01");
    EXPECT_FALSE(health.is_tracked(NodeClass::FSP, "fsp/01"));
    EXPECT_TRUE(health.is_tracked(NodeClass::FSP, "fsp/02"));
    health.untrack_all(NodeClass::FSP);
    EXPECT_TRUE(health.view(NodeClass::FSP).empty());
}

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp
