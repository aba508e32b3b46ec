#include "cbfmcs_cpp/subarray/test/ScanConfigDistributorTester.hpp"
#include "cbfmcs_cpp/subarray/Errors.hpp"
#include "cbfmcs_cpp/subarray/ScanConfigValidator.hpp"
#include <algorithm>

namespace cbfmcs_cpp {
namespace subarray {
namespace test {

ScanConfigDistributorTester::ScanConfigDistributorTester()
    : ::testing::Test()
{
}

ScanConfigDistributorTester::~ScanConfigDistributorTester()
{
}

void ScanConfigDistributorTester::SetUp()
{
    populate_test_config(_config);
    _fleet.populate(_config);
    _allocator.reset(new ResourceAllocator(_config, _fleet, _health));
    _scheduler.reset(new ModelUpdateScheduler(_sink));
    _scheduler->start();
    _distributor.reset(new ScanConfigDistributor(_config, _fleet, *_allocator, _health, *_scheduler));
    _allocator->allocate({1, 2});
}

void ScanConfigDistributorTester::TearDown()
{
    _distributor.reset();
    _scheduler.reset();
    _allocator.reset();
}

ScanConfiguration validated(SubarrayConfig const& config, FleetGateway& fleet,
    ResourceAllocator const& allocator, ptree const& doc)
{
    ScanConfigValidator validator(config, fleet, allocator);
    return validator.validate(to_json(doc));
}

ModelEntry model_entry(ModelType type, std::string const& destination_type = "")
{
    ModelEntry entry;
    entry.type = type;
    entry.epoch = 0.0;
    entry.destination_type = destination_type;
    entry.payload = "{\"receptor\":\"1\"}";
    return entry;
}

/**
 * Correlator configuration with output links and a visibility destination
 * address subscription point.
 */
ptree addressed_config(SubarrayConfig const& config)
{
    ptree doc = scan_config(config);
    doc.put("cbf.vis_destination_address_subscription_point",
        config.telemetry_node() + "/visDestinationAddress");
    doc.get_child("cbf.fsp").begin()->second.add_child("channel_averaging_map", averaging_map(8));
    return doc;
}

std::string destination_addresses(std::string const& config_id, std::vector<int> const& fsp_ids,
    std::string const& host = "10.0.0.1")
{
    ptree doc;
    doc.put("configId", config_id);
    ptree addresses;
    for (int fsp_id: fsp_ids)
    {
        ptree item;
        item.put("fspId", fsp_id);
        ptree channel;
        channel.put_value(0);
        ptree address;
        address.put_value(host);
        ptree entry;
        entry.push_back(std::make_pair("", channel));
        entry.push_back(std::make_pair("", address));
        ptree hosts;
        hosts.push_back(std::make_pair("", entry));
        item.add_child("hosts", hosts);
        addresses.push_back(std::make_pair("", item));
    }
    doc.add_child("receiveAddresses", addresses);
    return to_json(doc);
}

TEST_F(ScanConfigDistributorTester, distribute_configures_vccs_and_fsps)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    EXPECT_TRUE(_distributor->configured());
    for (int vcc_id: {1, 2})
    {
        std::string vcc = _config.vcc_name(vcc_id);
        EXPECT_EQ(_fleet.count(vcc, "ConfigureBand"), 1u);
        EXPECT_EQ(_fleet.count(vcc, "ConfigureScan"), 1u);
        EXPECT_EQ(_fleet.read_attribute(vcc, "frequencyBand"), "1");
        EXPECT_EQ(_fleet.read_attribute(vcc, "obsState"), "READY");
    }
    EXPECT_EQ(_fleet.count(_config.vcc_name(3), "ConfigureScan"), 0u);

    std::string fsp = _config.fsp_name(1);
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    EXPECT_EQ(_fleet.read_attribute(fsp, "subarrayMembership"), "1");
    EXPECT_EQ(_fleet.read_attribute(fsp, "functionMode"), "CORR");
    EXPECT_EQ(_fleet.count(corr, "ConfigureScan"), 1u);
    EXPECT_EQ(_fleet.read_attribute(corr, "obsState"), "READY");

    EXPECT_TRUE(_distributor->fsp_group().contains(fsp));
    EXPECT_TRUE(_distributor->mode_group(FunctionMode::CORR).contains(corr));
    EXPECT_TRUE(_distributor->mode_group(FunctionMode::PSS_BF).empty());
    EXPECT_TRUE(_distributor->has_assignments());
    EXPECT_TRUE(_health.is_tracked(NodeClass::FSP, fsp));
    EXPECT_EQ(_fleet.subscription_count(_config.telemetry_node()), 1u);
    EXPECT_TRUE(_distributor->output_links_distribution().empty());
}

TEST_F(ScanConfigDistributorTester, fsp_payload_describes_subarray)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    auto scans = _fleet.commands("ConfigureScan");
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    std::string payload;
    for (auto const& record: scans)
    {
        if (record.node == corr)
        {
            payload = record.payload;
        }
    }
    ASSERT_FALSE(payload.empty());
    auto tree = json::parse(payload);
    EXPECT_EQ(tree.get<std::string>("config_id"), "scan_config_1");
    EXPECT_EQ(tree.get<int>("subarray_id"), 1);
    EXPECT_EQ(json::values<int>(tree.get_child("subarray_vcc_ids"), "subarray_vcc_ids"), std::vector<int>({1, 2}));
    EXPECT_EQ(json::values<int>(tree.get_child("fsp_vcc_ids"), "fsp_vcc_ids"), std::vector<int>({1, 2}));
    EXPECT_EQ(tree.get_child("fs_sample_rates").size(), 2u);
}

TEST_F(ScanConfigDistributorTester, output_links_published_for_averaging_map)
{
    ptree doc = scan_config(_config);
    doc.get_child("cbf.fsp").begin()->second.add_child("channel_averaging_map", averaging_map(8));
    _distributor->distribute(validated(_config, _fleet, *_allocator, doc));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    EXPECT_EQ(_fleet.count(corr, "AddChannels"), 1u);
    std::string links = _distributor->output_links_distribution();
    ASSERT_FALSE(links.empty());
    auto tree = json::parse(links);
    EXPECT_EQ(tree.get<std::string>("config_id"), "scan_config_1");
}

TEST_F(ScanConfigDistributorTester, telemetry_updates_reach_scheduler)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    _fleet.push_event(_config.telemetry_node(), "delayModel",
        model_document(ModelType::DELAY_MODEL, {0.0}));
    ASSERT_TRUE(_scheduler->wait_until_idle(ModelType::DELAY_MODEL, std::chrono::milliseconds(5000)));
    EXPECT_EQ(_sink.entries().size(), 1u);
}

TEST_F(ScanConfigDistributorTester, destination_addresses_sent_to_correlator_fsps)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, addressed_config(_config)));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    EXPECT_EQ(_fleet.subscription_count(_config.telemetry_node()), 2u);

    std::string addresses = destination_addresses("scan_config_1", {1});
    _fleet.push_event(_config.telemetry_node(), "visDestinationAddress", addresses);
    auto sent = _fleet.commands("AddChannelAddresses");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].node, corr);
    EXPECT_EQ(sent[0].payload, addresses);

    // Repeats are dropped
    _fleet.push_event(_config.telemetry_node(), "visDestinationAddress", addresses);
    EXPECT_EQ(_fleet.count(corr, "AddChannelAddresses"), 1u);

    // FSP 2 is not part of this configuration
    EXPECT_FALSE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1, 2})));
    // Addresses for another configuration
    EXPECT_FALSE(_distributor->on_destination_addresses(destination_addresses("scan_config_0", {1})));
    EXPECT_FALSE(_distributor->on_destination_addresses("{\"configId\": "));
    EXPECT_EQ(_fleet.count(corr, "AddChannelAddresses"), 1u);

    EXPECT_TRUE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1}, "10.0.0.2")));
    EXPECT_EQ(_fleet.count(corr, "AddChannelAddresses"), 2u);
}

TEST_F(ScanConfigDistributorTester, destination_addresses_held_until_output_links)
{
    // The current value is delivered on subscription, before links exist
    _fleet.push_event(_config.telemetry_node(), "visDestinationAddress",
        destination_addresses("scan_config_1", {1}));
    _distributor->distribute(validated(_config, _fleet, *_allocator, addressed_config(_config)));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    auto records = _fleet.commands();
    auto links = std::find_if(records.begin(), records.end(),
        [&corr](CommandRecord const& r) { return r.node == corr && r.command == "AddChannels"; });
    auto addresses = std::find_if(records.begin(), records.end(),
        [&corr](CommandRecord const& r) { return r.node == corr && r.command == "AddChannelAddresses"; });
    ASSERT_TRUE(links != records.end());
    ASSERT_TRUE(addresses != records.end());
    EXPECT_LT(links - records.begin(), addresses - records.begin());
}

TEST_F(ScanConfigDistributorTester, destination_addresses_need_output_links)
{
    ptree doc = scan_config(_config);
    doc.put("cbf.vis_destination_address_subscription_point",
        _config.telemetry_node() + "/visDestinationAddress");
    _distributor->distribute(validated(_config, _fleet, *_allocator, doc));
    _fleet.push_event(_config.telemetry_node(), "visDestinationAddress",
        destination_addresses("scan_config_1", {1}));
    EXPECT_TRUE(_fleet.commands("AddChannelAddresses").empty());
}

TEST_F(ScanConfigDistributorTester, destination_addresses_ignored_while_scanning)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, addressed_config(_config)));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    _distributor->scan(3);
    EXPECT_FALSE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1})));
    _distributor->end_scan();
    EXPECT_TRUE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1})));
    EXPECT_EQ(_fleet.count(corr, "AddChannelAddresses"), 1u);

    _distributor->abort();
    EXPECT_FALSE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1}, "10.0.0.9")));
    _distributor->deconfigure();
    EXPECT_FALSE(_distributor->on_destination_addresses(destination_addresses("scan_config_1", {1}, "10.0.0.9")));
    EXPECT_EQ(_fleet.count(corr, "AddChannelAddresses"), 1u);
}

TEST_F(ScanConfigDistributorTester, deconfigure_returns_nodes_to_idle)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    std::string fsp = _config.fsp_name(1);
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    _fleet.clear_commands();

    _distributor->deconfigure();
    EXPECT_EQ(_fleet.count(fsp, "RemoveSubarrayMembership"), 1u);
    EXPECT_EQ(_fleet.count(corr, "GoToIdle"), 1u);
    EXPECT_EQ(_fleet.count(_config.vcc_name(1), "GoToIdle"), 1u);
    EXPECT_EQ(_fleet.read_attribute(fsp, "subarrayMembership"), "");
    EXPECT_EQ(_fleet.read_attribute(fsp, "functionMode"), "IDLE");
    EXPECT_FALSE(_distributor->configured());
    EXPECT_FALSE(_distributor->has_assignments());
    EXPECT_FALSE(_health.is_tracked(NodeClass::FSP, fsp));
    EXPECT_EQ(_fleet.subscription_count(_config.telemetry_node()), 0u);
    EXPECT_EQ(_fleet.subscription_count(fsp), 0u);

    _fleet.clear_commands();
    _distributor->deconfigure();
    EXPECT_TRUE(_fleet.commands().empty());
}

TEST_F(ScanConfigDistributorTester, deconfigure_when_unconfigured_sends_nothing)
{
    _distributor->deconfigure();
    EXPECT_TRUE(_fleet.commands().empty());
}

TEST_F(ScanConfigDistributorTester, remote_failure_leaves_partial_configuration)
{
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    _fleet.fail_command(corr, "ConfigureScan", true);
    auto config = validated(_config, _fleet, *_allocator, scan_config(_config));
    EXPECT_THROW(_distributor->distribute(config), RemoteCallFailed);
    EXPECT_TRUE(_distributor->has_assignments());
    _distributor->deconfigure();
    EXPECT_FALSE(_distributor->has_assignments());
    EXPECT_EQ(_fleet.read_attribute(_config.fsp_name(1), "subarrayMembership"), "");
}

TEST_F(ScanConfigDistributorTester, scan_lifecycle)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    _distributor->scan(7);
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(1), "obsState"), "SCANNING");
    EXPECT_EQ(_fleet.read_attribute(corr, "obsState"), "SCANNING");
    auto scans = _fleet.commands("Scan");
    ASSERT_EQ(scans.size(), 3u);
    EXPECT_EQ(scans[0].payload, "7");

    _distributor->end_scan();
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(2), "obsState"), "READY");
    EXPECT_EQ(_fleet.read_attribute(corr, "obsState"), "READY");
}

TEST_F(ScanConfigDistributorTester, abort_continues_past_failures)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    std::string corr = _config.fsp_subarray_name(FunctionMode::CORR, 1);
    _fleet.fail_command(_config.vcc_name(1), "Abort", true);
    _distributor->abort();
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(2), "obsState"), "ABORTED");
    EXPECT_EQ(_fleet.read_attribute(corr, "obsState"), "ABORTED");

    _distributor->obs_reset();
    EXPECT_EQ(_fleet.read_attribute(_config.vcc_name(1), "obsState"), "IDLE");
    EXPECT_EQ(_fleet.read_attribute(corr, "obsState"), "IDLE");
}

TEST_F(ScanConfigDistributorTester, model_fan_out_destinations)
{
    _distributor->distribute(validated(_config, _fleet, *_allocator, scan_config(_config)));
    std::string vcc = _config.vcc_name(1);
    std::string fsp = _config.fsp_name(1);

    _distributor->fan_out(model_entry(ModelType::DELAY_MODEL));
    EXPECT_EQ(_fleet.count("UpdateDelayModel"), 3u);
    EXPECT_EQ(_fleet.count(vcc, "UpdateDelayModel"), 1u);
    EXPECT_EQ(_fleet.count(fsp, "UpdateDelayModel"), 1u);

    _distributor->fan_out(model_entry(ModelType::BEAM_WEIGHTS));
    EXPECT_EQ(_fleet.count("UpdateBeamWeights"), 1u);
    EXPECT_EQ(_fleet.count(fsp, "UpdateBeamWeights"), 1u);

    _distributor->fan_out(model_entry(ModelType::JONES_MATRIX, "vcc"));
    EXPECT_EQ(_fleet.count("UpdateJonesMatrix"), 2u);
    EXPECT_EQ(_fleet.count(fsp, "UpdateJonesMatrix"), 0u);

    _distributor->fan_out(model_entry(ModelType::BEAM_WEIGHTS, "vcc"));
    EXPECT_EQ(_fleet.count("UpdateBeamWeights"), 1u);
}

} //namespace test
} //namespace subarray
} //namespace cbfmcs_cpp
