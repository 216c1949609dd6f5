#include "TestSupport.h"
#include "../src/scanners/DeviceDiscoveryScanner.h"

namespace bacnet_scan {

using testing::_;
using testing::Invoke;
using testing::Return;

class DeviceDiscoveryTest : public ::testing::Test {
protected:
    static Config base_config() {
        Config c;
        c.known_subnets = {"10.0.0.0/24"};
        c.low_limit = 0;
        c.high_limit = 9999;
        c.full_step_size = 10;
        c.empty_step_size = 10000;
        return c;
    }
    void start(Config c = base_config()) {
        h = std::make_unique<ScanHarness>(std::move(c));
        h->report.start_scanner(scanner.name());
    }
    void answer_with(std::vector<IAmResponse> responses) {
        ON_CALL(h->app, who_is(_, _)).WillByDefault(Invoke([responses](DeviceInstance lo, DeviceInstance hi){
            std::vector<IAmResponse> out;
            for (const auto& r : responses) if (r.device_instance >= lo && r.device_instance <= hi) out.push_back(r);
            return ready_future(out);
        }));
    }

    std::unique_ptr<ScanHarness> h;
    DeviceDiscoveryScanner scanner;
};

TEST_F(DeviceDiscoveryTest, DeviceInDeclaredSubnet) {
    start();
    answer_with({i_am("10.0.0.5", 1234, 999)});
    scanner.scan(*h->context);

    const TopologyNode* n = h->graph.find("device://1234");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->type(), NodeType::Device);
    EXPECT_EQ(*n->address(), "10.0.0.5");
    EXPECT_EQ(*n->device_instance(), 1234u);
    EXPECT_EQ(node_key::vendor(*n->vendor_id()), "vendor://999");
    EXPECT_TRUE(n->has_relation(RelationKind::DeviceOnSubnet, "subnet://10.0.0.0/24"));
    EXPECT_EQ(h->state.subnets.synthesized_count(), 0u);
}

TEST_F(DeviceDiscoveryTest, SynthesizedSubnetReusedWithinScan) {
    start();
    answer_with({i_am("192.168.50.9", 10, 5), i_am("192.168.50.20", 11, 5)});
    scanner.scan(*h->context);

    EXPECT_TRUE(h->graph.find("device://10")->has_relation(RelationKind::DeviceOnSubnet, "subnet://192.168.50.0/24"));
    EXPECT_TRUE(h->graph.find("device://11")->has_relation(RelationKind::DeviceOnSubnet, "subnet://192.168.50.0/24"));
    EXPECT_EQ(h->state.subnets.synthesized_count(), 1u);
    size_t matching = 0;
    for (const auto& s : h->state.subnets.subnets()) if (s.to_string() == "192.168.50.0/24") ++matching;
    EXPECT_EQ(matching, 1u);
}

TEST_F(DeviceDiscoveryTest, ProbeClassifiesUnlistedBbmd) {
    start();
    answer_with({i_am("10.0.0.2", 20, 5)});
    Address bbmd = addr("10.0.0.2");
    EXPECT_CALL(h->app, send_bvll(bbmd, BvllFunction::ReadBroadcastDistributionTable))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_bdt(*h->bvll, a, f, {addr("10.0.0.2"), addr("10.0.1.2")}); }));
    scanner.scan(*h->context);

    EXPECT_EQ(h->graph.find("device://20"), nullptr);
    const TopologyNode* n = h->graph.find("bbmd://20");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->type(), NodeType::Bbmd);
    EXPECT_TRUE(n->has_relation(RelationKind::BbmdBroadcastDomain, "subnet://10.0.0.0/24"));
    EXPECT_EQ(h->state.bbmd_by_address.at(bbmd), "bbmd://20");
    ASSERT_EQ(h->state.bdt.at(bbmd).size(), 2u);
    EXPECT_EQ(h->state.bbmd_in_subnet.at(*Subnet::parse("10.0.0.0/24")).size(), 1u);
}

TEST_F(DeviceDiscoveryTest, FailedProbeLeavesPlainDevice) {
    start();
    answer_with({i_am("10.0.0.5", 30, 5)});
    EXPECT_CALL(h->app, send_bvll(_, _))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_nak(*h->bvll, a, f); }));
    scanner.scan(*h->context);
    ASSERT_NE(h->graph.find("device://30"), nullptr);
    EXPECT_EQ(h->graph.find("bbmd://30"), nullptr);
    EXPECT_EQ(h->bvll->pending(), 0u);
}

TEST_F(DeviceDiscoveryTest, AllowListedBbmdWithoutProbeAnswer) {
    Config c = base_config();
    c.configured_bbmds = {"10.0.0.3"};
    c.probe_bbmds = false;
    start(c);
    answer_with({i_am("10.0.0.3", 40, 5), i_am("10.0.0.4", 41, 5)});
    // Only the allow-listed address is read; the other device is never probed.
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.3"), BvllFunction::ReadBroadcastDistributionTable)).Times(1);
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.4"), _)).Times(0);
    scanner.scan(*h->context);
    EXPECT_NE(h->graph.find("bbmd://40"), nullptr);
    EXPECT_NE(h->graph.find("device://41"), nullptr);
}

TEST_F(DeviceDiscoveryTest, RemoteStationGoesToNetwork) {
    start();
    answer_with({i_am("5:0x21", 50, 5)});
    EXPECT_CALL(h->app, send_bvll(_, _)).Times(0);
    scanner.scan(*h->context);
    const TopologyNode* n = h->graph.find("device://50");
    ASSERT_NE(n, nullptr);
    EXPECT_TRUE(n->has_relation(RelationKind::DeviceOnNetwork, "network://5"));
    EXPECT_EQ(h->state.networks.count(5), 1u);
    EXPECT_TRUE(h->state.subnets.subnets().size() == 1u);
}

TEST_F(DeviceDiscoveryTest, AllowListedRemoteStationStaysDevice) {
    Config c = base_config();
    c.configured_bbmds = {"5:0x21"};
    start(c);
    answer_with({i_am("5:0x21", 50, 5)});
    EXPECT_CALL(h->app, send_bvll(_, _)).Times(0);
    scanner.scan(*h->context);
    EXPECT_EQ(h->graph.find("bbmd://50"), nullptr);
    const TopologyNode* n = h->graph.find("device://50");
    ASSERT_NE(n, nullptr);
    EXPECT_TRUE(n->has_relation(RelationKind::DeviceOnNetwork, "network://5"));
    EXPECT_TRUE(h->state.bbmd_by_address.empty());
}

TEST_F(DeviceDiscoveryTest, RepeatedIAmKeepsFirstClassification) {
    start();
    Address bbmd = addr("10.0.0.2");
    // Only the first BDT read is answered; a second read would time out.
    EXPECT_CALL(h->app, send_bvll(bbmd, BvllFunction::ReadBroadcastDistributionTable))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_bdt(*h->bvll, a, f, {addr("10.0.0.2")}); }));
    EXPECT_TRUE(scanner.record_i_am(*h->context, i_am("10.0.0.2", 20, 5)));
    EXPECT_TRUE(scanner.record_i_am(*h->context, i_am("10.0.0.2", 20, 5)));
    EXPECT_NE(h->graph.find("bbmd://20"), nullptr);
    EXPECT_EQ(h->graph.find("device://20"), nullptr);
    EXPECT_EQ(h->state.device_by_address.at(bbmd), "bbmd://20");
    EXPECT_EQ(h->report.counter(scanner.name(), "bdt_reads"), 1);
}

TEST_F(DeviceDiscoveryTest, RepeatedIAmFromPlainDeviceIsNotQueriedAgain) {
    start();
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.5"), _))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_nak(*h->bvll, a, f); }));
    EXPECT_TRUE(scanner.record_i_am(*h->context, i_am("10.0.0.5", 30, 5)));
    EXPECT_TRUE(scanner.record_i_am(*h->context, i_am("10.0.0.5", 30, 5)));
    EXPECT_EQ(h->graph.nodes_of_type(NodeType::Device).size(), 1u);
    EXPECT_TRUE(h->graph.nodes_of_type(NodeType::Bbmd).empty());
}

TEST_F(DeviceDiscoveryTest, NodesAreLabelledWithTheirKey) {
    start();
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.2"), _))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_bdt(*h->bvll, a, f, {}); }));
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.5"), _))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){ answer_nak(*h->bvll, a, f); }));
    scanner.record_i_am(*h->context, i_am("10.0.0.2", 20, 5));
    scanner.record_i_am(*h->context, i_am("10.0.0.5", 30, 5));
    EXPECT_EQ(*h->graph.find("bbmd://20")->label(), "bbmd://20");
    EXPECT_EQ(*h->graph.find("device://30")->label(), "device://30");
}

TEST_F(DeviceDiscoveryTest, MalformedResponsesAreSkipped) {
    start();
    EXPECT_FALSE(scanner.record_i_am(*h->context, i_am("10.0.0.5", 5000000, 5)));
    EXPECT_FALSE(scanner.record_i_am(*h->context, i_am("10.0.0.5", 12, 70000)));
    EXPECT_TRUE(scanner.record_i_am(*h->context, i_am("10.0.0.5", 12, 5)));
    EXPECT_EQ(h->graph.nodes_of_type(NodeType::Device).size(), 1u);
    EXPECT_EQ(h->report.counter(scanner.name(), "malformed_responses"), 2);
}

TEST_F(DeviceDiscoveryTest, WindowTimeoutAndErrorDoNotAbort) {
    Config c = base_config();
    c.empty_step_size = 1000;
    c.high_limit = 2999;
    start(c);
    PendingFutures<std::vector<IAmResponse>> never;
    EXPECT_CALL(h->app, who_is(0u, 1000u)).WillOnce(Invoke([&](DeviceInstance, DeviceInstance){ return never.make(); }));
    EXPECT_CALL(h->app, who_is(1001u, 2001u)).WillOnce(Invoke([](DeviceInstance, DeviceInstance) -> std::future<std::vector<IAmResponse>> { throw std::runtime_error("send failed"); }));
    EXPECT_CALL(h->app, who_is(2002u, 2999u)).WillOnce(Invoke([](DeviceInstance, DeviceInstance){
        return ready_future(std::vector<IAmResponse>{i_am("10.0.0.5", 2500, 1)}); }));
    scanner.scan(*h->context);
    EXPECT_NE(h->graph.find("device://2500"), nullptr);
    EXPECT_EQ(h->report.counter(scanner.name(), "window_timeouts"), 1);
    EXPECT_EQ(h->report.counter(scanner.name(), "window_errors"), 1);
    EXPECT_EQ(h->report.counter(scanner.name(), "windows"), 3);
}

TEST_F(DeviceDiscoveryTest, PriorDensityNarrowsWindows) {
    Config c = base_config();
    c.full_step_size = 2;
    c.empty_step_size = 1000;
    c.high_limit = 1999;
    start(c);
    TopologyGraph prior;
    for (DeviceInstance i : {10u, 20u, 30u}) prior.ensure_node(node_key::device(i), NodeType::Device).set_device_instance(i);
    h->context->prior = &prior;
    std::vector<std::pair<DeviceInstance, DeviceInstance>> seen;
    ON_CALL(h->app, who_is(_, _)).WillByDefault(Invoke([&](DeviceInstance lo, DeviceInstance hi){
        seen.emplace_back(lo, hi);
        return ready_future(std::vector<IAmResponse>{});
    }));
    scanner.scan(*h->context);
    ASSERT_GE(seen.size(), 3u);
    EXPECT_EQ(seen[0], std::make_pair(0u, 20u));
    EXPECT_EQ(seen[1], std::make_pair(21u, 1021u));
    EXPECT_EQ(seen.back().second, 1999u);
}

TEST_F(DeviceDiscoveryTest, StopRequestEndsSweep) {
    Config c = base_config();
    c.empty_step_size = 10;
    start(c);
    std::atomic<bool> stop{false};
    h->context->stop = &stop;
    int calls = 0;
    ON_CALL(h->app, who_is(_, _)).WillByDefault(Invoke([&](DeviceInstance, DeviceInstance){
        if (++calls == 2) stop.store(true);
        return ready_future(std::vector<IAmResponse>{});
    }));
    scanner.scan(*h->context);
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(h->report.warnings().empty());
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
