#include "TestSupport.h"
#include "../src/scanners/RouterDiscoveryScanner.h"

namespace bacnet_scan {

using testing::_;
using testing::Invoke;

class RouterDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config c;
        c.known_subnets = {"10.0.0.0/24"};
        h = std::make_unique<ScanHarness>(c);
        h->graph.ensure_node(h->state.scanner_key, NodeType::Scanner);
        h->report.start_scanner(scanner.name());
    }
    static RouterAnnouncement router(const std::string& address, std::vector<long long> networks){
        RouterAnnouncement r;
        r.adapter = "eth0";
        r.router_address = addr(address);
        r.networks = std::move(networks);
        return r;
    }

    std::unique_ptr<ScanHarness> h;
    RouterDiscoveryScanner scanner;
};

TEST_F(RouterDiscoveryTest, AnnouncedNetworksBecomeRelations) {
    scanner.record_router(*h->context, router("10.0.0.1", {5, 6}));
    const TopologyNode* n = h->graph.find("router://10.0.0.1");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->type(), NodeType::Router);
    EXPECT_EQ(n->targets(RelationKind::RouterToNetwork), (std::vector<std::string>{"network://5", "network://6"}));
    EXPECT_TRUE(n->has_relation(RelationKind::DeviceOnSubnet, "subnet://10.0.0.0/24"));
    EXPECT_EQ(h->state.announced_networks, (std::set<NetworkNumber>{5, 6}));
}

TEST_F(RouterDiscoveryTest, RepeatedAnnouncementDoesNotDuplicate) {
    scanner.record_router(*h->context, router("10.0.0.1", {5}));
    scanner.record_router(*h->context, router("10.0.0.1", {5}));
    EXPECT_EQ(h->graph.find("router://10.0.0.1")->targets(RelationKind::RouterToNetwork).size(), 1u);
    EXPECT_EQ(h->graph.nodes_of_type(NodeType::Router).size(), 1u);
}

TEST_F(RouterDiscoveryTest, UnknownSubnetHangsOffScanner) {
    scanner.record_router(*h->context, router("172.16.3.1", {9}));
    const TopologyNode* self = h->graph.find(h->state.scanner_key);
    ASSERT_NE(self, nullptr);
    EXPECT_TRUE(self->has_relation(RelationKind::UnassociatedRouter, "router://172.16.3.1"));
    EXPECT_TRUE(h->graph.find("router://172.16.3.1")->targets(RelationKind::DeviceOnSubnet).empty());
    // Routers never synthesize subnets.
    EXPECT_EQ(h->state.subnets.synthesized_count(), 0u);
    EXPECT_EQ(h->report.counter(scanner.name(), "unassociated"), 1);
}

TEST_F(RouterDiscoveryTest, InvalidNetworkNumbersAreSkipped) {
    scanner.record_router(*h->context, router("10.0.0.1", {-1, 65535, 7}));
    EXPECT_EQ(h->graph.find("router://10.0.0.1")->targets(RelationKind::RouterToNetwork), std::vector<std::string>{"network://7"});
    EXPECT_EQ(h->report.counter(scanner.name(), "malformed_responses"), 2);
}

TEST_F(RouterDiscoveryTest, QueriesEachNetworkSeenDuringDiscovery) {
    h->state.networks = {5, 8};
    EXPECT_CALL(h->app, who_is_router_to_network(5)).WillOnce(Invoke([this](NetworkNumber){
        // An announcement naming a new network must not trigger another query.
        return ready_future(std::vector<RouterAnnouncement>{router("10.0.0.1", {5, 12})});
    }));
    PendingFutures<std::vector<RouterAnnouncement>> never;
    EXPECT_CALL(h->app, who_is_router_to_network(8)).WillOnce(Invoke([&](NetworkNumber){ return never.make(); }));
    EXPECT_CALL(h->app, who_is_router_to_network(12)).Times(0);
    scanner.scan(*h->context);

    EXPECT_NE(h->graph.find("router://10.0.0.1"), nullptr);
    EXPECT_EQ(h->report.counter(scanner.name(), "queries"), 2);
    EXPECT_EQ(h->report.counter(scanner.name(), "timeouts"), 1);
}

TEST_F(RouterDiscoveryTest, TransportFailureIsCounted) {
    h->state.networks = {3};
    EXPECT_CALL(h->app, who_is_router_to_network(3)).WillOnce(Invoke([](NetworkNumber){
        std::promise<std::vector<RouterAnnouncement>> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("socket closed")));
        return p.get_future();
    }));
    EXPECT_NO_THROW(scanner.scan(*h->context));
    EXPECT_EQ(h->report.counter(scanner.name(), "errors"), 1);
    EXPECT_TRUE(h->graph.nodes_of_type(NodeType::Router).empty());
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
