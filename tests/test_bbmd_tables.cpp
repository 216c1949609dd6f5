#include "TestSupport.h"
#include "../src/scanners/BbmdTableScanner.h"

namespace bacnet_scan {

using testing::_;
using testing::Invoke;

class BbmdTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config c;
        c.configured_bbmds = {"10.0.0.2", "10.0.1.2"};
        h = std::make_unique<ScanHarness>(c);
        h->report.start_scanner(scanner.name());
    }
    // Places a discovered BBMD or device the way device discovery would.
    void discovered(const std::string& address, DeviceInstance instance, bool bbmd){
        std::string key = bbmd ? node_key::bbmd(instance) : node_key::device(instance);
        TopologyNode& n = h->graph.ensure_node(key, bbmd ? NodeType::Bbmd : NodeType::Device);
        n.set_device_instance(instance);
        n.set_address(address);
        h->state.device_by_address[addr(address)] = key;
        if(bbmd) h->state.bbmd_by_address[addr(address)] = key;
    }

    std::unique_ptr<ScanHarness> h;
    BbmdTableScanner scanner;
};

TEST_F(BbmdTableTest, BdtPeersBecomeBdtEntries) {
    discovered("10.0.0.2", 1, true);
    discovered("10.0.1.2", 2, true);
    h->state.bdt[addr("10.0.0.2")] = {addr("10.0.0.2"), addr("10.0.1.2"), addr("10.9.9.9")};
    scanner.resolve_bdt_entries(*h->context);

    const TopologyNode* b1 = h->graph.find("bbmd://1");
    EXPECT_EQ(b1->targets(RelationKind::BdtEntry), std::vector<std::string>{"bbmd://2"});
    EXPECT_FALSE(b1->has_relation(RelationKind::BdtEntry, "bbmd://1"));
    EXPECT_EQ(h->report.counter(scanner.name(), "unresolved_bdt_entries"), 1);
}

TEST_F(BbmdTableTest, ForeignDeviceTablesReadFromConfiguredBbmds) {
    discovered("10.0.0.2", 1, true);
    discovered("10.0.5.7", 77, false);
    EXPECT_CALL(h->app, send_bvll(addr("10.0.0.2"), BvllFunction::ReadForeignDeviceTable))
        .WillOnce(Invoke([this](const Address& a, BvllFunction f){
            BvllAck ack;
            ack.function = f;
            ack.source = a;
            ack.fdt = {FdtEntry{addr("10.0.5.7"), 60, 45}, FdtEntry{addr("10.0.5.8"), 60, 10}};
            h->bvll->confirmation(ack);
        }));
    // The second BBMD never answers.
    EXPECT_CALL(h->app, send_bvll(addr("10.0.1.2"), BvllFunction::ReadForeignDeviceTable)).Times(1);
    scanner.scan(*h->context);

    EXPECT_TRUE(h->graph.find("bbmd://1")->has_relation(RelationKind::FdrEntry, "device://77"));
    EXPECT_EQ(h->state.fdt.at(addr("10.0.0.2")).size(), 2u);
    EXPECT_EQ(h->state.fdt.count(addr("10.0.1.2")), 0u);
    EXPECT_EQ(h->report.counter(scanner.name(), "fdr_entries"), 1);
    EXPECT_EQ(h->report.counter(scanner.name(), "unresolved_fdt_entries"), 1);
    EXPECT_EQ(h->report.counter(scanner.name(), "fdt_failures"), 1);
    EXPECT_EQ(h->bvll->pending(), 0u);
}

TEST_F(BbmdTableTest, TablesOfUndiscoveredBbmdsAreIgnored) {
    discovered("10.0.5.7", 77, false);
    h->state.fdt[addr("10.0.1.2")] = {FdtEntry{addr("10.0.5.7"), 60, 45}};
    h->state.bdt[addr("10.0.1.2")] = {addr("10.0.0.2")};
    scanner.resolve_bdt_entries(*h->context);
    scanner.resolve_fdt_entries(*h->context);
    EXPECT_EQ(h->graph.relation_count(), 0u);
}

TEST_F(BbmdTableTest, StopSkipsRemainingReads) {
    std::atomic<bool> stop{true};
    h->context->stop = &stop;
    EXPECT_CALL(h->app, send_bvll(_, _)).Times(0);
    scanner.read_foreign_device_tables(*h->context);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
