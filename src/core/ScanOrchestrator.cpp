#include "ScanOrchestrator.h"
#include "ScanContext.h"
#include "Logging.h"
#include "../bacnet/BvllServiceElement.h"

namespace bacnet_scan {

ScanOrchestrator::ScanOrchestrator(const Config& cfg, ApplicationFactory factory)
    : cfg_(cfg), factory_(std::move(factory)) {}

ScanState ScanOrchestrator::prepare_state(const Config& cfg){
    ScanState state;
    state.subnets = SubnetIndex(cfg.synthesized_prefix);
    for(const auto& text : cfg.known_subnets){
        auto s = Subnet::parse(text);
        if(!s) throw ScanSetupError("invalid known subnet '" + text + "'");
        state.subnets.add(*s);
    }
    for(const auto& text : cfg.configured_bbmds){
        auto a = Address::parse(text);
        if(!a) throw ScanSetupError("invalid BBMD address '" + text + "'");
        if(!state.is_configured_bbmd(*a)) state.configured_bbmds.push_back(*a);
    }
    auto local = parse_local_address(cfg.local_address);
    if(!local) throw ScanSetupError("invalid local address '" + cfg.local_address + "'");
    if(local->subnet) state.subnets.add(*local->subnet);
    if(!valid_device_instance(cfg.local_instance_id)) throw ScanSetupError("local instance id out of range");
    state.scanner_key = node_key::scanner(static_cast<DeviceInstance>(cfg.local_instance_id));
    return state;
}

void ScanOrchestrator::add_scanner_node(TopologyGraph& graph, ScanState& state) const {
    TopologyNode& self = graph.ensure_node(state.scanner_key, NodeType::Scanner);
    self.set_label(cfg_.local_name);
    self.set_device_instance(static_cast<DeviceInstance>(cfg_.local_instance_id));
    if(cfg_.vendor_identifier >= 0 && cfg_.vendor_identifier <= 0xFFFF) self.set_vendor_id(static_cast<std::uint32_t>(cfg_.vendor_identifier));
    auto local = parse_local_address(cfg_.local_address);
    if(local){
        self.set_address(local->address.to_string());
        // 0.0.0.0 means "any interface"; there is no subnet to place it in.
        auto ip = local->address.to_ip();
        if(ip && ip->value != 0) associate_subnet(self, local->address, state.subnets);
    }
    if(cfg_.local_network > 0 && valid_network_number(cfg_.local_network)){
        auto net = static_cast<NetworkNumber>(cfg_.local_network);
        state.networks.insert(net);
        self.add_relation(RelationKind::DeviceOnNetwork, node_key::network(net));
    }
}

void ScanOrchestrator::finalize(TopologyGraph& graph, const ScanState& state){
    for(const auto& s : state.subnets.subnets()){
        graph.ensure_node(node_key::subnet(s), NodeType::Subnet).set_label(s.to_string());
    }
    std::set<NetworkNumber> all = state.networks;
    all.insert(state.announced_networks.begin(), state.announced_networks.end());
    for(NetworkNumber n : all){
        graph.ensure_node(node_key::network(n), NodeType::Network).set_label("network " + std::to_string(n));
    }
}

namespace {
// Detaches the listener and closes the application on every exit path.
struct ApplicationSession {
    BacnetApplication& app;
    ~ApplicationSession(){
        app.bind(nullptr);
        app.close();
    }
};
}

TopologyGraph ScanOrchestrator::run(Report& report, const TopologyGraph* prior, const std::atomic<bool>* stop){
    ScanState state = prepare_state(cfg_);
    if(!factory_) throw ScanSetupError("no BACnet application factory");
    std::unique_ptr<BacnetApplication> app;
    try {
        app = factory_(cfg_);
    } catch(const std::exception& ex){
        throw ScanSetupError(std::string("cannot create BACnet application: ") + ex.what());
    }
    if(!app) throw ScanSetupError("cannot create BACnet application");

    BvllServiceElement bvll(*app, std::chrono::milliseconds(cfg_.request_timeout_ms));
    app->bind(&bvll);
    ApplicationSession session{*app};

    TopologyGraph graph;
    add_scanner_node(graph, state);

    if(!custom_registry_){
        registry_ = ScannerRegistry();
        registry_.register_all_default();
    }
    ScanContext context(cfg_, report, graph, state, *app, bvll);
    context.prior = prior;
    context.stop = stop;
    Logger::instance().info("scan " + std::to_string(cfg_.low_limit) + "-" + std::to_string(cfg_.high_limit) + (prior ? " with prior density hint" : ""));
    registry_.run_all(context);

    finalize(graph, state);
    if(bvll.pending() != 0) Logger::instance().warn("BVLL requests still pending after scan: " + std::to_string(bvll.pending()));
    Logger::instance().info("scan complete: " + std::to_string(graph.node_count()) + " nodes, " + std::to_string(graph.relation_count()) + " relations");
    return graph;
}

}
