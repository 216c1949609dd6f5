#include "RouterDiscoveryScanner.h"
#include "../core/ScanContext.h"
#include "../core/Logging.h"

namespace bacnet_scan {

void RouterDiscoveryScanner::record_router(ScanContext& context, const RouterAnnouncement& announcement){
    const Address& addr = announcement.router_address;
    std::string key = node_key::router(addr);
    TopologyNode& node = context.graph.ensure_node(key, NodeType::Router);
    node.set_address(addr.to_string());
    context.report.add_counter(name(), "announcements");

    for(long long n : announcement.networks){
        if(!valid_network_number(n)){
            Logger::instance().warn("router " + addr.to_string() + " announced invalid network " + std::to_string(n));
            context.report.add_counter(name(), "malformed_responses");
            continue;
        }
        auto net = static_cast<NetworkNumber>(n);
        context.state.announced_networks.insert(net);
        node.add_relation(RelationKind::RouterToNetwork, node_key::network(net));
    }

    // Routers are placed only in subnets already known to the scan.
    auto ip = addr.to_ip();
    auto subnet = ip ? context.state.subnets.find(*ip) : std::nullopt;
    if(subnet){
        node.add_relation(RelationKind::DeviceOnSubnet, node_key::subnet(*subnet));
        return;
    }
    TopologyNode* self = context.graph.find(context.state.scanner_key);
    if(!self){
        Logger::instance().warn("router " + addr.to_string() + " matches no subnet and there is no scanner node");
        return;
    }
    if(self->add_relation(RelationKind::UnassociatedRouter, key)) context.report.add_counter(name(), "unassociated");
}

void RouterDiscoveryScanner::scan(ScanContext& context){
    auto timeout = std::chrono::milliseconds(context.config.discovery_timeout_ms);
    // Copy: announcements must not extend the set being walked.
    const std::set<NetworkNumber> networks = context.state.networks;
    for(NetworkNumber net : networks){
        if(context.stop_requested()) break;
        context.report.add_counter(name(), "queries");
        std::vector<RouterAnnouncement> routers;
        try {
            auto fut = context.app.who_is_router_to_network(net);
            auto got = await_for(fut, timeout);
            if(!got){
                Logger::instance().warn("Who-Is-Router-To-Network " + std::to_string(net) + " timed out");
                context.report.add_counter(name(), "timeouts");
                continue;
            }
            routers = std::move(*got);
        } catch(const std::exception& ex){
            Logger::instance().warn("Who-Is-Router-To-Network " + std::to_string(net) + " failed: " + ex.what());
            context.report.add_counter(name(), "errors");
            continue;
        }
        for(const auto& r : routers) record_router(context, r);
    }
}

}
