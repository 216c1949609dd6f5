#include "DeviceDiscoveryScanner.h"
#include "WindowPlanner.h"
#include "../core/ScanContext.h"
#include "../core/Logging.h"
#include <algorithm>

namespace bacnet_scan {

bool DeviceDiscoveryScanner::classify_bbmd(ScanContext& context, const Address& address){
    bool configured = context.state.is_configured_bbmd(address);
    // BVLL is BACnet/IP only; a station behind a router is never a BBMD.
    if(!address.to_ip()){
        if(configured) Logger::instance().warn("configured BBMD " + address.to_string() + " is not a BACnet/IP address; treating it as a device");
        return false;
    }
    if(!configured && !context.config.probe_bbmds) return false;
    context.report.add_counter(name(), "bdt_reads");
    auto table = context.bvll.read_broadcast_distribution_table(address);
    if(!table) return configured;
    context.state.bdt[address] = std::move(*table);
    return true;
}

bool DeviceDiscoveryScanner::record_i_am(ScanContext& context, const IAmResponse& iam){
    if(!valid_device_instance(iam.device_instance)){
        Logger::instance().warn("I-Am from " + iam.address.to_string() + " with out of range instance " + std::to_string(iam.device_instance));
        context.report.add_counter(name(), "malformed_responses");
        return false;
    }
    if(iam.vendor_id < 0 || iam.vendor_id > 0xFFFF){
        Logger::instance().warn("I-Am from " + iam.address.to_string() + " with invalid vendor id " + std::to_string(iam.vendor_id));
        context.report.add_counter(name(), "malformed_responses");
        return false;
    }
    auto instance = static_cast<DeviceInstance>(iam.device_instance);
    // An address already seen in this scan keeps its first classification.
    bool bbmd;
    auto seen = context.state.device_by_address.find(iam.address);
    if(seen != context.state.device_by_address.end()) bbmd = type_from_key(seen->second) == NodeType::Bbmd;
    else bbmd = classify_bbmd(context, iam.address);
    NodeType type = bbmd ? NodeType::Bbmd : NodeType::Device;
    std::string key = bbmd ? node_key::bbmd(instance) : node_key::device(instance);

    TopologyNode& node = context.graph.ensure_node(key, type);
    node.set_label(key);
    node.set_device_instance(instance);
    node.set_address(iam.address.to_string());
    node.set_vendor_id(static_cast<std::uint32_t>(iam.vendor_id));
    context.state.device_by_address[iam.address] = key;
    context.report.add_counter(name(), bbmd ? "bbmds" : "devices");

    if(auto subnet = associate_subnet(node, iam.address, context.state.subnets)){
        if(bbmd){
            context.state.bbmd_by_address[iam.address] = key;
            auto& members = context.state.bbmd_in_subnet[*subnet];
            if(std::find(members.begin(), members.end(), key) == members.end()) members.push_back(key);
        }
    } else {
        // Remote station: the network number is all we can place it by.
        NetworkNumber net = iam.address.network();
        context.state.networks.insert(net);
        node.add_relation(RelationKind::DeviceOnNetwork, node_key::network(net));
    }
    return true;
}

void DeviceDiscoveryScanner::scan(ScanContext& context){
    const auto& cfg = context.config;
    std::vector<DeviceInstance> known;
    if(context.prior) known = context.prior->device_instances();
    WindowPlanner planner(static_cast<DeviceInstance>(cfg.low_limit), static_cast<DeviceInstance>(cfg.high_limit), cfg.full_step_size, cfg.empty_step_size, known);
    auto timeout = std::chrono::milliseconds(cfg.discovery_timeout_ms);

    while(!planner.done()){
        if(context.stop_requested()){
            Logger::instance().info("device discovery stopped");
            context.report.add_warning(name(), "stopped before the instance range was covered");
            break;
        }
        Window w = planner.next();
        context.report.add_counter(name(), "windows");
        Logger::instance().debug("Who-Is " + std::to_string(w.low) + "-" + std::to_string(w.high));
        std::vector<IAmResponse> responses;
        try {
            auto fut = context.app.who_is(w.low, w.high);
            auto got = await_for(fut, timeout);
            if(!got){
                Logger::instance().warn("Who-Is " + std::to_string(w.low) + "-" + std::to_string(w.high) + " timed out");
                context.report.add_counter(name(), "window_timeouts");
                continue;
            }
            responses = std::move(*got);
        } catch(const std::exception& ex){
            Logger::instance().warn("Who-Is " + std::to_string(w.low) + "-" + std::to_string(w.high) + " failed: " + ex.what());
            context.report.add_counter(name(), "window_errors");
            continue;
        }
        for(const auto& iam : responses) record_i_am(context, iam);
    }
    context.report.add_counter(name(), "synthesized_subnets", static_cast<long long>(context.state.subnets.synthesized_count()));
}

}
