#include "BbmdTableScanner.h"
#include "../core/ScanContext.h"
#include "../core/Logging.h"

namespace bacnet_scan {

void BbmdTableScanner::read_foreign_device_tables(ScanContext& context){
    for(const auto& addr : context.state.configured_bbmds){
        if(context.stop_requested()) return;
        if(!addr.to_ip()) continue;
        context.report.add_counter(name(), "fdt_reads");
        auto table = context.bvll.read_foreign_device_table(addr);
        if(!table){
            Logger::instance().warn("no foreign device table from " + addr.to_string());
            context.report.add_counter(name(), "fdt_failures");
            continue;
        }
        context.state.fdt[addr] = std::move(*table);
    }
}

void BbmdTableScanner::resolve_bdt_entries(ScanContext& context){
    for(const auto& kv : context.state.bdt){
        auto owner = context.state.bbmd_by_address.find(kv.first);
        if(owner == context.state.bbmd_by_address.end()) continue;
        TopologyNode* node = context.graph.find(owner->second);
        if(!node) continue;
        for(const auto& peer : kv.second){
            if(peer == kv.first) continue; // a BBMD lists itself in its own BDT
            auto target = context.state.bbmd_by_address.find(peer);
            if(target == context.state.bbmd_by_address.end()){
                Logger::instance().debug("BDT of " + kv.first.to_string() + " names unknown peer " + peer.to_string());
                context.report.add_counter(name(), "unresolved_bdt_entries");
                continue;
            }
            if(node->add_relation(RelationKind::BdtEntry, target->second)) context.report.add_counter(name(), "bdt_entries");
        }
    }
}

void BbmdTableScanner::resolve_fdt_entries(ScanContext& context){
    for(const auto& kv : context.state.fdt){
        auto owner = context.state.bbmd_by_address.find(kv.first);
        TopologyNode* node = owner == context.state.bbmd_by_address.end() ? nullptr : context.graph.find(owner->second);
        if(!node){
            Logger::instance().debug("foreign device table of undiscovered BBMD " + kv.first.to_string());
            continue;
        }
        for(const auto& entry : kv.second){
            auto dev = context.state.device_by_address.find(entry.address);
            if(dev == context.state.device_by_address.end()){
                context.report.add_counter(name(), "unresolved_fdt_entries");
                continue;
            }
            if(node->add_relation(RelationKind::FdrEntry, dev->second)) context.report.add_counter(name(), "fdr_entries");
        }
    }
}

void BbmdTableScanner::scan(ScanContext& context){
    read_foreign_device_tables(context);
    resolve_bdt_entries(context);
    resolve_fdt_entries(context);
    context.report.add_counter(name(), "bbmd_subnets", static_cast<long long>(context.state.bbmd_in_subnet.size()));
}

}
