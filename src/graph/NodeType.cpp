#include "NodeType.h"
#include <algorithm>
#include <array>

namespace bacnet_scan {

namespace {
struct TypeRow {
    NodeType type;
    const char* tag;
    const char* kind;
    std::vector<RelationKind> relations;
};

const std::array<TypeRow, 6>& type_table(){
    static const std::array<TypeRow, 6> table = {{
        {NodeType::Device, "Device", "device", {RelationKind::DeviceOnNetwork, RelationKind::DeviceOnSubnet}},
        {NodeType::Router, "Router", "router", {RelationKind::DeviceOnNetwork, RelationKind::DeviceOnSubnet, RelationKind::RouterToNetwork}},
        {NodeType::Bbmd, "BBMD", "bbmd", {RelationKind::BdtEntry, RelationKind::BbmdBroadcastDomain, RelationKind::FdrEntry}},
        {NodeType::Subnet, "Subnet", "subnet", {}},
        {NodeType::Network, "Network", "network", {}},
        {NodeType::Scanner, "Scanner", "scanner", {RelationKind::DeviceOnNetwork, RelationKind::DeviceOnSubnet, RelationKind::UnassociatedRouter}},
    }};
    return table;
}

const TypeRow& row(NodeType type){
    for(const auto& r : type_table()) if(r.type == type) return r;
    return type_table()[0];
}

struct PredicateRow { RelationKind kind; const char* name; };
const std::array<PredicateRow, 7> predicates = {{
    {RelationKind::DeviceOnNetwork, "device-on-network"},
    {RelationKind::DeviceOnSubnet, "device-on-subnet"},
    {RelationKind::RouterToNetwork, "router-to-network"},
    {RelationKind::BdtEntry, "bdt-entry"},
    {RelationKind::BbmdBroadcastDomain, "bbmd-broadcast-domain"},
    {RelationKind::FdrEntry, "fdr-entry"},
    {RelationKind::UnassociatedRouter, "unassociated-router"},
}};
}

const char* type_tag(NodeType type){ return row(type).tag; }

std::optional<NodeType> type_from_tag(const std::string& tag){
    for(const auto& r : type_table()) if(tag == r.tag) return r.type;
    return std::nullopt;
}

const char* key_kind(NodeType type){ return row(type).kind; }

std::optional<NodeType> type_from_key(const std::string& key){
    auto sep = key.find("://");
    if(sep == std::string::npos || sep + 3 >= key.size()) return std::nullopt;
    std::string kind = key.substr(0, sep);
    for(const auto& r : type_table()) if(kind == r.kind) return r.type;
    return std::nullopt;
}

const char* predicate_name(RelationKind kind){
    for(const auto& p : predicates) if(p.kind == kind) return p.name;
    return "";
}

std::optional<RelationKind> relation_from_predicate(const std::string& name){
    for(const auto& p : predicates) if(name == p.name) return p.kind;
    return std::nullopt;
}

const std::vector<RelationKind>& relations_for(NodeType type){ return row(type).relations; }

bool relation_applies(NodeType type, RelationKind kind){
    const auto& rel = relations_for(type);
    return std::find(rel.begin(), rel.end(), kind) != rel.end();
}

std::optional<RelationKind> subnet_relation_for(NodeType type){
    switch(type){
        case NodeType::Device:
        case NodeType::Router:
        case NodeType::Scanner: return RelationKind::DeviceOnSubnet;
        case NodeType::Bbmd: return RelationKind::BbmdBroadcastDomain;
        case NodeType::Subnet:
        case NodeType::Network: break;
    }
    return std::nullopt;
}

namespace node_key {
std::string device(DeviceInstance instance){ return "device://" + std::to_string(instance); }
std::string bbmd(DeviceInstance instance){ return "bbmd://" + std::to_string(instance); }
std::string router(const Address& address){ return "router://" + address.to_string(); }
std::string subnet(const Subnet& subnet){ return "subnet://" + subnet.to_string(); }
std::string network(NetworkNumber network){ return "network://" + std::to_string(network); }
std::string scanner(DeviceInstance instance){ return "scanner://" + std::to_string(instance); }
std::string vendor(std::uint32_t vendor_id){ return "vendor://" + std::to_string(vendor_id); }
}

}
