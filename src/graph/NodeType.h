#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../bacnet/Address.h"

namespace bacnet_scan {

enum class NodeType { Device, Router, Bbmd, Subnet, Network, Scanner };

enum class RelationKind {
    DeviceOnNetwork,
    DeviceOnSubnet,
    RouterToNetwork,
    BdtEntry,
    BbmdBroadcastDomain,
    FdrEntry,
    UnassociatedRouter
};

// Type tag used as the rdf:type object ("Device", "BBMD", ...).
const char* type_tag(NodeType type);
std::optional<NodeType> type_from_tag(const std::string& tag);

// Key scheme ("device", "bbmd", ...); every node key is "<kind>://<id>".
const char* key_kind(NodeType type);
std::optional<NodeType> type_from_key(const std::string& key);

const char* predicate_name(RelationKind kind);
std::optional<RelationKind> relation_from_predicate(const std::string& name);

// Fixed capability table: which relations a node of this type may carry.
const std::vector<RelationKind>& relations_for(NodeType type);
bool relation_applies(NodeType type, RelationKind kind);

// Relation used to tie a node to its IP subnet; none for Subnet/Network.
std::optional<RelationKind> subnet_relation_for(NodeType type);

namespace node_key {
std::string device(DeviceInstance instance);
std::string bbmd(DeviceInstance instance);
std::string router(const Address& address);
std::string subnet(const Subnet& subnet);
std::string network(NetworkNumber network);
std::string scanner(DeviceInstance instance);
std::string vendor(std::uint32_t vendor_id);
}

}
