#pragma once
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "NodeType.h"
#include "Triple.h"

namespace bacnet_scan {

class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TopologyNode {
public:
    TopologyNode(std::string key, NodeType type);

    const std::string& key() const { return key_; }
    NodeType type() const { return type_; }

    // Single-valued properties: the last write wins.
    void set_label(std::string label){ label_ = std::move(label); }
    void set_device_instance(DeviceInstance instance){ device_instance_ = instance; }
    void set_address(std::string address){ address_ = std::move(address); }
    void set_vendor_id(std::uint32_t vendor_id){ vendor_id_ = vendor_id; }

    const std::optional<std::string>& label() const { return label_; }
    const std::optional<DeviceInstance>& device_instance() const { return device_instance_; }
    const std::optional<std::string>& address() const { return address_; }
    const std::optional<std::uint32_t>& vendor_id() const { return vendor_id_; }

    // Multi-valued relations are append-only. Returns false when the exact
    // (relation, target) pair is already present. Throws GraphError when the
    // relation is not part of this node type's capability set.
    bool add_relation(RelationKind kind, const std::string& target);
    bool has_relation(RelationKind kind, const std::string& target) const;
    std::vector<std::string> targets(RelationKind kind) const;
    const std::set<std::pair<RelationKind, std::string>>& relations() const { return relations_; }

private:
    std::string key_;
    NodeType type_;
    std::optional<std::string> label_;
    std::optional<DeviceInstance> device_instance_;
    std::optional<std::string> address_;
    std::optional<std::uint32_t> vendor_id_;
    std::set<std::pair<RelationKind, std::string>> relations_;
};

class TopologyGraph {
public:
    // Returns the existing node for key, or creates it. The key scheme must
    // agree with the type; a mismatch throws GraphError.
    TopologyNode& ensure_node(const std::string& key, NodeType type);

    TopologyNode* find(const std::string& key);
    const TopologyNode* find(const std::string& key) const;
    bool contains(const std::string& key) const { return nodes_.count(key) != 0; }

    const std::map<std::string, TopologyNode>& nodes() const { return nodes_; }
    std::vector<const TopologyNode*> nodes_of_type(NodeType type) const;
    size_t node_count() const { return nodes_.size(); }
    size_t relation_count() const;
    bool empty() const { return nodes_.empty(); }

    // Sorted, de-duplicated instance numbers of Device and BBMD nodes.
    std::vector<DeviceInstance> device_instances() const;

    std::vector<Triple> to_triples() const;
    // Rebuilds a graph from triples. Unknown predicates, untyped subjects and
    // ill-typed literals throw GraphError.
    static TopologyGraph from_triples(const std::vector<Triple>& triples);

private:
    std::map<std::string, TopologyNode> nodes_;
};

}
