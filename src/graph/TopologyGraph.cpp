#include "TopologyGraph.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace bacnet_scan {

TopologyNode::TopologyNode(std::string key, NodeType type) : key_(std::move(key)), type_(type) {}

bool TopologyNode::add_relation(RelationKind kind, const std::string& target){
    if(!relation_applies(type_, kind)){
        throw GraphError(std::string("relation ") + predicate_name(kind) + " does not apply to " + type_tag(type_) + " node " + key_);
    }
    return relations_.emplace(kind, target).second;
}

bool TopologyNode::has_relation(RelationKind kind, const std::string& target) const {
    return relations_.count({kind, target}) != 0;
}

std::vector<std::string> TopologyNode::targets(RelationKind kind) const {
    std::vector<std::string> out;
    for(const auto& r : relations_) if(r.first == kind) out.push_back(r.second);
    return out;
}

TopologyNode& TopologyGraph::ensure_node(const std::string& key, NodeType type){
    auto it = nodes_.find(key);
    if(it != nodes_.end()){
        if(it->second.type() != type){
            throw GraphError("node " + key + " already exists as " + type_tag(it->second.type()) + ", not " + type_tag(type));
        }
        return it->second;
    }
    auto kind = type_from_key(key);
    if(!kind || *kind != type){
        throw GraphError("key " + key + " does not match node type " + type_tag(type));
    }
    return nodes_.emplace(key, TopologyNode(key, type)).first->second;
}

TopologyNode* TopologyGraph::find(const std::string& key){
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : &it->second;
}

const TopologyNode* TopologyGraph::find(const std::string& key) const {
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<const TopologyNode*> TopologyGraph::nodes_of_type(NodeType type) const {
    std::vector<const TopologyNode*> out;
    for(const auto& kv : nodes_) if(kv.second.type() == type) out.push_back(&kv.second);
    return out;
}

size_t TopologyGraph::relation_count() const {
    size_t n = 0;
    for(const auto& kv : nodes_) n += kv.second.relations().size();
    return n;
}

std::vector<DeviceInstance> TopologyGraph::device_instances() const {
    std::vector<DeviceInstance> out;
    for(const auto& kv : nodes_){
        const auto& node = kv.second;
        if(node.type() != NodeType::Device && node.type() != NodeType::Bbmd) continue;
        if(node.device_instance()) out.push_back(*node.device_instance());
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<Triple> TopologyGraph::to_triples() const {
    std::vector<Triple> out;
    for(const auto& kv : nodes_){
        const auto& n = kv.second;
        out.push_back({n.key(), vocab::kRdfType, Term::iri(vocab::bacnet(type_tag(n.type())))});
        if(n.label()) out.push_back({n.key(), vocab::kRdfsLabel, Term::string(*n.label())});
        if(n.device_instance()) out.push_back({n.key(), vocab::bacnet("device-instance"), Term::integer(*n.device_instance())});
        if(n.address()) out.push_back({n.key(), vocab::bacnet("address"), Term::string(*n.address())});
        if(n.vendor_id()) out.push_back({n.key(), vocab::bacnet("vendor-id"), Term::iri(node_key::vendor(*n.vendor_id()))});
        for(const auto& r : n.relations()){
            out.push_back({n.key(), vocab::bacnet(predicate_name(r.first)), Term::iri(r.second)});
        }
    }
    return out;
}

namespace {

std::optional<std::string> bacnet_local_name(const std::string& iri){
    const std::string ns = vocab::kBacnetNs;
    if(iri.size() <= ns.size() || iri.compare(0, ns.size(), ns) != 0) return std::nullopt;
    return iri.substr(ns.size());
}

bool parse_number(const std::string& s, long long& out){
    if(s.empty()) return false;
    char* end = nullptr; errno = 0;
    out = std::strtoll(s.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

void expect_kind(const Triple& t, Term::Kind kind, const char* what){
    if(t.object.kind != kind) throw GraphError(std::string("expected ") + what + " object for " + t.subject + " " + t.predicate);
}

}

TopologyGraph TopologyGraph::from_triples(const std::vector<Triple>& triples){
    TopologyGraph g;
    for(const auto& t : triples){
        if(t.predicate != vocab::kRdfType) continue;
        expect_kind(t, Term::Kind::Iri, "IRI");
        auto local = bacnet_local_name(t.object.value);
        auto type = local ? type_from_tag(*local) : std::nullopt;
        if(!type) throw GraphError("unknown node type " + t.object.value + " for " + t.subject);
        g.ensure_node(t.subject, *type);
    }
    for(const auto& t : triples){
        if(t.predicate == vocab::kRdfType) continue;
        TopologyNode* node = g.find(t.subject);
        if(!node) throw GraphError("subject without rdf:type: " + t.subject);
        if(t.predicate == vocab::kRdfsLabel){
            expect_kind(t, Term::Kind::String, "string");
            node->set_label(t.object.value);
            continue;
        }
        auto local = bacnet_local_name(t.predicate);
        if(!local) throw GraphError("unknown predicate " + t.predicate);
        if(*local == "device-instance"){
            expect_kind(t, Term::Kind::Integer, "integer");
            long long v = 0;
            if(!parse_number(t.object.value, v) || !valid_device_instance(v)) throw GraphError("device-instance out of range for " + t.subject);
            node->set_device_instance(static_cast<DeviceInstance>(v));
        } else if(*local == "address"){
            expect_kind(t, Term::Kind::String, "string");
            node->set_address(t.object.value);
        } else if(*local == "vendor-id"){
            expect_kind(t, Term::Kind::Iri, "IRI");
            const std::string prefix = "vendor://";
            long long v = 0;
            if(t.object.value.compare(0, prefix.size(), prefix) != 0 || !parse_number(t.object.value.substr(prefix.size()), v) || v < 0 || v > 0xFFFF){
                throw GraphError("malformed vendor-id " + t.object.value + " for " + t.subject);
            }
            node->set_vendor_id(static_cast<std::uint32_t>(v));
        } else if(auto rel = relation_from_predicate(*local)){
            expect_kind(t, Term::Kind::Iri, "IRI");
            node->add_relation(*rel, t.object.value);
        } else {
            throw GraphError("unknown predicate " + t.predicate);
        }
    }
    return g;
}

}
