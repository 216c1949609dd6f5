#include "SubnetAssociation.h"
#include "../core/Logging.h"
#include <algorithm>

namespace bacnet_scan {

bool SubnetIndex::add(const Subnet& subnet){
    if(std::find(subnets_.begin(), subnets_.end(), subnet) != subnets_.end()) return false;
    subnets_.push_back(subnet);
    return true;
}

std::optional<Subnet> SubnetIndex::find(Ipv4Address ip) const {
    std::optional<Subnet> best;
    for(const auto& s : subnets_){
        if(s.contains(ip) && (!best || s.prefix() > best->prefix())) best = s;
    }
    return best;
}

Subnet SubnetIndex::resolve(Ipv4Address ip){
    if(auto s = find(ip)) return *s;
    Subnet s(ip, synthesized_prefix_);
    subnets_.push_back(s);
    ++synthesized_;
    Logger::instance().debug("synthesized subnet " + s.to_string() + " for " + ip.to_string());
    return s;
}

std::optional<Subnet> associate_subnet(TopologyNode& node, const Address& address, SubnetIndex& index){
    auto ip = address.to_ip();
    if(!ip) return std::nullopt;
    auto rel = subnet_relation_for(node.type());
    if(!rel) throw GraphError(std::string("node type ") + type_tag(node.type()) + " has no subnet relation");
    Subnet s = index.resolve(*ip);
    node.add_relation(*rel, node_key::subnet(s));
    return s;
}

}
