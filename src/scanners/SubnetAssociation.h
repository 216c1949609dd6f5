#pragma once
#include <optional>
#include <vector>
#include "../bacnet/Address.h"
#include "../graph/TopologyGraph.h"

namespace bacnet_scan {

// Growing list of IP subnets for one scan. Entries are never removed.
class SubnetIndex {
public:
    explicit SubnetIndex(int synthesized_prefix = 24) : synthesized_prefix_(synthesized_prefix) {}

    // False if the subnet is already listed.
    bool add(const Subnet& subnet);
    // Most specific listed subnet containing ip.
    std::optional<Subnet> find(Ipv4Address ip) const;
    // find(), else synthesize a subnet of the configured prefix around ip.
    Subnet resolve(Ipv4Address ip);

    const std::vector<Subnet>& subnets() const { return subnets_; }
    size_t synthesized_count() const { return synthesized_; }
    int synthesized_prefix() const { return synthesized_prefix_; }
private:
    std::vector<Subnet> subnets_;
    int synthesized_prefix_;
    size_t synthesized_ = 0;
};

// Resolves address to a subnet (synthesizing if needed) and adds the node
// type's subnet relation. nullopt for non-IP addresses.
std::optional<Subnet> associate_subnet(TopologyNode& node, const Address& address, SubnetIndex& index);

}
