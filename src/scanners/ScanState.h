#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "SubnetAssociation.h"
#include "../bacnet/BacnetApplication.h"

namespace bacnet_scan {

// Scanner-local bookkeeping shared by the phases of one scan; not persisted.
struct ScanState {
    SubnetIndex subnets;
    std::set<NetworkNumber> networks;           // seen in remote device addresses
    std::set<NetworkNumber> announced_networks; // reachable through discovered routers
    std::vector<Address> configured_bbmds;
    std::map<Address, std::string> bbmd_by_address;   // -> bbmd:// key
    std::map<Address, std::string> device_by_address; // every discovered device or BBMD
    std::map<Address, std::vector<Address>> bdt;
    std::map<Address, std::vector<FdtEntry>> fdt;
    std::map<Subnet, std::vector<std::string>> bbmd_in_subnet;
    std::string scanner_key;

    bool is_configured_bbmd(const Address& a) const {
        for(const auto& b : configured_bbmds) if(b == a) return true;
        return false;
    }
};

}
