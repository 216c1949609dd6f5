#include "ConfigValidator.h"
#include "Logging.h"
#include "../bacnet/Address.h"
#include <algorithm>
#include <iostream>

namespace bacnet_scan {

static const char* kPhases[] = {"devices", "routers", "bbmd-tables"};

bool ConfigValidator::validate_range(long long value, long long lo, long long hi, const char* what){
    if(value < lo || value > hi){
        std::cerr << what << " must be in [" << lo << ", " << hi << "], got " << value << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_addresses(const Config& cfg){
    if(!parse_local_address(cfg.local_address)){
        std::cerr << "Invalid local address: " << cfg.local_address << "\n";
        return false;
    }
    if(!cfg.foreign_registration.empty()){
        auto a = Address::parse(cfg.foreign_registration);
        if(!a || !a->to_ip()){
            std::cerr << "Invalid foreign registration BBMD: " << cfg.foreign_registration << "\n";
            return false;
        }
    }
    for(const auto& b : cfg.configured_bbmds){
        if(!Address::parse(b)){
            std::cerr << "Invalid BBMD address: " << b << "\n";
            return false;
        }
    }
    for(const auto& s : cfg.known_subnets){
        if(!Subnet::parse(s)){
            std::cerr << "Invalid subnet: " << s << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::validate(Config& cfg) {
    if(!validate_range(cfg.local_instance_id, 0, kMaxDeviceInstance, "local instance id")) return false;
    if(!validate_range(cfg.local_network, 0, kMaxNetworkNumber, "local network")) return false;
    if(!validate_range(cfg.vendor_identifier, 0, 0xFFFF, "vendor identifier")) return false;
    if(!validate_range(cfg.time_to_live, 1, 0xFFFF, "time to live")) return false;
    if(!validate_range(cfg.low_limit, 0, kMaxDeviceInstance, "low limit")) return false;
    if(!validate_range(cfg.high_limit, 0, kMaxDeviceInstance, "high limit")) return false;
    if(cfg.low_limit > cfg.high_limit) {
        std::cerr << "low limit " << cfg.low_limit << " is above high limit " << cfg.high_limit << "\n";
        return false;
    }
    if(!validate_range(cfg.full_step_size, 1, kMaxDeviceInstance + 1LL, "full step size")) return false;
    if(!validate_range(cfg.empty_step_size, 1, kMaxDeviceInstance + 1LL, "empty step size")) return false;
    if(!validate_range(cfg.request_timeout_ms, 1, 600000, "request timeout")) return false;
    if(!validate_range(cfg.discovery_timeout_ms, 1, 600000, "discovery timeout")) return false;
    if(!validate_range(cfg.synthesized_prefix, 8, 32, "synthesized subnet prefix")) return false;
    if(!validate_range(cfg.store_limit, 0, 100000, "store limit")) return false;
    if(!validate_range(cfg.diff_workers, 1, 64, "diff workers")) return false;
    if(!validate_addresses(cfg)) return false;

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid log level: " << cfg.log_level << "\n";
        return false;
    }
    std::transform(cfg.log_level.begin(), cfg.log_level.end(), cfg.log_level.begin(), ::tolower);

    // Phase enable/disable conflicts
    auto known_phase = [](const std::string& n){
        return std::find(std::begin(kPhases), std::end(kPhases), n) != std::end(kPhases);
    };
    for(const auto& phase : cfg.enable_phases) {
        if(!known_phase(phase)) {
            std::cerr << "Unknown phase: " << phase << "\n";
            return false;
        }
        if(std::find(cfg.disable_phases.begin(), cfg.disable_phases.end(), phase) != cfg.disable_phases.end()) {
            std::cerr << "Cannot enable and disable the same phase: " << phase << "\n";
            return false;
        }
    }
    for(const auto& phase : cfg.disable_phases) {
        if(!known_phase(phase)) {
            std::cerr << "Unknown phase: " << phase << "\n";
            return false;
        }
    }
    return true;
}

}
