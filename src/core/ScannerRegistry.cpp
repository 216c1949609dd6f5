#include "ScannerRegistry.h"
#include "ScanContext.h"
#include "Logging.h"
#include "../scanners/DeviceDiscoveryScanner.h"
#include "../scanners/RouterDiscoveryScanner.h"
#include "../scanners/BbmdTableScanner.h"
#include <algorithm>

namespace bacnet_scan {

void ScannerRegistry::register_scanner(ScannerPtr scanner) {
    scanners_.push_back(std::move(scanner));
}

void ScannerRegistry::register_all_default() {
    register_scanner(std::make_unique<DeviceDiscoveryScanner>());
    register_scanner(std::make_unique<RouterDiscoveryScanner>());
    register_scanner(std::make_unique<BbmdTableScanner>());
}

std::vector<std::string> ScannerRegistry::names() const {
    std::vector<std::string> out;
    for(const auto& s : scanners_) out.push_back(s->name());
    return out;
}

void ScannerRegistry::run_all(ScanContext& context) {
    const auto& cfg = context.config;
    auto is_enabled = [&](const std::string& name){
        if(!cfg.enable_phases.empty()) {
            bool found = std::find(cfg.enable_phases.begin(), cfg.enable_phases.end(), name)!=cfg.enable_phases.end();
            if(!found) return false;
        }
        if(!cfg.disable_phases.empty()) {
            if(std::find(cfg.disable_phases.begin(), cfg.disable_phases.end(), name)!=cfg.disable_phases.end()) return false;
        }
        return true;
    };
    for(auto& s : scanners_) {
        if(!is_enabled(s->name())) continue;
        if(context.stop_requested()) {
            Logger::instance().info("scan stopped before phase " + s->name());
            break;
        }
        Logger::instance().debug("Starting phase: " + s->name());
        context.report.start_scanner(s->name());
        try {
            s->scan(context);
        } catch(const std::exception& ex) {
            Logger::instance().error("phase " + s->name() + " failed: " + ex.what());
            context.report.add_error(s->name(), ex.what());
        }
        context.report.end_scanner(s->name());
        Logger::instance().debug("Finished phase: " + s->name());
    }
}

}
