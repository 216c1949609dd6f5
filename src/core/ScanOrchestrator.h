#pragma once
#include <atomic>
#include <stdexcept>
#include "Config.h"
#include "Report.h"
#include "ScannerRegistry.h"
#include "../bacnet/BacnetApplication.h"
#include "../graph/TopologyGraph.h"
#include "../scanners/ScanState.h"

namespace bacnet_scan {

// Configuration the scan cannot start with, or an application layer that
// cannot be constructed. Raised before any request is sent.
class ScanSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs one scan: devices, then routers, then BBMD tables, each phase awaiting
// its requests one at a time. Owns the graph it builds until it returns it.
class ScanOrchestrator {
public:
    ScanOrchestrator(const Config& cfg, ApplicationFactory factory);

    // Replaces the default phase set (tests).
    void set_registry(ScannerRegistry registry){ registry_ = std::move(registry); custom_registry_ = true; }

    // prior is only read. Setting *stop ends the scan after the current
    // request; the returned graph is then valid but incomplete.
    TopologyGraph run(Report& report, const TopologyGraph* prior = nullptr, const std::atomic<bool>* stop = nullptr);

    // Parses the address and subnet settings; throws ScanSetupError.
    static ScanState prepare_state(const Config& cfg);

private:
    void add_scanner_node(TopologyGraph& graph, ScanState& state) const;
    static void finalize(TopologyGraph& graph, const ScanState& state);

    const Config& cfg_;
    ApplicationFactory factory_;
    ScannerRegistry registry_;
    bool custom_registry_ = false;
};

}
