#pragma once
#include <atomic>
#include "Config.h"
#include "Report.h"
#include "../graph/TopologyGraph.h"
#include "../scanners/ScanState.h"
#include "../bacnet/BacnetApplication.h"
#include "../bacnet/BvllServiceElement.h"

namespace bacnet_scan {

// Everything a phase may touch during one scan. The graph and state are owned
// by the scan; only one scan mutates them.
struct ScanContext {
    ScanContext(const Config& cfg, Report& rep, TopologyGraph& g, ScanState& st, BacnetApplication& a, BvllServiceElement& b)
        : config(cfg), report(rep), graph(g), state(st), app(a), bvll(b) {}

    const Config& config;
    Report& report;
    TopologyGraph& graph;
    ScanState& state;
    BacnetApplication& app;
    BvllServiceElement& bvll;
    const TopologyGraph* prior = nullptr; // read-only density hint
    const std::atomic<bool>* stop = nullptr;

    bool stop_requested() const { return stop && stop->load(); }
};

}
