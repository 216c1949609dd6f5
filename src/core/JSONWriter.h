#pragma once
#include <string>
#include "Config.h"
#include "Report.h"
#include "../graph/SnapshotDiff.h"
#include "../graph/TopologyGraph.h"

namespace bacnet_scan {

// Canonical JSON (object keys sorted, compact unless cfg.pretty) for
// downstream rendering: nodes, edges, summary and, for scans, phase timing.
class JSONWriter {
public:
    std::string write(const Report& report, const TopologyGraph& graph, const Config& cfg) const;
    std::string write_graph(const TopologyGraph& graph, const Config& cfg) const;
    std::string write_diff(const DiffResult& diff, const std::string& source_a, const std::string& source_b, const Config& cfg) const;
};

}
