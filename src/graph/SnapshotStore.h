#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>
#include "TopologyGraph.h"

namespace bacnet_scan {

// Directory of scan graphs named bacnet_graph_<UTC stamp>.nt. Names sort
// chronologically; the newest snapshot seeds the next scan's density hint.
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path dir, int limit);

    std::filesystem::path save(const TopologyGraph& graph, std::chrono::system_clock::time_point when);
    std::vector<std::filesystem::path> list() const; // newest first
    // A missing or unreadable snapshot is only a lost hint: logged, nullopt.
    std::optional<TopologyGraph> load_latest() const;
    size_t prune();

    const std::filesystem::path& dir() const { return dir_; }
private:
    std::filesystem::path dir_;
    int limit_;
};

}
