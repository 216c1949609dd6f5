#include "SnapshotStore.h"
#include "GraphSerializer.h"
#include "../core/JsonUtil.h"
#include "../core/Logging.h"
#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

namespace bacnet_scan {

static const char* kPrefix = "bacnet_graph_";
static const char* kSuffix = ".nt";

static bool is_snapshot_name(const std::string& name){
    const std::string p = kPrefix, s = kSuffix;
    return name.size() > p.size() + s.size() && name.compare(0, p.size(), p) == 0 && name.compare(name.size() - s.size(), s.size(), s) == 0;
}

// (stamp, collision number) of "bacnet_graph_<stamp>[_N].nt"; N is 0 when absent.
static std::pair<std::string, unsigned long> snapshot_order(const fs::path& p){
    std::string name = p.filename().string();
    const std::string pre = kPrefix, suf = kSuffix;
    std::string body = name.substr(pre.size(), name.size() - pre.size() - suf.size());
    auto us = body.find('_');
    if(us == std::string::npos) return {body, 0};
    unsigned long n = 0;
    for(size_t i = us + 1; i < body.size(); ++i){
        if(body[i] < '0' || body[i] > '9') return {body, 0};
        n = n * 10 + static_cast<unsigned long>(body[i] - '0');
    }
    return {body.substr(0, us), n};
}

SnapshotStore::SnapshotStore(fs::path dir, int limit) : dir_(std::move(dir)), limit_(limit) {}

fs::path SnapshotStore::save(const TopologyGraph& graph, std::chrono::system_clock::time_point when){
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if(ec) throw std::runtime_error("cannot create snapshot directory " + dir_.string() + ": " + ec.message());
    std::string stem = std::string(kPrefix) + jsonutil::time_to_stamp(when);
    fs::path path = dir_ / (stem + kSuffix);
    for(int n = 1; fs::exists(path); ++n) path = dir_ / (stem + "_" + std::to_string(n) + kSuffix);
    ntriples::save_file(path.string(), graph.to_triples());
    Logger::instance().info("snapshot written: " + path.string());
    prune();
    return path;
}

std::vector<fs::path> SnapshotStore::list() const {
    std::vector<fs::path> out;
    std::error_code ec;
    if(!fs::is_directory(dir_, ec)) return out;
    for(auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)){
        if(!it->is_regular_file(ec)) continue;
        if(is_snapshot_name(it->path().filename().string())) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b){ return snapshot_order(a) > snapshot_order(b); });
    return out;
}

std::optional<TopologyGraph> SnapshotStore::load_latest() const {
    auto all = list();
    if(all.empty()) return std::nullopt;
    try {
        return ntriples::load_graph(all.front().string());
    } catch(const GraphParseError& ex){
        Logger::instance().warn(std::string("ignoring unreadable prior snapshot: ") + ex.what());
        return std::nullopt;
    }
}

size_t SnapshotStore::prune(){
    if(limit_ <= 0) return 0;
    auto all = list();
    size_t removed = 0;
    for(size_t i = static_cast<size_t>(limit_); i < all.size(); ++i){
        std::error_code ec;
        if(fs::remove(all[i], ec)) ++removed;
        else if(ec) Logger::instance().warn("cannot remove old snapshot " + all[i].string() + ": " + ec.message());
    }
    return removed;
}

}
