#include "SnapshotDiff.h"
#include "GraphSerializer.h"
#include "../core/Digest.h"
#include "../core/Logging.h"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <set>

namespace bacnet_scan {

DiffResult diff_triples(const std::vector<Triple>& a, const std::vector<Triple>& b){
    std::set<Triple> sa(a.begin(), a.end());
    std::set<Triple> sb(b.begin(), b.end());
    DiffResult d;
    d.digest_a = ntriples::digest(a);
    d.digest_b = ntriples::digest(b);
    if(d.digest_a == d.digest_b){
        d.in_both.assign(sa.begin(), sa.end());
        return d;
    }
    std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(d.in_both));
    std::set_difference(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(d.only_in_a));
    std::set_difference(sb.begin(), sb.end(), sa.begin(), sa.end(), std::back_inserter(d.only_in_b));
    return d;
}

DiffResult diff_graphs(const TopologyGraph& a, const TopologyGraph& b){
    return diff_triples(a.to_triples(), b.to_triples());
}

std::string provenance_key(const Triple& t){
    return "diff://" + sha256_hex(ntriples::format_triple(t));
}

std::vector<Triple> merge_with_provenance(const DiffResult& diff, const std::string& source_a, const std::string& source_b){
    std::vector<Triple> out = diff.in_both;
    auto mark = [&](const std::vector<Triple>& side, const std::string& source){
        for(const auto& t : side){
            out.push_back(t);
            std::string id = provenance_key(t);
            out.push_back({id, vocab::bacnet("diff-source"), Term::string(source)});
            out.push_back({id, vocab::kRdfsLabel, Term::string(ntriples::format_triple(t))});
        }
    };
    mark(diff.only_in_a, source_a);
    mark(diff.only_in_b, source_b);
    return out;
}

DiffOutcome diff_snapshot_files(const std::string& path_a, const std::string& path_b, const std::string& output_path){
    DiffOutcome outcome;
    std::vector<Triple> a, b;
    try {
        a = ntriples::load_graph(path_a).to_triples();
        b = ntriples::load_graph(path_b).to_triples();
    } catch(const GraphParseError& ex){
        outcome.error = ex.what();
        Logger::instance().warn(std::string("diff: ") + ex.what());
        return outcome;
    }
    try {
        outcome.result = diff_triples(a, b);
        if(!output_path.empty()){
            std::string name_a = std::filesystem::path(path_a).filename().string();
            std::string name_b = std::filesystem::path(path_b).filename().string();
            ntriples::save_file(output_path, merge_with_provenance(outcome.result, name_a, name_b));
            outcome.output_path = output_path;
        }
    } catch(const std::exception& ex){
        outcome.error = ex.what();
        Logger::instance().warn(std::string("diff: ") + ex.what());
        return outcome;
    }
    outcome.ok = true;
    Logger::instance().debug("diff: " + std::to_string(outcome.result.in_both.size()) + " shared, "
        + std::to_string(outcome.result.only_in_a.size()) + " only in " + path_a + ", "
        + std::to_string(outcome.result.only_in_b.size()) + " only in " + path_b);
    return outcome;
}

}
