#pragma once
#include <string>
#include <vector>
#include "TopologyGraph.h"
#include "Triple.h"

namespace bacnet_scan {

struct DiffResult {
    std::vector<Triple> in_both;   // sorted, unique
    std::vector<Triple> only_in_a;
    std::vector<Triple> only_in_b;
    std::string digest_a;
    std::string digest_b;

    bool identical() const { return only_in_a.empty() && only_in_b.empty(); }
};

// Canonical comparison: both sides are reduced to sorted unique triple sets,
// so insertion and allocation order never matter.
DiffResult diff_triples(const std::vector<Triple>& a, const std::vector<Triple>& b);
DiffResult diff_graphs(const TopologyGraph& a, const TopologyGraph& b);

// Union of all three sets. Every triple unique to one side gets a
// diff://<sha256> entry carrying bacnet:diff-source (the snapshot name) and an
// rdfs:label with the triple text.
std::vector<Triple> merge_with_provenance(const DiffResult& diff, const std::string& source_a, const std::string& source_b);
std::string provenance_key(const Triple& t);

struct DiffOutcome {
    bool ok = false;
    std::string error;
    DiffResult result;
    std::string output_path;
};

// Loads both snapshot files, diffs them and, when output_path is non-empty,
// writes the merged graph there. Never throws for bad input files.
DiffOutcome diff_snapshot_files(const std::string& path_a, const std::string& path_b, const std::string& output_path);

}
