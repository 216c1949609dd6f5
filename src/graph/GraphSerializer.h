#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "TopologyGraph.h"
#include "Triple.h"

namespace bacnet_scan {

class GraphParseError : public std::runtime_error {
public:
    GraphParseError(size_t line, const std::string& msg);
    size_t line() const { return line_; } // 0 when not tied to a line (I/O, semantic errors)
private:
    size_t line_;
};

// N-Triples interchange format. Output is canonical: one triple per line,
// sorted and de-duplicated, so equal graphs serialize to identical bytes.
namespace ntriples {

std::string format_triple(const Triple& t);
std::vector<std::string> canonical_lines(const std::vector<Triple>& triples);
std::string write(const std::vector<Triple>& triples);
std::string write(const TopologyGraph& graph);

std::vector<Triple> parse(const std::string& text);

std::vector<Triple> load_file(const std::string& path);
TopologyGraph load_graph(const std::string& path);
void save_file(const std::string& path, const std::vector<Triple>& triples);

// SHA-256 over the canonical serialization; identical for graphs that differ
// only in insertion order.
std::string digest(const std::vector<Triple>& triples);

}

}
