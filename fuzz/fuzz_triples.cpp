#include "graph/GraphSerializer.h"
#include "graph/TopologyGraph.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    try {
        auto triples = bacnet_scan::ntriples::parse(input);
        auto graph = bacnet_scan::TopologyGraph::from_triples(triples);
        // Whatever parses must serialize and parse back.
        auto again = bacnet_scan::ntriples::parse(bacnet_scan::ntriples::write(graph));
        (void)again;
    } catch (const bacnet_scan::GraphParseError&) {
    } catch (const bacnet_scan::GraphError&) {
    }
    return 0;
}
