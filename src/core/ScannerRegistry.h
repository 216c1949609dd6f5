#pragma once
#include "Scanner.h"
#include <string>
#include <vector>

namespace bacnet_scan {

struct ScanContext;

class ScannerRegistry {
public:
    void register_scanner(ScannerPtr scanner);
    // devices, routers, bbmd-tables; this order is the phase order.
    void register_all_default();
    // Runs enabled phases in order. A phase that throws is recorded in the
    // report error channel and the next phase still runs.
    void run_all(ScanContext& context);
    std::vector<std::string> names() const;
private:
    std::vector<ScannerPtr> scanners_;
};

}
