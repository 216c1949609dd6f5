#pragma once
#include "../core/Scanner.h"
#include "../bacnet/BacnetApplication.h"

namespace bacnet_scan {

struct ScanContext;

// One Who-Is-Router-To-Network per network number seen during device
// discovery.
class RouterDiscoveryScanner : public Scanner {
public:
    std::string name() const override { return "routers"; }
    std::string description() const override { return "Per-network Who-Is-Router-To-Network discovery"; }
    void scan(ScanContext& context) override;

    void record_router(ScanContext& context, const RouterAnnouncement& announcement);
};

}
