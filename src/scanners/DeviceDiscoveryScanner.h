#pragma once
#include "../core/Scanner.h"
#include "../bacnet/BacnetApplication.h"

namespace bacnet_scan {

struct ScanContext;

// Who-Is sweep over [low_limit, high_limit] in windows sized from the prior
// scan's device density. Each I-Am becomes a Device or BBMD node.
class DeviceDiscoveryScanner : public Scanner {
public:
    std::string name() const override { return "devices"; }
    std::string description() const override { return "Adaptive Who-Is sweep with BBMD probing"; }
    void scan(ScanContext& context) override;

    // Adds one I-Am to the graph. False when the response is malformed and skipped.
    bool record_i_am(ScanContext& context, const IAmResponse& iam);
    // Allow-list membership or a successful BDT probe. A BDT read is stored in
    // the scan state for later bdt-entry resolution.
    bool classify_bbmd(ScanContext& context, const Address& address);
};

}
