#pragma once
#include <string>
#include <memory>

namespace bacnet_scan {

struct ScanContext;

// One discovery phase of a scan.
class Scanner {
public:
    virtual ~Scanner() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void scan(ScanContext& context) = 0;
};

using ScannerPtr = std::unique_ptr<Scanner>;

}
