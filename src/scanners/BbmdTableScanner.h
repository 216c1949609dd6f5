#pragma once
#include "../core/Scanner.h"

namespace bacnet_scan {

struct ScanContext;

// Runs after discovery: reads foreign device tables of the configured BBMDs,
// then links BDT peers and FDT registrations to the nodes of this scan.
class BbmdTableScanner : public Scanner {
public:
    std::string name() const override { return "bbmd-tables"; }
    std::string description() const override { return "Resolves BDT and FDT entries into bdt-entry and fdr-entry relations"; }
    void scan(ScanContext& context) override;

    void read_foreign_device_tables(ScanContext& context);
    void resolve_bdt_entries(ScanContext& context);
    void resolve_fdt_entries(ScanContext& context);
};

}
