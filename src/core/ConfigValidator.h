#pragma once
#include "Config.h"

namespace bacnet_scan {

class ConfigValidator {
public:
    // Checks ranges and conflicts; prints the first problem to stderr and
    // returns false. Lowercases the log level.
    static bool validate(Config& cfg);
private:
    static bool validate_range(long long value, long long lo, long long hi, const char* what);
    static bool validate_addresses(const Config& cfg);
};

}
