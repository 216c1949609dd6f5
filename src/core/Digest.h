#pragma once
#include <string>

namespace bacnet_scan {

// Lowercase hex SHA-256 of data. Throws std::runtime_error if the digest
// cannot be computed.
std::string sha256_hex(const std::string& data);

}
