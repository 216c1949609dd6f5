#pragma once
#include <chrono>
#include <string>

namespace bacnet_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// UTC ISO-8601 with second precision, e.g. 2024-05-01T12:00:00Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);
// Compact UTC stamp usable in file names, e.g. 20240501T120000Z
std::string time_to_stamp(std::chrono::system_clock::time_point tp);

}
}
