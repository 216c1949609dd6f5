#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace bacnet_scan {

struct ScanResult {
    std::string scanner_name;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::map<std::string, long long> counters;
};

class Report {
public:
    void start_scanner(const std::string& name);
    void end_scanner(const std::string& name);
    void add_counter(const std::string& scanner, const std::string& key, long long delta = 1);
    long long counter(const std::string& scanner, const std::string& key) const;
    // Warning / error side channels (collection issues, not topology)
    void add_warning(const std::string& scanner, const std::string& message);
    void add_error(const std::string& scanner, const std::string& message);

    std::vector<ScanResult> results() const;
    std::vector<std::pair<std::string,std::string>> warnings() const;
    std::vector<std::pair<std::string,std::string>> errors() const;
private:
    std::vector<ScanResult> results_;
    std::vector<std::pair<std::string,std::string>> warnings_; // (scanner, message)
    std::vector<std::pair<std::string,std::string>> errors_;
    mutable std::mutex mutex_;
};

}
