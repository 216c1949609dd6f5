#include "Report.h"
#include <algorithm>

namespace bacnet_scan {

void Report::start_scanner(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ScanResult sr;
    sr.scanner_name = name;
    sr.start_time = std::chrono::system_clock::now();
    results_.push_back(std::move(sr));
}

void Report::end_scanner(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(results_.begin(), results_.end(), [&](auto& r){ return r.scanner_name == name; });
    if(it != results_.end()) {
        it->end_time = std::chrono::system_clock::now();
    }
}

void Report::add_counter(const std::string& scanner, const std::string& key, long long delta){
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(results_.begin(), results_.end(), [&](auto& r){ return r.scanner_name == scanner; });
    if(it != results_.end()) it->counters[key] += delta;
}

long long Report::counter(const std::string& scanner, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& r : results_){
        if(r.scanner_name != scanner) continue;
        auto c = r.counters.find(key);
        return c == r.counters.end() ? 0 : c->second;
    }
    return 0;
}

void Report::add_warning(const std::string& scanner, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.emplace_back(scanner, message);
}

void Report::add_error(const std::string& scanner, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.emplace_back(scanner, message);
}

std::vector<ScanResult> Report::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::vector<std::pair<std::string,std::string>> Report::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

std::vector<std::pair<std::string,std::string>> Report::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

}
