#include "ArgumentParser.h"
#include "ConfigFile.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <functional>
#include <iostream>
#include <stdexcept>

namespace bacnet_scan {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

namespace {

enum class ArgKind { None, String, Int, CSV };

struct FlagSpec {
    const char* name;
    ArgKind kind;
    const char* value_name;
    const char* help;
    std::function<void(const std::string&, long long, Config&)> apply;
};

const std::vector<FlagSpec>& flag_specs(){
    static const std::vector<FlagSpec> specs = {
        {"--config", ArgKind::String, "FILE", "JSON configuration file", [](const std::string&, long long, Config&){}},
        {"--recording", ArgKind::String, "FILE", "Replay a JSON network recording", [](const std::string& v, long long, Config& c){ c.recording_file = v; }},
        {"--local-name", ArgKind::String, "NAME", "Scanner device name", [](const std::string& v, long long, Config& c){ c.local_name = v; }},
        {"--local-instance", ArgKind::Int, "N", "Scanner device instance", [](const std::string&, long long n, Config& c){ c.local_instance_id = n; }},
        {"--local-network", ArgKind::Int, "N", "Local BACnet network number (0 = none)", [](const std::string&, long long n, Config& c){ c.local_network = n; }},
        {"--local-address", ArgKind::String, "ADDR", "Scanner address ip[/prefix][:port]", [](const std::string& v, long long, Config& c){ c.local_address = v; }},
        {"--vendor-id", ArgKind::Int, "N", "Scanner vendor identifier", [](const std::string&, long long n, Config& c){ c.vendor_identifier = n; }},
        {"--foreign-bbmd", ArgKind::String, "ADDR", "Register as foreign device with this BBMD", [](const std::string& v, long long, Config& c){ c.foreign_registration = v; }},
        {"--ttl", ArgKind::Int, "SEC", "Foreign registration time to live", [](const std::string&, long long n, Config& c){ c.time_to_live = static_cast<int>(n); }},
        {"--bbmd", ArgKind::CSV, "list", "Configured BBMD addresses", [](const std::string& v, long long, Config& c){ c.configured_bbmds = split_csv(v); }},
        {"--subnet", ArgKind::CSV, "list", "Known subnets a.b.c.d/p", [](const std::string& v, long long, Config& c){ c.known_subnets = split_csv(v); }},
        {"--low", ArgKind::Int, "N", "Lowest device instance", [](const std::string&, long long n, Config& c){ c.low_limit = n; }},
        {"--high", ArgKind::Int, "N", "Highest device instance", [](const std::string&, long long n, Config& c){ c.high_limit = n; }},
        {"--full-step", ArgKind::Int, "N", "Known devices that close a dense window", [](const std::string&, long long n, Config& c){ c.full_step_size = n; }},
        {"--empty-step", ArgKind::Int, "N", "Window span in sparse ranges", [](const std::string&, long long n, Config& c){ c.empty_step_size = n; }},
        {"--no-probe", ArgKind::None, nullptr, "Only treat configured BBMDs as BBMDs", [](const std::string&, long long, Config& c){ c.probe_bbmds = false; }},
        {"--request-timeout", ArgKind::Int, "MS", "BVLL read timeout", [](const std::string&, long long n, Config& c){ c.request_timeout_ms = static_cast<int>(n); }},
        {"--discovery-timeout", ArgKind::Int, "MS", "Who-Is / router query timeout", [](const std::string&, long long n, Config& c){ c.discovery_timeout_ms = static_cast<int>(n); }},
        {"--subnet-prefix", ArgKind::Int, "N", "Prefix of synthesized subnets", [](const std::string&, long long n, Config& c){ c.synthesized_prefix = static_cast<int>(n); }},
        {"--enable", ArgKind::CSV, "name[,name...]", "Only run these phases", [](const std::string& v, long long, Config& c){ c.enable_phases = split_csv(v); }},
        {"--disable", ArgKind::CSV, "name[,name...]", "Skip these phases", [](const std::string& v, long long, Config& c){ c.disable_phases = split_csv(v); }},
        {"--snapshot-dir", ArgKind::String, "DIR", "Snapshot directory", [](const std::string& v, long long, Config& c){ c.snapshot_dir = v; }},
        {"--store-limit", ArgKind::Int, "N", "Snapshots to keep (0 = all)", [](const std::string&, long long n, Config& c){ c.store_limit = static_cast<int>(n); }},
        {"--no-prior", ArgKind::None, nullptr, "Ignore the previous snapshot", [](const std::string&, long long, Config& c){ c.use_prior = false; }},
        {"--output", ArgKind::String, "FILE", "Also write N-Triples to FILE", [](const std::string& v, long long, Config& c){ c.output_file = v; }},
        {"--json", ArgKind::String, "FILE", "Write JSON graph to FILE (- = stdout)", [](const std::string& v, long long, Config& c){ c.json_output = v; }},
        {"--pretty", ArgKind::None, nullptr, "Pretty-print JSON", [](const std::string&, long long, Config& c){ c.pretty = true; }},
        {"--diff-output", ArgKind::String, "DIR", "Directory for merged diff graphs", [](const std::string& v, long long, Config& c){ c.diff_output_dir = v; }},
        {"--diff-workers", ArgKind::Int, "N", "Diff worker threads", [](const std::string&, long long n, Config& c){ c.diff_workers = static_cast<int>(n); }},
        {"--log-level", ArgKind::String, "LEVEL", "error|warn|info|debug|trace", [](const std::string& v, long long, Config& c){ c.log_level = v; }},
    };
    return specs;
}

const FlagSpec* find_spec(const std::string& flag){
    for(const auto& s : flag_specs()) if(flag == s.name) return &s;
    return nullptr;
}

bool parse_int(const std::string& v, long long& out){
    try {
        size_t pos = 0;
        out = std::stoll(v, &pos);
        return pos == v.size();
    } catch(const std::exception&) {
        return false;
    }
}

}

void ArgumentParser::print_help(std::ostream& os){
    os << "usage: bacnet-scan [scan|diff A B|export SNAPSHOT] [options]\n";
    os << "  scan                           Discover the internetwork and store a snapshot\n";
    os << "  diff A B                       Compare two snapshots, write the merged graph\n";
    os << "  export SNAPSHOT                Convert a snapshot to JSON\n";
    for(const auto& s : flag_specs()){
        std::string name = s.name;
        if(s.value_name){ name += ' '; name += s.value_name; }
        os << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) os << ' '; else os << ' ';
        os << ' ' << s.help << "\n";
    }
    os << "  --version                      Print version & exit\n";
    os << "  --help                         Show this help\n";
}

void ArgumentParser::print_version(std::ostream& os){
    os << "bacnet-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    positional_.clear();
    // --config first, so every other flag overrides the file.
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a != "--config") continue;
        if(i+1>=argc){ std::cerr << "Missing value for --config\n"; exit_code_ = 2; return false; }
        try {
            load_config_file(argv[i+1], cfg);
        } catch(const std::exception& ex) {
            std::cerr << ex.what() << "\n";
            exit_code_ = 2;
            return false;
        }
        ++i;
    }
    bool have_command = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(std::cout); return false; }
        if(a=="--version"){ print_version(std::cout); return false; }
        if(a.size() < 2 || a.compare(0, 2, "--") != 0){
            if(!have_command && (a=="scan" || a=="diff" || a=="export")){ command_ = a; have_command = true; }
            else positional_.push_back(a);
            continue;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val; long long num = 0;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(spec->kind == ArgKind::Int && !parse_int(val, num)){
            std::cerr << "Invalid integer for " << a << ": " << val << "\n";
            exit_code_ = 2;
            return false;
        }
        spec->apply(val, num, cfg);
    }
    return true;
}

}
