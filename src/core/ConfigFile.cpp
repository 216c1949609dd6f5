#include "ConfigFile.h"
#include "Logging.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>

namespace bacnet_scan {

using nlohmann::json;

namespace {

using Setter = std::function<void(const json&, Config&)>;

template<typename T>
Setter field(T Config::*member){
    return [member](const json& v, Config& c){ c.*member = v.get<T>(); };
}

const std::map<std::string, Setter>& setters(){
    static const std::map<std::string, Setter> table = {
        {"localName", field(&Config::local_name)},
        {"localInstanceId", field(&Config::local_instance_id)},
        {"localNetwork", field(&Config::local_network)},
        {"localAddress", field(&Config::local_address)},
        {"vendorIdentifier", field(&Config::vendor_identifier)},
        {"foreignRegistration", field(&Config::foreign_registration)},
        {"timeToLive", field(&Config::time_to_live)},
        {"configuredBbmdList", field(&Config::configured_bbmds)},
        {"knownSubnets", field(&Config::known_subnets)},
        {"lowLimit", field(&Config::low_limit)},
        {"highLimit", field(&Config::high_limit)},
        {"fullStepSize", field(&Config::full_step_size)},
        {"emptyStepSize", field(&Config::empty_step_size)},
        {"probeBbmds", field(&Config::probe_bbmds)},
        {"requestTimeoutMs", field(&Config::request_timeout_ms)},
        {"discoveryTimeoutMs", field(&Config::discovery_timeout_ms)},
        {"synthesizedPrefix", field(&Config::synthesized_prefix)},
        {"enablePhases", field(&Config::enable_phases)},
        {"disablePhases", field(&Config::disable_phases)},
        {"recording", field(&Config::recording_file)},
        {"snapshotDir", field(&Config::snapshot_dir)},
        {"storeLimit", field(&Config::store_limit)},
        {"usePrior", field(&Config::use_prior)},
        {"output", field(&Config::output_file)},
        {"jsonOutput", field(&Config::json_output)},
        {"pretty", field(&Config::pretty)},
        {"diffOutputDir", field(&Config::diff_output_dir)},
        {"diffWorkers", field(&Config::diff_workers)},
        {"logLevel", field(&Config::log_level)},
    };
    return table;
}

}

void apply_config_json(const std::string& text, Config& cfg){
    json root;
    try {
        root = json::parse(text);
    } catch(const json::parse_error& ex){
        throw std::runtime_error(std::string("config: ") + ex.what());
    }
    if(!root.is_object()) throw std::runtime_error("config: top level must be an object");
    Config next = cfg;
    for(auto it = root.begin(); it != root.end(); ++it){
        auto s = setters().find(it.key());
        if(s == setters().end()){
            Logger::instance().warn("config: ignoring unknown key " + it.key());
            continue;
        }
        try {
            s->second(it.value(), next);
        } catch(const json::exception& ex){
            throw std::runtime_error("config: bad value for " + it.key() + ": " + ex.what());
        }
    }
    cfg = std::move(next);
}

void load_config_file(const std::string& path, Config& cfg){
    std::ifstream in(path);
    if(!in) throw std::runtime_error("cannot open config file " + path);
    std::ostringstream ss; ss << in.rdbuf();
    apply_config_json(ss.str(), cfg);
}

}
