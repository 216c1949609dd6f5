#include "RecordedApplication.h"
#include "../core/Config.h"
#include "../core/Logging.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bacnet_scan {

using nlohmann::json;

namespace {

Address need_address(const json& j, const char* where){
    if(!j.is_string()) throw std::runtime_error(std::string("recording: ") + where + " address must be a string");
    auto a = Address::parse(j.get<std::string>());
    if(!a) throw std::runtime_error(std::string("recording: bad ") + where + " address '" + j.get<std::string>() + "'");
    return *a;
}

template<typename T>
std::promise<T> ready(T value){
    std::promise<T> p;
    p.set_value(std::move(value));
    return p;
}

}

std::unique_ptr<RecordedApplication> RecordedApplication::from_file(const std::string& path){
    std::ifstream in(path);
    if(!in) throw std::runtime_error("cannot open recording " + path);
    std::ostringstream ss; ss << in.rdbuf();
    return from_json(ss.str());
}

std::unique_ptr<RecordedApplication> RecordedApplication::from_json(const std::string& text){
    auto app = std::make_unique<RecordedApplication>();
    try {
        json root = json::parse(text);
        if(!root.is_object()) throw std::runtime_error("recording: top level must be an object");
        for(const auto& d : root.value("devices", json::array())){
            IAmResponse r;
            r.address = need_address(d.at("address"), "device");
            r.device_instance = d.at("instance").get<long long>();
            r.vendor_id = d.value("vendor", 0LL);
            app->devices_.push_back(std::move(r));
        }
        for(const auto& rt : root.value("routers", json::array())){
            RouterAnnouncement a;
            a.router_address = need_address(rt.at("address"), "router");
            a.adapter = rt.value("adapter", std::string());
            for(const auto& n : rt.value("networks", json::array())) a.networks.push_back(n.get<long long>());
            app->routers_.push_back(std::move(a));
        }
        for(const auto& b : root.value("bbmds", json::array())){
            Bbmd entry;
            for(const auto& peer : b.value("bdt", json::array())) entry.bdt.push_back(need_address(peer, "bdt"));
            for(const auto& f : b.value("fdt", json::array())){
                FdtEntry fe;
                fe.address = need_address(f.at("address"), "fdt");
                fe.ttl = f.value("ttl", static_cast<std::uint16_t>(0));
                fe.remaining = f.value("remaining", static_cast<std::uint16_t>(0));
                entry.fdt.push_back(std::move(fe));
            }
            app->bbmds_[need_address(b.at("address"), "bbmd")] = std::move(entry);
        }
    } catch(const json::exception& ex){
        throw std::runtime_error(std::string("recording: ") + ex.what());
    }
    return app;
}

std::future<std::vector<IAmResponse>> RecordedApplication::who_is(DeviceInstance low, DeviceInstance high){
    std::lock_guard<std::mutex> lock(mutex_);
    ++who_is_count_;
    std::vector<IAmResponse> out;
    for(const auto& d : devices_) if(d.device_instance >= low && d.device_instance <= high) out.push_back(d);
    return ready(std::move(out)).get_future();
}

std::future<std::vector<RouterAnnouncement>> RecordedApplication::who_is_router_to_network(NetworkNumber network){
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RouterAnnouncement> out;
    for(const auto& r : routers_){
        for(long long n : r.networks) if(n == network){ out.push_back(r); break; }
    }
    return ready(std::move(out)).get_future();
}

void RecordedApplication::send_bvll(const Address& destination, BvllFunction function){
    BvllListener* listener = nullptr;
    BvllAck ack;
    bool answer = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++bvll_count_;
        listener = listener_;
        ack.function = function;
        ack.source = destination;
        auto it = bbmds_.find(destination);
        if(it != bbmds_.end()){
            ack.bdt = it->second.bdt;
            ack.fdt = it->second.fdt;
            answer = true;
        } else {
            for(const auto& d : devices_) if(d.address == destination){ ack.rejected = true; answer = true; break; }
        }
    }
    if(answer && listener) listener->confirmation(ack);
}

void RecordedApplication::bind(BvllListener* listener){
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

void RecordedApplication::close(){
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = nullptr;
    closed_ = true;
}

std::unique_ptr<BacnetApplication> make_recorded_application(const Config& cfg){
    if(cfg.recording_file.empty()) throw std::runtime_error("no BACnet transport configured (use --recording FILE)");
    auto app = RecordedApplication::from_file(cfg.recording_file);
    Logger::instance().info("replaying recording " + cfg.recording_file);
    return app;
}

}
