#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "BacnetApplication.h"

namespace bacnet_scan {

// Replays a JSON capture of an internetwork:
//   { "devices": [{"address","instance","vendor"}],
//     "routers": [{"address","adapter","networks":[..]}],
//     "bbmds":   [{"address","bdt":[..],"fdt":[{"address","ttl","remaining"}]}] }
// Who-Is answers from devices in range, router queries from routers listing
// the network. BVLL reads are answered by BBMDs, NAKed by other known devices
// and dropped for unknown addresses.
class RecordedApplication : public BacnetApplication {
public:
    struct Bbmd {
        std::vector<Address> bdt;
        std::vector<FdtEntry> fdt;
    };

    // Both throw std::runtime_error on unreadable or malformed input.
    static std::unique_ptr<RecordedApplication> from_file(const std::string& path);
    static std::unique_ptr<RecordedApplication> from_json(const std::string& text);

    std::future<std::vector<IAmResponse>> who_is(DeviceInstance low, DeviceInstance high) override;
    std::future<std::vector<RouterAnnouncement>> who_is_router_to_network(NetworkNumber network) override;
    void send_bvll(const Address& destination, BvllFunction function) override;
    void bind(BvllListener* listener) override;
    void close() override;

    size_t who_is_count() const { return who_is_count_; }
    size_t bvll_count() const { return bvll_count_; }
    bool closed() const { return closed_; }

private:
    std::vector<IAmResponse> devices_;
    std::vector<RouterAnnouncement> routers_;
    std::map<Address, Bbmd> bbmds_;
    BvllListener* listener_ = nullptr;
    std::mutex mutex_;
    size_t who_is_count_ = 0;
    size_t bvll_count_ = 0;
    bool closed_ = false;
};

// ApplicationFactory reading Config::recording_file.
std::unique_ptr<BacnetApplication> make_recorded_application(const Config& cfg);

}
