#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Address.h"

namespace bacnet_scan {

struct Config;

// Raw I-Am payload. Numbers are kept wide so out-of-range values reported by
// a misbehaving device can be detected and skipped.
struct IAmResponse {
    Address address;
    long long device_instance = 0;
    long long vendor_id = 0;
};

struct RouterAnnouncement {
    std::string adapter;
    Address router_address;
    std::vector<long long> networks;
};

struct FdtEntry {
    Address address;
    std::uint16_t ttl = 0;
    std::uint16_t remaining = 0;
};

enum class BvllFunction { ReadBroadcastDistributionTable, ReadForeignDeviceTable };

const char* bvll_function_name(BvllFunction fn);

// Answer to a BVLL read. A device that does not implement BBMD functions
// answers with a BVLC-Result NAK, surfaced as rejected.
struct BvllAck {
    BvllFunction function = BvllFunction::ReadBroadcastDistributionTable;
    Address source;
    std::vector<Address> bdt;
    std::vector<FdtEntry> fdt;
    bool rejected = false;
};

class BvllListener {
public:
    virtual ~BvllListener() = default;
    virtual void confirmation(const BvllAck& ack) = 0;
};

// Asynchronous BACnet application layer. Futures may never become ready (no
// response) or carry an exception (transport failure); callers bound every
// wait with a timeout.
class BacnetApplication {
public:
    virtual ~BacnetApplication() = default;
    virtual std::future<std::vector<IAmResponse>> who_is(DeviceInstance low, DeviceInstance high) = 0;
    virtual std::future<std::vector<RouterAnnouncement>> who_is_router_to_network(NetworkNumber network) = 0;
    // Fire and forget; the answer, if any, arrives through the bound listener.
    virtual void send_bvll(const Address& destination, BvllFunction function) = 0;
    virtual void bind(BvllListener* listener) = 0;
    virtual void close() = 0;
};

// nullopt when fut is not ready within timeout. Exceptions stored in the
// future, broken_promise included, propagate to the caller.
template<typename T>
std::optional<T> await_for(std::future<T>& fut, std::chrono::milliseconds timeout){
    if(!fut.valid()) throw std::future_error(std::future_errc::no_state);
    if(fut.wait_for(timeout) != std::future_status::ready) return std::nullopt;
    return fut.get();
}

using ApplicationFactory = std::function<std::unique_ptr<BacnetApplication>(const Config&)>;

}
