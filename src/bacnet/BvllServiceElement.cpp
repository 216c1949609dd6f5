#include "BvllServiceElement.h"
#include "../core/Logging.h"
#include <stdexcept>

namespace bacnet_scan {

const char* bvll_function_name(BvllFunction fn){
    switch(fn){
        case BvllFunction::ReadBroadcastDistributionTable: return "Read-Broadcast-Distribution-Table";
        case BvllFunction::ReadForeignDeviceTable: return "Read-Foreign-Device-Table";
    }
    return "?";
}

BvllServiceElement::BvllServiceElement(BacnetApplication& app, std::chrono::milliseconds timeout)
    : app_(app), timeout_(timeout) {}

void BvllServiceElement::confirmation(const BvllAck& ack){
    if(ack.rejected){
        pending_.fail(ack.source, std::make_exception_ptr(std::runtime_error(std::string(bvll_function_name(ack.function)) + " rejected by " + ack.source.to_string())));
        return;
    }
    if(!pending_.fulfill(ack.source, ack)){
        Logger::instance().debug("unsolicited BVLL ack from " + ack.source.to_string());
    }
}

namespace {
// Removes the slot on every exit path; a no-op once the ack consumed it.
struct SlotGuard {
    PendingRequestRegistry<Address, BvllAck>& registry;
    const Address& key;
    ~SlotGuard(){ registry.cancel(key); }
};
}

std::optional<BvllAck> BvllServiceElement::request(const Address& address, BvllFunction function){
    auto fut = pending_.open(address);
    if(!fut){
        Logger::instance().warn("BVLL request already outstanding for " + address.to_string());
        return std::nullopt;
    }
    SlotGuard guard{pending_, address};
    try {
        app_.send_bvll(address, function);
        if(fut->wait_for(timeout_) != std::future_status::ready){
            Logger::instance().debug(std::string(bvll_function_name(function)) + " timed out for " + address.to_string());
            return std::nullopt;
        }
        BvllAck ack = fut->get();
        if(ack.function != function){
            Logger::instance().warn("unexpected BVLL ack type from " + address.to_string());
            return std::nullopt;
        }
        return ack;
    } catch(const std::exception& ex){
        Logger::instance().debug(std::string(bvll_function_name(function)) + " failed for " + address.to_string() + ": " + ex.what());
        return std::nullopt;
    }
}

std::optional<std::vector<Address>> BvllServiceElement::read_broadcast_distribution_table(const Address& address){
    auto ack = request(address, BvllFunction::ReadBroadcastDistributionTable);
    if(!ack) return std::nullopt;
    return ack->bdt;
}

std::optional<std::vector<FdtEntry>> BvllServiceElement::read_foreign_device_table(const Address& address){
    auto ack = request(address, BvllFunction::ReadForeignDeviceTable);
    if(!ack) return std::nullopt;
    return ack->fdt;
}

}
