#pragma once
#include <chrono>
#include <optional>
#include <vector>
#include "BacnetApplication.h"
#include "../core/PendingRequestRegistry.h"

namespace bacnet_scan {

// Correlates BVLL reads with their acknowledgements, keyed by destination
// address. Each read waits at most timeout; a timeout, NAK or transport error
// yields nullopt and never leaves a slot behind.
class BvllServiceElement : public BvllListener {
public:
    BvllServiceElement(BacnetApplication& app, std::chrono::milliseconds timeout);

    void confirmation(const BvllAck& ack) override;

    std::optional<std::vector<Address>> read_broadcast_distribution_table(const Address& address);
    std::optional<std::vector<FdtEntry>> read_foreign_device_table(const Address& address);

    size_t pending() const { return pending_.size(); }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::optional<BvllAck> request(const Address& address, BvllFunction function);

    BacnetApplication& app_;
    std::chrono::milliseconds timeout_;
    PendingRequestRegistry<Address, BvllAck> pending_;
};

}
