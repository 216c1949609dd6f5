#pragma once
#include <vector>
#include "../bacnet/Address.h"

namespace bacnet_scan {

// Inclusive instance range covered by one Who-Is broadcast.
struct Window {
    DeviceInstance low = 0;
    DeviceInstance high = 0;
    bool operator==(const Window& o) const { return low == o.low && high == o.high; }
};

// Tiles [low, high] with consecutive windows. Where the prior scan saw at
// least full_step devices within empty_step of the cursor the window stops at
// the full_step-th of them; elsewhere it spans empty_step instances.
class WindowPlanner {
public:
    WindowPlanner(DeviceInstance low, DeviceInstance high, long long full_step, long long empty_step, std::vector<DeviceInstance> known);

    bool done() const { return done_; }
    Window next();
    DeviceInstance window_end(long long cursor) const;

    static std::vector<Window> plan(DeviceInstance low, DeviceInstance high, long long full_step, long long empty_step, const std::vector<DeviceInstance>& known);

private:
    long long cursor_;
    long long high_;
    long long full_step_;
    long long empty_step_;
    std::vector<DeviceInstance> known_; // sorted, unique
    bool done_;
};

}
