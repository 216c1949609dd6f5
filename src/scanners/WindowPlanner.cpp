#include "WindowPlanner.h"
#include <algorithm>
#include <stdexcept>

namespace bacnet_scan {

WindowPlanner::WindowPlanner(DeviceInstance low, DeviceInstance high, long long full_step, long long empty_step, std::vector<DeviceInstance> known)
    : cursor_(low), high_(high), full_step_(std::max(1LL, full_step)), empty_step_(std::max(1LL, empty_step)), known_(std::move(known)), done_(low > high) {
    std::sort(known_.begin(), known_.end());
    known_.erase(std::unique(known_.begin(), known_.end()), known_.end());
}

DeviceInstance WindowPlanner::window_end(long long cursor) const {
    long long end = cursor + empty_step_;
    auto it = std::lower_bound(known_.begin(), known_.end(), static_cast<DeviceInstance>(cursor));
    auto idx = static_cast<size_t>(it - known_.begin());
    size_t nth = idx + static_cast<size_t>(full_step_) - 1;
    if(nth < known_.size() && static_cast<long long>(known_[nth]) < end) end = known_[nth];
    return static_cast<DeviceInstance>(std::min(end, high_));
}

Window WindowPlanner::next(){
    if(done_) throw std::logic_error("window planner exhausted");
    Window w{static_cast<DeviceInstance>(cursor_), window_end(cursor_)};
    cursor_ = static_cast<long long>(w.high) + 1;
    if(cursor_ > high_) done_ = true;
    return w;
}

std::vector<Window> WindowPlanner::plan(DeviceInstance low, DeviceInstance high, long long full_step, long long empty_step, const std::vector<DeviceInstance>& known){
    WindowPlanner p(low, high, full_step, empty_step, known);
    std::vector<Window> out;
    while(!p.done()) out.push_back(p.next());
    return out;
}

}
