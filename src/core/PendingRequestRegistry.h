#pragma once
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>

namespace bacnet_scan {

// Correlation table for request/response exchanges: one single-assignment
// promise per key. A slot is removed by exactly one of fulfill, fail or
// cancel; whichever comes second finds nothing and returns false.
template<typename Key, typename Value>
class PendingRequestRegistry {
public:
    // nullopt when a request for key is already outstanding.
    std::optional<std::future<Value>> open(const Key& key){
        std::lock_guard<std::mutex> lock(mutex_);
        auto res = slots_.emplace(key, std::promise<Value>());
        if(!res.second) return std::nullopt;
        return res.first->second.get_future();
    }

    bool fulfill(const Key& key, Value value){
        std::promise<Value> slot;
        if(!take(key, slot)) return false;
        slot.set_value(std::move(value));
        return true;
    }

    bool fail(const Key& key, std::exception_ptr error){
        std::promise<Value> slot;
        if(!take(key, slot)) return false;
        slot.set_exception(error);
        return true;
    }

    // Drops the slot; a waiter still holding the future sees broken_promise.
    bool cancel(const Key& key){
        std::promise<Value> slot;
        return take(key, slot);
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.count(key) != 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

private:
    bool take(const Key& key, std::promise<Value>& out){
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if(it == slots_.end()) return false;
        out = std::move(it->second);
        slots_.erase(it);
        return true;
    }

    mutable std::mutex mutex_;
    std::map<Key, std::promise<Value>> slots_;
};

}
