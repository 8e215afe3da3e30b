#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "process/process_handle.hpp"

namespace scalebox::process {

// pid -> handle map shared by the process managers. Holds weak references
// only; entries whose handle is gone are pruned on every registration.
template <typename Handle>
class HandleRegistry {
public:
    void Register(std::uint32_t pid, std::weak_ptr<ProcessHandle> handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handles_.begin(); it != handles_.end();) {
            if (it->second.expired()) {
                it = handles_.erase(it);
            } else {
                ++it;
            }
        }
        handles_[pid] = std::move(handle);
    }

    std::shared_ptr<Handle> Find(std::uint32_t pid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(pid);
        if (it == handles_.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<Handle>(it->second.lock());
    }

    // Pids whose handle is alive and still consuming events.
    std::vector<std::uint32_t> Running() const {
        std::vector<std::uint32_t> pids;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [pid, weak] : handles_) {
            auto handle = weak.lock();
            if (handle && !handle->IsDone()) {
                pids.push_back(pid);
            }
        }
        return pids;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::uint32_t, std::weak_ptr<ProcessHandle>> handles_;
};

}  // namespace scalebox::process
