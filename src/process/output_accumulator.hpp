#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace scalebox::process {

// Append-only buffer written by one consumption loop and read by any thread.
class OutputAccumulator {
public:
    void Append(const std::string& chunk);
    std::string Snapshot() const;
    std::size_t Size() const;
    bool Empty() const;

private:
    mutable std::mutex mutex_;
    std::string buffer_;
};

}  // namespace scalebox::process
