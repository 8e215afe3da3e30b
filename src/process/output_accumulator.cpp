#include "process/output_accumulator.hpp"

namespace scalebox::process {

void OutputAccumulator::Append(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.append(chunk);
}

std::string OutputAccumulator::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

std::size_t OutputAccumulator::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

bool OutputAccumulator::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.empty();
}

}  // namespace scalebox::process
