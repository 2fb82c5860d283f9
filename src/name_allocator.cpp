#include "triggerware/name_allocator.hpp"

namespace triggerware {

std::string NameAllocator::allocate(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = counters_[prefix]++;
    return prefix + std::to_string(n);
}

uint64_t NameAllocator::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(prefix);
    return it == counters_.end() ? 0 : it->second;
}

} // namespace triggerware
