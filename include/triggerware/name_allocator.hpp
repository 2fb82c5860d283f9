#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace triggerware {

/// Hands out inbound method names ("poll0", "sub3", "batch1", ...). Each
/// prefix has its own counter, starting at 0 and never reused, so a name is
/// unique for the life of the allocator.
class NameAllocator {
public:
    [[nodiscard]] std::string allocate(const std::string& prefix);

    /// Number of names handed out so far under `prefix`.
    [[nodiscard]] uint64_t count(const std::string& prefix) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
};

} // namespace triggerware
