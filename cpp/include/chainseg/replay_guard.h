// chainseg/cpp/include/chainseg/replay_guard.h
#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace chainseg {

// Bounded FIFO of the most recently emitted keys with O(1) membership.
// Suppresses re-emission of a batch that was written to a shard but whose
// state save was lost. capacity 0 disables it.
class ReplayGuard {
public:
    explicit ReplayGuard(size_t capacity = 0) : cap_(capacity) {}

    bool enabled() const { return cap_ > 0; }
    size_t capacity() const { return cap_; }
    size_t size() const { return ring_.size(); }

    bool contains(const std::string& key) const;

    // Oldest key falls out once capacity is reached.
    void push(const std::string& key);

    // Replace contents with `keys` (oldest first); only the newest `capacity` are kept.
    void load(const std::vector<std::string>& keys);

    std::vector<std::string> snapshot() const { return {ring_.begin(), ring_.end()}; }

private:
    size_t cap_;
    std::deque<std::string> ring_;
    std::unordered_map<std::string, uint32_t> counts_; // keys may repeat in the ring
};

} // namespace chainseg
