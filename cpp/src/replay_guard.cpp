// chainseg/cpp/src/replay_guard.cpp
#include "chainseg/replay_guard.h"

namespace chainseg {

bool ReplayGuard::contains(const std::string& key) const {
    return counts_.find(key) != counts_.end();
}

void ReplayGuard::push(const std::string& key) {
    if (cap_ == 0) return;
    if (ring_.size() >= cap_) {
        auto it = counts_.find(ring_.front());
        if (it != counts_.end() && --it->second == 0) counts_.erase(it);
        ring_.pop_front();
    }
    ring_.push_back(key);
    ++counts_[key];
}

void ReplayGuard::load(const std::vector<std::string>& keys) {
    ring_.clear();
    counts_.clear();
    if (cap_ == 0) return;
    const size_t from = keys.size() > cap_ ? keys.size() - cap_ : 0;
    for (size_t i = from; i < keys.size(); ++i) push(keys[i]);
}

} // namespace chainseg
