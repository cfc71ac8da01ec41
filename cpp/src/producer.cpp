// chainseg/cpp/src/producer.cpp
#include "chainseg/producer.h"
#include "chainseg/format.h"

#include <iostream>

namespace chainseg {

void meta_touch_best_effort(MetaSink* sink, const std::string& key, const std::string& tag) {
    if (!sink || key.empty()) return;
    try {
        sink->mark_dirty(key);
        sink->set_timestamp(key, utc_now_iso());
    } catch (const std::exception& e) {
        std::cerr << tag << " meta update failed (" << key << "): " << e.what() << "\n";
    }
}

} // namespace chainseg
