// chainseg/cpp/include/chainseg/producer.h
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "chainseg/records.h"

namespace chainseg {

enum class FetchStatus {
    Ok,
    Retryable, // network, timeout, node warming up
    Fatal,     // malformed response, unknown method, bad auth
};

struct FrontierResult {
    FetchStatus status{FetchStatus::Ok};
    uint64_t frontier{0};
    std::string error;
};

struct FetchResult {
    FetchStatus status{FetchStatus::Ok};
    std::vector<Record> records; // all records of one position, producer order
    std::string error;
};

// Source of the ledger stream. Calls may block; failures come back typed.
class Producer {
public:
    virtual ~Producer() = default;

    virtual FrontierResult current_frontier() = 0;
    virtual FetchResult fetch(uint64_t position) = 0;
};

// Best-effort bookkeeping (last build timestamps, dirty markers).
// The core logs and drops any exception thrown from here.
class MetaSink {
public:
    virtual ~MetaSink() = default;

    virtual void mark_dirty(const std::string& key) = 0;
    virtual void set_timestamp(const std::string& key, const std::string& value) = 0;
};

// mark_dirty + set_timestamp(now) with failures logged under `tag`
void meta_touch_best_effort(MetaSink* sink, const std::string& key, const std::string& tag);

} // namespace chainseg
