// chainseg/cpp/include/chainseg/shard_builder.h
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chainseg/producer.h"
#include "chainseg/records.h"
#include "chainseg/replay_guard.h"
#include "chainseg/shard_state.h"
#include "chainseg/shard_writer.h"
#include "chainseg/stop_signal.h"

namespace chainseg {

struct ShardIndexOptions {
    std::string family{"txids"}; // log tag
    EntityKind entity{EntityKind::Txids};
    std::filesystem::path segments_dir;
    std::string segment_ext{"jsonl"};
    std::filesystem::path state_path;

    ShardLayout layout;
    SitemapIndexOptions index;

    std::string url_prefix;  // loc = url_prefix + key
    std::string key_field;   // empty = default_key_field(entity)
    UrlEntryStyle style;

    uint64_t max_urls_per_shard{50000};
    uint32_t batch_size{5000};
    uint32_t replay_ring_size{50000};

    uint32_t poll_interval_ms{10000};
    uint32_t heartbeat_sec{15};

    std::string meta_key;
};

struct PassStats {
    uint64_t lines_read{0};
    uint64_t entries_written{0};
    uint64_t skipped_malformed{0};
    uint64_t skipped_replay{0};
    uint64_t commits{0};
    uint64_t shards_created{0};
    uint64_t files_advanced{0};
};

// Extends the shards of one sitemap family from the segment stream.
// ShardIndexState is saved only after the shard writes of a commit are fsynced
// and the shard carries its footer again.
class ShardIndexBuilder {
public:
    explicit ShardIndexBuilder(ShardIndexOptions opt, MetaSink* meta = nullptr);

    // Load state and reconcile it with the shards on disk. Called by run().
    void start();

    // Consume everything currently available, committing every batch_size entries.
    // Returns early (after committing) when stop is requested.
    PassStats run_pass(StopSignal& stop);

    // start(), then run_pass() + poll wait until stopped.
    void run(StopSignal& stop);

    const ShardIndexState& state() const { return state_; }
    const ReplayGuard& replay_guard() const { return guard_; }

private:
    struct PendingBatch {
        std::vector<std::string> keys;
    };

    void reconcile(bool fresh_state);
    std::vector<std::string> shard_keys(uint64_t index);
    std::string key_from_loc(const std::string& loc) const;

    bool select_source_file(const std::vector<std::string>& files);
    void consume_file(const std::string& name, StopSignal& stop, PassStats& ps);
    void commit(PendingBatch& batch, const std::string& file, uint64_t offset, PassStats& ps);
    void maybe_heartbeat(size_t queued);

    ShardIndexOptions opt_;
    MetaSink* meta_;
    std::string tag_;
    std::string key_field_;

    ShardIndexState state_;
    ReplayGuard guard_;
    ShardWriter writer_;
    RecordParser parser_;

    bool started_{false};
    std::chrono::steady_clock::time_point last_heartbeat_;
};

} // namespace chainseg
