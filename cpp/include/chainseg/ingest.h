// chainseg/cpp/include/chainseg/ingest.h
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "chainseg/checkpoint.h"
#include "chainseg/producer.h"
#include "chainseg/records.h"
#include "chainseg/segment_writer.h"
#include "chainseg/stop_signal.h"

namespace chainseg {

struct RetryPolicy {
    uint32_t attempts{5};
    uint32_t backoff_ms{500}; // linear: backoff_ms * attempt
    uint32_t cooldown_ms{5000}; // after an aborted iteration
};

enum class IngestMode {
    Backfill, // stop once caught up with the eligible frontier
    Follow,   // keep polling for new positions
};

enum class IngestPhase {
    Resume,
    Catchup,
    Follow,
    Stopped,
};

const char* ingest_phase_name(IngestPhase p);

struct IngestOptions {
    EntityKind entity{EntityKind::Txids};
    std::filesystem::path out_dir;
    std::filesystem::path state_path;
    uint64_t segment_size{10000};

    // positions within `finality_lag` of the frontier are not yet eligible
    uint64_t finality_lag{0};

    uint32_t checkpoint_every{1000}; // positions between checkpoints
    uint32_t fsync_every{0};         // positions between extra barriers, 0 = off
    uint32_t fsync_interval_ms{0};   // time-based barrier, 0 = off
    uint32_t max_buffered_records{200000};

    uint32_t poll_interval_ms{10000};
    uint32_t throttle_ms{0};   // pause after every position
    uint32_t log_every{1000};  // progress line every N positions, 0 = off

    RetryPolicy retry;
    IngestMode mode{IngestMode::Follow};

    // MetaSink key touched after each checkpoint, empty = none
    std::string meta_key;
};

struct IngestStats {
    uint64_t positions_processed{0};
    uint64_t records_written{0};
    uint64_t checkpoints_saved{0};
    uint64_t retries{0};
    uint64_t aborted_iterations{0};
    uint64_t bytes_dropped_on_resume{0};
    int64_t last_position_written{-1};
    IngestPhase final_phase{IngestPhase::Stopped};
};

// Pulls positions from a Producer in ascending order and appends their records to
// fixed-range segment files. A checkpoint is saved only after a durability barrier
// covers every record it claims.
class IngestionLoop {
public:
    IngestionLoop(IngestOptions opt, Producer& producer, MetaSink* meta = nullptr);
    ~IngestionLoop();

    IngestionLoop(const IngestionLoop&) = delete;
    IngestionLoop& operator=(const IngestionLoop&) = delete;

    // Runs until stop is requested (or, in Backfill mode, until caught up).
    // Throws DurabilityError / ConfigError / ChainsegException on unrecoverable errors.
    IngestStats run(StopSignal& stop);

    const CheckpointState& checkpoint() const { return state_; }
    IngestPhase phase() const { return phase_; }

private:
    enum class Outcome { Done, Stopped, Aborted };

    void resume();
    Outcome query_frontier(StopSignal& stop, uint64_t& frontier);
    Outcome catch_up(StopSignal& stop, uint64_t target);
    Outcome fetch_position(StopSignal& stop, uint64_t pos, FetchResult& out);
    void write_position(uint64_t pos, const FetchResult& res);
    void maybe_barrier();
    void commit_checkpoint(bool force);
    void shutdown();

    IngestOptions opt_;
    Producer& producer_;
    MetaSink* meta_;
    std::string tag_;

    std::unique_ptr<SegmentWriter> writer_;
    CheckpointState state_;
    IngestPhase phase_{IngestPhase::Resume};
    IngestStats stats_;

    uint64_t since_checkpoint_{0};
    uint64_t since_barrier_{0};
    std::chrono::steady_clock::time_point last_barrier_;
};

} // namespace chainseg
