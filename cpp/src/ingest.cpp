// chainseg/cpp/src/ingest.cpp
#include "chainseg/ingest.h"
#include "chainseg/errors.h"
#include "chainseg/segment_name.h"

#include <iostream>

namespace fs = std::filesystem;

namespace chainseg {

namespace {

enum class CallOutcome { Ok, Stopped, Exhausted };

// Retryable failures back off linearly; Fatal throws.
template <class Result, class Call>
CallOutcome call_with_retry(Call&& call,
                            Result& out,
                            const RetryPolicy& pol,
                            StopSignal& stop,
                            const std::string& tag,
                            const std::string& what,
                            uint64_t& retries) {
    const uint32_t attempts = pol.attempts ? pol.attempts : 1;
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        if (stop.poll_signal()) return CallOutcome::Stopped;
        out = call();
        if (out.status == FetchStatus::Ok) return CallOutcome::Ok;
        if (out.status == FetchStatus::Fatal) {
            throw ChainsegException(what + ": " + out.error);
        }
        std::cerr << tag << " " << what << " failed (attempt " << attempt << "/" << attempts
                  << "): " << out.error << "\n";
        if (attempt == attempts) break;
        ++retries;
        if (stop.wait_for(std::chrono::milliseconds((uint64_t)pol.backoff_ms * attempt))) {
            return CallOutcome::Stopped;
        }
    }
    return CallOutcome::Exhausted;
}

} // namespace

const char* ingest_phase_name(IngestPhase p) {
    switch (p) {
        case IngestPhase::Resume: return "resume";
        case IngestPhase::Catchup: return "catchup";
        case IngestPhase::Follow: return "follow";
        case IngestPhase::Stopped: return "stopped";
    }
    return "unknown";
}

IngestionLoop::IngestionLoop(IngestOptions opt, Producer& producer, MetaSink* meta)
    : opt_(std::move(opt)), producer_(producer), meta_(meta) {
    if (opt_.segment_size == 0) throw ConfigError("segment_size must be > 0");
    if (opt_.out_dir.empty()) throw ConfigError("out_dir is empty");
    if (opt_.state_path.empty()) throw ConfigError("state_path is empty");
    if (opt_.checkpoint_every == 0) opt_.checkpoint_every = 1;

    tag_ = std::string("[chainseg ingest ") + entity_name(opt_.entity) + "]";

    SegmentWriterOptions wo;
    wo.out_dir = opt_.out_dir;
    wo.entity = entity_name(opt_.entity);
    wo.segment_size = opt_.segment_size;
    wo.max_buffered_records = opt_.max_buffered_records;
    writer_ = std::make_unique<SegmentWriter>(std::move(wo));

    state_ = default_checkpoint(entity_name(opt_.entity), opt_.segment_size);
    last_barrier_ = std::chrono::steady_clock::now();
}

IngestionLoop::~IngestionLoop() = default;

void IngestionLoop::resume() {
    const std::string entity = entity_name(opt_.entity);
    const CheckpointLoad load = load_checkpoint(opt_.state_path, default_checkpoint(entity, opt_.segment_size));
    require_checkpoint_matches(load.state, entity, opt_.segment_size);
    state_ = load.state;

    // A checkpoint we wrote ourselves describes exactly which bytes are claimed.
    const bool trusted = !load.created && !load.recovered && state_.segment_bytes_known;

    if (state_.last_position_written >= 0) {
        const uint64_t last = (uint64_t)state_.last_position_written;
        const SegmentRange r = segment_range_for(last, opt_.segment_size);
        std::optional<uint64_t> durable;
        if (trusted && r.start == state_.current_segment_start) durable = state_.segment_bytes_durable;

        stats_.bytes_dropped_on_resume = writer_->open_for_resume(last, durable);
        state_.refresh_segment_for(last);
    } else if (trusted) {
        stats_.bytes_dropped_on_resume = writer_->open_for_resume(0, uint64_t{0});
    } else if (!list_segment_files(opt_.out_dir, entity).empty()) {
        std::cerr << tag_ << " no usable checkpoint but segments exist in " << opt_.out_dir
                  << ", re-ingested records will be appended\n";
    }
    if (stats_.bytes_dropped_on_resume > 0) {
        std::cerr << tag_ << " dropped " << stats_.bytes_dropped_on_resume
                  << " bytes past the checkpoint\n";
    }
    stats_.last_position_written = state_.last_position_written;

    std::cerr << tag_ << " resume: next=" << state_.next_position()
              << " segment=" << state_.current_segment_start << "-" << state_.current_segment_end
              << (load.created ? " (new checkpoint)" : "")
              << (load.recovered ? " (checkpoint reset)" : "") << "\n";
}

IngestionLoop::Outcome IngestionLoop::query_frontier(StopSignal& stop, uint64_t& frontier) {
    FrontierResult res;
    const CallOutcome o = call_with_retry(
        [this] { return producer_.current_frontier(); }, res, opt_.retry, stop, tag_, "frontier", stats_.retries);
    if (o == CallOutcome::Stopped) return Outcome::Stopped;
    if (o == CallOutcome::Exhausted) return Outcome::Aborted;
    frontier = res.frontier;
    return Outcome::Done;
}

IngestionLoop::Outcome IngestionLoop::fetch_position(StopSignal& stop, uint64_t pos, FetchResult& out) {
    const CallOutcome o = call_with_retry(
        [this, pos] { return producer_.fetch(pos); }, out, opt_.retry, stop, tag_,
        "fetch height=" + std::to_string(pos), stats_.retries);
    if (o == CallOutcome::Stopped) return Outcome::Stopped;
    if (o == CallOutcome::Exhausted) return Outcome::Aborted;
    return Outcome::Done;
}

void IngestionLoop::write_position(uint64_t pos, const FetchResult& res) {
    for (const Record& r : res.records) {
        if (record_kind(r) != opt_.entity || record_position(r) != pos) {
            throw ChainsegException("producer returned a " + std::string(entity_name(record_kind(r))) +
                                    " record for height " + std::to_string(record_position(r)) +
                                    " while fetching " + std::to_string(pos));
        }
    }

    writer_->enter_position(pos);
    for (const Record& r : res.records) {
        writer_->write(pos, encode_record_line(r));
    }

    state_.last_position_written = (int64_t)pos;
    state_.records_written_total += res.records.size();
    state_.refresh_segment_for(pos);

    stats_.positions_processed++;
    stats_.records_written += res.records.size();
    stats_.last_position_written = state_.last_position_written;
    since_checkpoint_++;
    since_barrier_++;
}

void IngestionLoop::maybe_barrier() {
    if (!writer_->is_open()) return;
    bool due = opt_.fsync_every > 0 && since_barrier_ >= opt_.fsync_every;
    if (!due && opt_.fsync_interval_ms > 0) {
        due = std::chrono::steady_clock::now() - last_barrier_ >=
              std::chrono::milliseconds(opt_.fsync_interval_ms);
    }
    if (!due) return;
    writer_->durability_barrier();
    since_barrier_ = 0;
    last_barrier_ = std::chrono::steady_clock::now();
}

void IngestionLoop::commit_checkpoint(bool force) {
    if (!force && since_checkpoint_ == 0) return;

    // barrier strictly before the checkpoint that claims the records
    if (writer_->is_open()) {
        writer_->durability_barrier();
        state_.segment_bytes_durable = writer_->durable_bytes();
    } else {
        state_.segment_bytes_durable = 0;
    }
    state_.segment_bytes_known = true;
    state_.segments_completed = state_.current_segment_start / opt_.segment_size;
    if (state_.last_position_written == (int64_t)state_.current_segment_end) state_.segments_completed++;

    save_checkpoint(opt_.state_path, state_);
    stats_.checkpoints_saved++;
    since_checkpoint_ = 0;
    since_barrier_ = 0;
    last_barrier_ = std::chrono::steady_clock::now();

    meta_touch_best_effort(meta_, opt_.meta_key, tag_);
}

IngestionLoop::Outcome IngestionLoop::catch_up(StopSignal& stop, uint64_t target) {
    for (uint64_t pos = state_.next_position(); pos <= target; ++pos) {
        if (stop.poll_signal()) return Outcome::Stopped;

        FetchResult res;
        const Outcome o = fetch_position(stop, pos, res);
        if (o != Outcome::Done) return o;

        write_position(pos, res);

        if (pos == state_.current_segment_end || since_checkpoint_ >= opt_.checkpoint_every) {
            commit_checkpoint(true);
        } else {
            maybe_barrier();
        }

        if (opt_.log_every > 0 && pos % opt_.log_every == 0) {
            std::cerr << tag_ << " height=" << pos << " target=" << target
                      << " records_total=" << state_.records_written_total << "\n";
        }
        if (opt_.throttle_ms > 0 && stop.wait_for(std::chrono::milliseconds(opt_.throttle_ms))) {
            return Outcome::Stopped;
        }
    }
    return Outcome::Done;
}

void IngestionLoop::shutdown() {
    commit_checkpoint(false);
    writer_->close();
    phase_ = IngestPhase::Stopped;
    std::cerr << tag_ << " stopped: last=" << state_.last_position_written
              << " records_total=" << state_.records_written_total << "\n";
}

IngestStats IngestionLoop::run(StopSignal& stop) {
    phase_ = IngestPhase::Resume;
    resume();
    phase_ = IngestPhase::Catchup;

    try {
        while (!stop.poll_signal()) {
            uint64_t frontier = 0;
            Outcome o = query_frontier(stop, frontier);
            if (o == Outcome::Stopped) break;

            if (o == Outcome::Done) {
                const bool eligible = frontier >= opt_.finality_lag &&
                                      state_.next_position() <= frontier - opt_.finality_lag;
                if (eligible) {
                    phase_ = IngestPhase::Catchup;
                    o = catch_up(stop, frontier - opt_.finality_lag);
                    if (o == Outcome::Stopped) break;
                    if (o == Outcome::Done) continue;
                }
            }

            if (o == Outcome::Aborted) {
                stats_.aborted_iterations++;
                std::cerr << tag_ << " iteration aborted after retries, cooling down "
                          << opt_.retry.cooldown_ms << "ms\n";
                commit_checkpoint(false);
                if (stop.wait_for(std::chrono::milliseconds(opt_.retry.cooldown_ms))) break;
                continue;
            }

            // caught up with the eligible frontier
            commit_checkpoint(false);
            if (opt_.mode == IngestMode::Backfill) break;
            if (phase_ != IngestPhase::Follow) {
                std::cerr << tag_ << " caught up at " << state_.last_position_written
                          << " (frontier " << frontier << "), following\n";
            }
            phase_ = IngestPhase::Follow;
            if (stop.wait_for(std::chrono::milliseconds(opt_.poll_interval_ms))) break;
        }
    } catch (const DurabilityError&) {
        // nothing written after the failure can be trusted; the last checkpoint stands
        phase_ = IngestPhase::Stopped;
        throw;
    } catch (const std::exception& e) {
        std::cerr << tag_ << " stopping on error: " << e.what() << "\n";
        try {
            shutdown();
        } catch (const std::exception& e2) {
            std::cerr << tag_ << " shutdown after error failed: " << e2.what() << "\n";
        }
        throw;
    }

    stats_.final_phase = phase_;
    shutdown();
    return stats_;
}

} // namespace chainseg
