// chainseg/cpp/src/shard_builder.cpp
#include "chainseg/shard_builder.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"
#include "chainseg/segment_name.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chainseg {

namespace {

constexpr size_t kReadChunk = 1u << 20;

struct FdCloser {
    int fd{-1};
    ~FdCloser() {
        if (fd >= 0) ::close(fd);
    }
};

} // namespace

ShardIndexBuilder::ShardIndexBuilder(ShardIndexOptions opt, MetaSink* meta)
    : opt_(std::move(opt)),
      meta_(meta),
      guard_(opt_.replay_ring_size),
      writer_(opt_.layout) {
    if (opt_.max_urls_per_shard == 0) throw ConfigError("max_urls_per_shard must be > 0");
    if (opt_.batch_size == 0) throw ConfigError("batch_size must be > 0");
    if (opt_.replay_ring_size != 0 && opt_.replay_ring_size < opt_.batch_size) {
        throw ConfigError("replay_ring_size must be 0 or >= batch_size");
    }
    if (opt_.segments_dir.empty()) throw ConfigError("segments_dir is empty");
    if (opt_.state_path.empty()) throw ConfigError("state_path is empty");

    tag_ = "[chainseg sitemap " + opt_.family + "]";
    key_field_ = opt_.key_field.empty() ? default_key_field(opt_.entity) : opt_.key_field;
    last_heartbeat_ = std::chrono::steady_clock::now();
}

void ShardIndexBuilder::start() {
    const ShardStateLoad load = load_shard_state(opt_.state_path);
    state_ = load.state;
    guard_.load(state_.replay_ring);

    reconcile(load.created || load.recovered);

    // a crash between the state save and the index rebuild leaves the index a shard short
    if (!opt_.index.index_path.empty() && !list_shard_indices(opt_.layout).empty()) {
        const size_t n = rebuild_sitemap_index(opt_.layout, opt_.index);
        std::cerr << tag_ << " sitemap index written (" << n << " shards)\n";
    }
    started_ = true;

    std::cerr << tag_ << " start: file=" << (state_.source_file.empty() ? "-" : state_.source_file)
              << " off=" << state_.source_offset << " shard=" << state_.shard_index
              << " urls_in_shard=" << state_.urls_in_shard << " total=" << state_.written_total << "\n";
}

std::string ShardIndexBuilder::key_from_loc(const std::string& loc) const {
    if (!opt_.url_prefix.empty() && loc.compare(0, opt_.url_prefix.size(), opt_.url_prefix) == 0) {
        return loc.substr(opt_.url_prefix.size());
    }
    return loc;
}

std::vector<std::string> ShardIndexBuilder::shard_keys(uint64_t index) {
    // open + close restores a missing footer before the entries are counted
    writer_.open_for_append(index);
    writer_.close();

    const fs::path p = opt_.layout.shard_path(index);
    std::string doc;
    if (!read_file_to_string(p, doc)) throw DurabilityError("cannot read shard " + p.string());

    std::vector<std::string> keys;
    for (const auto& loc : extract_locs(doc)) keys.push_back(key_from_loc(loc));
    return keys;
}

// Entries that reached a shard after the last state save are counted back in,
// and their keys go into the replay ring so the re-read batch skips them.
void ShardIndexBuilder::reconcile(bool fresh_state) {
    const std::vector<uint64_t> shards = list_shard_indices(opt_.layout);
    if (shards.empty()) return;

    if (fresh_state) {
        uint64_t total = 0;
        std::vector<std::string> last_keys;
        for (uint64_t idx : shards) {
            last_keys = shard_keys(idx);
            total += last_keys.size();
        }
        state_.shard_index = shards.back();
        state_.urls_in_shard = last_keys.size();
        state_.written_total = total;
        for (const auto& k : last_keys) guard_.push(k);
        state_.replay_ring = guard_.snapshot();
        save_shard_state(opt_.state_path, state_);
        std::cerr << tag_ << " no saved state, resuming on existing shard " << state_.shard_index
                  << " (" << state_.urls_in_shard << " urls, " << total << " total)\n";
        return;
    }

    bool changed = false;

    if (std::binary_search(shards.begin(), shards.end(), state_.shard_index)) {
        const std::vector<std::string> keys = shard_keys(state_.shard_index);
        const uint64_t n = keys.size();
        if (n > state_.urls_in_shard) {
            for (uint64_t i = state_.urls_in_shard; i < n; ++i) guard_.push(keys[(size_t)i]);
            std::cerr << tag_ << " shard " << state_.shard_index << ": adopted " << (n - state_.urls_in_shard)
                      << " entries written after the last state save\n";
            state_.written_total += n - state_.urls_in_shard;
            state_.urls_in_shard = n;
            changed = true;
        } else if (n < state_.urls_in_shard) {
            std::cerr << tag_ << " shard " << state_.shard_index << ": holds " << n
                      << " entries, state recorded " << state_.urls_in_shard << "\n";
            const uint64_t lost = state_.urls_in_shard - n;
            state_.written_total -= std::min(lost, state_.written_total);
            state_.urls_in_shard = n;
            changed = true;
        }
    }

    for (uint64_t idx : shards) {
        if (idx <= state_.shard_index) continue;
        const std::vector<std::string> keys = shard_keys(idx);
        for (const auto& k : keys) guard_.push(k);
        state_.shard_index = idx;
        state_.urls_in_shard = keys.size();
        state_.written_total += keys.size();
        changed = true;
        std::cerr << tag_ << " adopted shard " << idx << " (" << keys.size() << " entries)\n";
    }

    if (changed) {
        state_.replay_ring = guard_.snapshot();
        save_shard_state(opt_.state_path, state_);
    }
}

bool ShardIndexBuilder::select_source_file(const std::vector<std::string>& files) {
    if (files.empty()) return false;

    if (state_.source_file.empty()) {
        state_.source_file = files.front();
        state_.source_offset = 0;
        save_shard_state(opt_.state_path, state_);
        return true;
    }
    if (std::binary_search(files.begin(), files.end(), state_.source_file)) return true;

    // current file vanished: continue with the lexically next one
    auto it = std::upper_bound(files.begin(), files.end(), state_.source_file);
    if (it == files.end()) {
        std::cerr << tag_ << " segment " << state_.source_file << " missing and no next file yet\n";
        return false;
    }
    std::cerr << tag_ << " segment " << state_.source_file << " vanished, moving to " << *it << "\n";
    state_.source_file = *it;
    state_.source_offset = 0;
    save_shard_state(opt_.state_path, state_);
    return true;
}

void ShardIndexBuilder::consume_file(const std::string& name, StopSignal& stop, PassStats& ps) {
    const fs::path p = opt_.segments_dir / name;
    FdCloser in;
    in.fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (in.fd < 0) {
        if (errno == ENOENT) return; // picked up as vanished on the next pass
        throw DurabilityError("cannot open segment " + p.string() + ": " + std::strerror(errno));
    }
    struct stat st {};
    if (::fstat(in.fd, &st) != 0) throw DurabilityError("fstat failed " + p.string());
    const uint64_t size = (uint64_t)st.st_size;

    // a resumed ingest may have cut the file back; its bytes come back identical
    if (state_.source_offset > size) return;

    PendingBatch batch;
    uint64_t consumed = state_.source_offset;
    uint64_t read_off = state_.source_offset;
    uint64_t carry_start = state_.source_offset;
    std::string carry;
    std::vector<char> chunk(kReadChunk);

    while (read_off < size) {
        const size_t want = (size_t)std::min<uint64_t>(chunk.size(), size - read_off);
        const ssize_t n = ::pread(in.fd, chunk.data(), want, (off_t)read_off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw DurabilityError("pread failed " + p.string() + ": " + std::strerror(errno));
        }
        if (n == 0) break;
        carry.append(chunk.data(), (size_t)n);
        read_off += (uint64_t)n;

        size_t begin = 0;
        for (;;) {
            const size_t nl = carry.find('\n', begin);
            if (nl == std::string::npos) break;
            const std::string_view line(carry.data() + begin, nl - begin);
            const uint64_t line_off = carry_start + begin;
            begin = nl + 1;
            consumed = carry_start + begin;

            if (line.empty()) continue;
            ps.lines_read++;

            Record rec;
            std::string err;
            std::optional<std::string> key;
            if (parser_.parse(line, opt_.entity, rec, &err)) {
                key = record_field_text(rec, key_field_);
                if (!key || key->empty()) err = "no " + key_field_ + " field";
            }
            if (!key || key->empty()) {
                ps.skipped_malformed++;
                std::cerr << tag_ << " skipping malformed line " << name << ":" << line_off << ": " << err << "\n";
                continue;
            }
            if (guard_.contains(*key)) {
                ps.skipped_replay++;
                continue;
            }
            guard_.push(*key);
            batch.keys.push_back(std::move(*key));

            if (batch.keys.size() >= opt_.batch_size) {
                commit(batch, name, consumed, ps);
                if (stop.poll_signal()) return;
            }
            maybe_heartbeat(batch.keys.size());
        }
        carry.erase(0, begin);
        carry_start += begin;
    }

    // only complete lines count; a torn tail waits for the writer
    if (!batch.keys.empty() || consumed != state_.source_offset) {
        commit(batch, name, consumed, ps);
    }
}

void ShardIndexBuilder::commit(PendingBatch& batch, const std::string& file, uint64_t offset, PassStats& ps) {
    bool new_shard = false;
    const size_t n = batch.keys.size();

    if (n > 0) {
        if (writer_.open_for_append(state_.shard_index)) {
            new_shard = true;
            ps.shards_created++;
        }
        for (const auto& key : batch.keys) {
            if (state_.urls_in_shard >= opt_.max_urls_per_shard) {
                writer_.close();
                state_.shard_index++;
                state_.urls_in_shard = 0;
                if (writer_.open_for_append(state_.shard_index)) {
                    new_shard = true;
                    ps.shards_created++;
                }
                std::cerr << tag_ << " rotated to shard " << state_.shard_index << "\n";
            }
            writer_.append_entry(format_url_entry(opt_.url_prefix + key, opt_.style));
            state_.urls_in_shard++;
            state_.written_total++;
        }
        // footer back + fsync before the state claims these entries
        writer_.close();
    }

    state_.source_file = file;
    state_.source_offset = offset;
    state_.replay_ring = guard_.snapshot();
    save_shard_state(opt_.state_path, state_);

    if (new_shard && !opt_.index.index_path.empty()) {
        const size_t shards = rebuild_sitemap_index(opt_.layout, opt_.index);
        std::cerr << tag_ << " sitemap index rebuilt (" << shards << " shards)\n";
    }

    ps.commits++;
    batch.keys.clear();
    if (n == 0) return;

    ps.entries_written += n;
    meta_touch_best_effort(meta_, opt_.meta_key, tag_);
    std::cerr << tag_ << " +" << n << " urls | total=" << state_.written_total << " | shard="
              << state_.shard_index << " (" << state_.urls_in_shard << ") | file=" << file
              << " off=" << offset << "\n";
}

void ShardIndexBuilder::maybe_heartbeat(size_t queued) {
    if (opt_.heartbeat_sec == 0) return;
    const auto now = std::chrono::steady_clock::now();
    if (now - last_heartbeat_ < std::chrono::seconds(opt_.heartbeat_sec)) return;
    last_heartbeat_ = now;
    std::cerr << tag_ << " heartbeat | file=" << (state_.source_file.empty() ? "-" : state_.source_file)
              << " off=" << state_.source_offset << " | shard=" << state_.shard_index
              << " urls_in_shard=" << state_.urls_in_shard << " | queued=" << queued << "\n";
}

PassStats ShardIndexBuilder::run_pass(StopSignal& stop) {
    if (!started_) start();

    PassStats ps;
    const std::string entity = entity_name(opt_.entity);
    while (!stop.poll_signal()) {
        const std::vector<std::string> files = list_segment_files(opt_.segments_dir, entity, opt_.segment_ext);
        if (!select_source_file(files)) break;

        consume_file(state_.source_file, stop, ps);
        if (stop.stop_requested()) break;

        auto it = std::upper_bound(files.begin(), files.end(), state_.source_file);
        if (it == files.end()) break; // tip reached

        state_.source_file = *it;
        state_.source_offset = 0;
        save_shard_state(opt_.state_path, state_);
        ps.files_advanced++;
        std::cerr << tag_ << " next file -> " << state_.source_file << "\n";
    }
    return ps;
}

void ShardIndexBuilder::run(StopSignal& stop) {
    if (!started_) start();

    std::cerr << tag_ << " segments=" << opt_.segments_dir << " shards=" << opt_.layout.dir
              << " state=" << opt_.state_path << "\n";
    std::cerr << tag_ << " batch=" << opt_.batch_size << " poll=" << opt_.poll_interval_ms
              << "ms max_urls=" << opt_.max_urls_per_shard << "\n";

    while (!stop.poll_signal()) {
        run_pass(stop);
        if (stop.stop_requested()) break;
        maybe_heartbeat(0);
        if (stop.wait_for(std::chrono::milliseconds(opt_.poll_interval_ms))) break;
    }
    writer_.close();
    std::cerr << tag_ << " stopped: total=" << state_.written_total << " shard=" << state_.shard_index << "\n";
}

} // namespace chainseg
