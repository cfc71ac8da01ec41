#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "chainseg/errors.h"
#include "chainseg/shard_builder.h"
#include "chainseg/sitemap.h"
#include "chainseg/validator.h"

using namespace chainseg;
namespace fs = std::filesystem;

static const std::string kPrefix = "https://example.org/tx/";

static fs::path mk_tmp_dir(const std::string& name) {
    auto p = fs::temp_directory_path() / ("chainseg_builder_" + std::to_string(::getpid())) / name;
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void append_txids(const fs::path& file, uint64_t height, const std::vector<std::string>& txids) {
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::app | std::ios::binary);
    for (const auto& t : txids) out << "{\"height\":" << height << ",\"txid\":\"" << t << "\"}\n";
}

static ShardIndexOptions opts(const fs::path& root, uint64_t max_urls) {
    ShardIndexOptions o;
    o.family = "test";
    o.entity = EntityKind::Txids;
    o.segments_dir = root / "segments";
    o.state_path = root / "state" / "sitemap_state.json";
    o.layout.dir = root / "shards";
    o.layout.prefix = "sitemap_test";
    o.index.index_path = root / "shards" / "sitemap_index.xml";
    o.index.base_url = "https://example.org/sitemaps/";
    o.url_prefix = kPrefix;
    o.max_urls_per_shard = max_urls;
    o.batch_size = 2;
    o.replay_ring_size = 100;
    o.poll_interval_ms = 1;
    o.heartbeat_sec = 0;
    return o;
}

static std::vector<std::string> shard_keys(const ShardIndexOptions& o, uint64_t idx) {
    std::vector<std::string> keys;
    for (const auto& loc : extract_locs(slurp(o.layout.shard_path(idx)))) keys.push_back(loc.substr(kPrefix.size()));
    return keys;
}

static size_t count_of(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t p = s.find(needle); p != std::string::npos; p = s.find(needle, p + 1)) ++n;
    return n;
}

static fs::path seg(const ShardIndexOptions& o, const char* name) { return o.segments_dir / name; }

static void test_four_entries_max_three() {
    auto root = mk_tmp_dir("abcd");
    auto o = opts(root, 3);
    o.batch_size = 4;
    append_txids(seg(o, "txids_000000000_000009999.jsonl"), 1, {"a", "b", "c", "d"});

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 4);
    assert(ps.commits == 1);
    assert(ps.shards_created == 2);

    assert((shard_keys(o, 1) == std::vector<std::string>{"a", "b", "c"}));
    assert((shard_keys(o, 2) == std::vector<std::string>{"d"}));
    assert(!fs::exists(o.layout.shard_path(3)));
    assert(validate_shard_dir(o.layout, 3).ok);

    const std::string index = slurp(o.index.index_path);
    assert(count_of(index, "<sitemap>") == 2);
    assert(index.find("https://example.org/sitemaps/sitemap_test_000002.xml") != std::string::npos);

    assert(b.state().shard_index == 2);
    assert(b.state().urls_in_shard == 1);
    assert(b.state().written_total == 4);
    assert(b.state().source_file == "txids_000000000_000009999.jsonl");
    assert(b.state().source_offset == fs::file_size(seg(o, "txids_000000000_000009999.jsonl")));

    auto l = load_shard_state(o.state_path);
    assert(!l.recovered && l.state.written_total == 4 && l.state.replay_ring.size() == 4);
}

static void test_rotation_threshold() {
    auto root = mk_tmp_dir("rotate");
    auto o = opts(root, 3);
    const auto f = seg(o, "txids_000000000_000009999.jsonl");
    append_txids(f, 1, {"a", "b", "c"});

    StopSignal stop;
    ShardIndexBuilder b(o);
    b.run_pass(stop);
    assert(list_shard_indices(o.layout).size() == 1);
    assert(b.state().urls_in_shard == 3);

    append_txids(f, 2, {"d"});
    auto ps = b.run_pass(stop);
    assert(ps.shards_created == 1);
    assert(list_shard_indices(o.layout).size() == 2);
    assert(count_of(slurp(o.index.index_path), "<sitemap>") == 2);

    // nothing new: nothing written, state unchanged
    ps = b.run_pass(stop);
    assert(ps.entries_written == 0 && ps.commits == 0);
}

// Shard writes that made it to disk while the state save did not are not re-emitted.
static void check_replay_safety(uint64_t max_urls) {
    auto root = mk_tmp_dir("replay_" + std::to_string(max_urls));
    auto o = opts(root, max_urls);
    const auto f = seg(o, "txids_000000000_000009999.jsonl");

    append_txids(f, 1, {"k1", "k2", "k3"});
    std::string saved_state;
    {
        StopSignal stop;
        ShardIndexBuilder b(o);
        b.run_pass(stop);
        saved_state = slurp(o.state_path);
    }

    append_txids(f, 2, {"k4", "k5"});
    {
        StopSignal stop;
        ShardIndexBuilder b(o);
        b.run_pass(stop);
        assert(b.state().written_total == 5);
    }

    // lose the last state save, and the footer of the newest shard with it
    std::ofstream(o.state_path, std::ios::trunc | std::ios::binary) << saved_state;
    const uint64_t last = list_shard_indices(o.layout).back();
    const std::string doc = slurp(o.layout.shard_path(last));
    std::ofstream(o.layout.shard_path(last), std::ios::trunc | std::ios::binary)
        << doc.substr(0, doc.size() - std::string(kUrlsetFooter).size());

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 0);
    assert(ps.skipped_replay == 2);
    assert(b.state().written_total == 5);
    assert(validate_shard_dir(o.layout, max_urls).ok);

    std::vector<std::string> all;
    for (uint64_t idx : list_shard_indices(o.layout)) {
        auto keys = shard_keys(o, idx);
        all.insert(all.end(), keys.begin(), keys.end());
    }
    assert((all == std::vector<std::string>{"k1", "k2", "k3", "k4", "k5"}));

    // the stream continues normally afterwards
    append_txids(f, 3, {"k6"});
    ps = b.run_pass(stop);
    assert(ps.entries_written == 1);
    assert(b.state().written_total == 6);
}

static void test_malformed_and_torn_lines() {
    auto root = mk_tmp_dir("malformed");
    auto o = opts(root, 100);
    const auto f = seg(o, "txids_000000000_000009999.jsonl");
    append_txids(f, 1, {"a"});
    {
        std::ofstream out(f, std::ios::app | std::ios::binary);
        out << "garbage\n{\"height\":2}\n";
    }
    append_txids(f, 3, {"b"});
    const uint64_t complete = fs::file_size(f);
    std::ofstream(f, std::ios::app | std::ios::binary) << "{\"height\":4,\"txid\":\"c";

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 2);
    assert(ps.skipped_malformed == 2);
    assert(b.state().source_offset == complete);
    assert((shard_keys(o, 1) == std::vector<std::string>{"a", "b"}));

    // the torn line is consumed once the writer completes it
    std::ofstream(f, std::ios::app | std::ios::binary) << "\"}\n";
    ps = b.run_pass(stop);
    assert(ps.entries_written == 1);
    assert(b.state().source_offset == fs::file_size(f));
    assert((shard_keys(o, 1) == std::vector<std::string>{"a", "b", "c"}));
}

static void test_file_order_and_vanished_file() {
    auto root = mk_tmp_dir("files");
    auto o = opts(root, 100);
    const auto f0 = seg(o, "txids_000000000_000000009.jsonl");
    const auto f1 = seg(o, "txids_000000010_000000019.jsonl");
    const auto f2 = seg(o, "txids_000000020_000000029.jsonl");
    append_txids(f0, 1, {"a"});
    append_txids(f1, 11, {"b"});

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 2);
    assert(ps.files_advanced == 1);
    assert(b.state().source_file == "txids_000000010_000000019.jsonl");

    // current file rotated away upstream: continue with the next one at offset 0
    append_txids(f2, 21, {"c"});
    fs::remove(f1);
    ps = b.run_pass(stop);
    assert(ps.entries_written == 1);
    assert(b.state().source_file == "txids_000000020_000000029.jsonl");
    assert((shard_keys(o, 1) == std::vector<std::string>{"a", "b", "c"}));
}

static void test_fresh_state_with_existing_shards() {
    auto root = mk_tmp_dir("fresh");
    auto o = opts(root, 3);
    append_txids(seg(o, "txids_000000000_000009999.jsonl"), 1, {"a", "b", "c", "d"});
    {
        StopSignal stop;
        ShardIndexBuilder b(o);
        b.run_pass(stop);
    }
    fs::remove(o.state_path);

    ShardIndexBuilder b(o);
    b.start();
    assert(b.state().shard_index == 2);
    assert(b.state().urls_in_shard == 1);
    assert(b.state().written_total == 4);
    assert(b.replay_guard().contains("d"));
}

static void test_state_file() {
    auto root = mk_tmp_dir("state");
    ShardIndexState s;
    std::string err;
    auto legacy = nlohmann::json::parse(R"({"current_file": "/data/segments/txids/txids_000000000_000009999.jsonl",
        "offset": 120, "shard_idx": 3, "urls_in_shard": 7, "written_total": 100007,
        "last_txids": ["t1", "t2"], "updated_utc": "2024-01-01T00:00:00Z"})");
    assert(shard_state_from_json(legacy, s, &err));
    assert(s.source_file == "txids_000000000_000009999.jsonl");
    assert(s.source_offset == 120 && s.shard_index == 3 && s.urls_in_shard == 7);
    assert(s.written_total == 100007);
    assert((s.replay_ring == std::vector<std::string>{"t1", "t2"}));

    assert(!shard_state_from_json(nlohmann::json::parse(R"({"shard_index": 0})"), s, &err));
    assert(!shard_state_from_json(nlohmann::json::parse(R"({"source_offset": "x"})"), s, &err));

    const auto path = root / "state.json";
    std::ofstream(path) << "{\"source_offset\": 12";
    auto l = load_shard_state(path);
    assert(l.recovered && !l.created);
    assert(l.state.shard_index == 1 && l.state.source_offset == 0);
    // the reset state was persisted
    assert(!load_shard_state(path).recovered);

    auto fresh = load_shard_state(root / "missing" / "state.json");
    assert(fresh.created && fs::exists(root / "missing" / "state.json"));

    if (::geteuid() != 0) {
        fs::permissions(path, fs::perms::none);
        bool threw = false;
        try {
            load_shard_state(path);
        } catch (const DurabilityError&) {
            threw = true;
        }
        assert(threw);
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);
        assert(!load_shard_state(path).recovered);
    }
}

// State saved with the new shard, index rebuild lost: the next start lists it.
static void test_index_caught_up_on_start() {
    auto root = mk_tmp_dir("index_lag");
    auto o = opts(root, 3);
    const auto f = seg(o, "txids_000000000_000009999.jsonl");
    append_txids(f, 1, {"a", "b", "c"});
    std::string one_shard_index;
    {
        StopSignal stop;
        ShardIndexBuilder b(o);
        b.run_pass(stop);
        one_shard_index = slurp(o.index.index_path);
        append_txids(f, 2, {"d"});
        b.run_pass(stop);
        assert(b.state().shard_index == 2);
    }
    std::ofstream(o.index.index_path, std::ios::trunc | std::ios::binary) << one_shard_index;
    assert(count_of(slurp(o.index.index_path), "<sitemap>") == 1);

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 0 && ps.shards_created == 0);
    assert(count_of(slurp(o.index.index_path), "<sitemap>") == list_shard_indices(o.layout).size());
    assert(count_of(slurp(o.index.index_path), "<sitemap>") == 2);
}

// A ring smaller than one batch cannot hold the keys of a replayed batch.
static void test_replay_ring_smaller_than_batch_rejected() {
    auto root = mk_tmp_dir("small_ring");
    auto o = opts(root, 100);
    o.batch_size = 4;
    o.replay_ring_size = 2;
    bool threw = false;
    try {
        ShardIndexBuilder b(o);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    o.replay_ring_size = 0;
    ShardIndexBuilder disabled(o);
    o.replay_ring_size = 4;
    ShardIndexBuilder exact(o);
}

// Ring exactly one batch: a whole lost batch is still recognised on restart.
static void test_replay_ring_of_one_batch() {
    auto root = mk_tmp_dir("ring_one_batch");
    auto o = opts(root, 100);
    o.batch_size = 4;
    o.replay_ring_size = 4;
    const auto f = seg(o, "txids_000000000_000009999.jsonl");

    std::string empty_state;
    {
        StopSignal stop;
        ShardIndexBuilder b(o);
        b.start();
        empty_state = slurp(o.state_path);
        append_txids(f, 1, {"a", "b", "c", "d"});
        b.run_pass(stop);
    }
    std::ofstream(o.state_path, std::ios::trunc | std::ios::binary) << empty_state;

    StopSignal stop;
    ShardIndexBuilder b(o);
    auto ps = b.run_pass(stop);
    assert(ps.entries_written == 0);
    assert(ps.skipped_replay == 4);
    assert((shard_keys(o, 1) == std::vector<std::string>{"a", "b", "c", "d"}));
}

int main() {
    test_four_entries_max_three();
    test_rotation_threshold();
    check_replay_safety(3);
    check_replay_safety(100);
    test_malformed_and_torn_lines();
    test_file_order_and_vanished_file();
    test_fresh_state_with_existing_shards();
    test_state_file();
    test_index_caught_up_on_start();
    test_replay_ring_smaller_than_batch_rejected();
    test_replay_ring_of_one_batch();

    fs::remove_all(fs::temp_directory_path() / ("chainseg_builder_" + std::to_string(::getpid())));
    return 0;
}
