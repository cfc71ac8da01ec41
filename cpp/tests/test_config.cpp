#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "chainseg/config.h"
#include "chainseg/errors.h"

using namespace chainseg;
using json = nlohmann::json;
namespace fs = std::filesystem;

static bool rejects(const json& j) {
    try {
        config_from_json(j);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

static void test_defaults() {
    auto cfg = config_from_json(json::parse(R"({"ingest":{"txids":{}},"sitemap":{"blocks":{}}})"));
    assert(cfg.rpc.url == "http://127.0.0.1:8332");
    assert(cfg.rpc.timeout_sec == 30);
    assert(cfg.meta_db.empty());

    const auto& in = find_ingest(cfg, "txids");
    assert(in.entity == EntityKind::Txids);
    assert(in.out_dir == fs::path("data/segments/txids"));
    assert(in.state_path == fs::path("data/state/txids_checkpoint.json"));
    assert(in.segment_size == 10000);
    assert(in.finality_lag == 2);
    assert(in.mode == IngestMode::Follow);
    assert(in.poll_interval_ms == 10000);

    const auto& sm = find_sitemap(cfg, "blocks");
    assert(sm.entity == EntityKind::Blocks);
    assert(sm.segments_dir == fs::path("data/segments/blocks"));
    assert(sm.state_path == fs::path("data/state/sitemap_blocks_state.json"));
    assert(sm.layout.dir == fs::path("data/sitemaps/blocks"));
    assert(sm.layout.prefix == "sitemap_blocks");
    assert(sm.index.index_path == fs::path("data/sitemaps/sitemap_blocks_index.xml"));
    assert(sm.key_field == "height");
    assert(sm.style.priority == "0.7");
    assert(sm.max_urls_per_shard == 50000);
}

static void test_explicit_values() {
    auto cfg = config_from_json(json::parse(R"({
        "rpc": {"url": "http://node:18332", "user": "u", "password": "p", "timeout_sec": 5},
        "meta_db": "meta.sqlite3",
        "ingest": {"addr": {"entity": "addresses", "segment_size": 1000, "confirmations": 6,
                            "poll_interval_sec": 0.5, "mode": "backfill", "retry_attempts": 9}},
        "sitemap": {"tx": {"entity": "txids", "url_prefix": "https://example.org/tx/",
                           "max_urls_per_shard": 100, "extra_locs": ["https://example.org/static.xml"]}}
    })"));
    assert(cfg.rpc.url == "http://node:18332");
    assert(cfg.rpc.user == "u" && cfg.rpc.password == "p");
    assert(cfg.meta_db == fs::path("meta.sqlite3"));

    const auto& in = find_ingest(cfg, "addr");
    assert(in.entity == EntityKind::Addresses);
    assert(in.out_dir == fs::path("data/segments/addresses"));
    assert(in.segment_size == 1000);
    assert(in.finality_lag == 6);
    assert(in.poll_interval_ms == 500);
    assert(in.mode == IngestMode::Backfill);
    assert(in.retry.attempts == 9);

    const auto& sm = find_sitemap(cfg, "tx");
    assert(sm.entity == EntityKind::Txids);
    assert(sm.layout.prefix == "sitemap_tx");
    assert(sm.key_field == "txid");
    assert(sm.style.priority == "0.8");
    assert(sm.index.extra_locs.size() == 1);

    bool threw = false;
    try {
        find_ingest(cfg, "nope");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
}

static void test_invalid() {
    assert(rejects(json::array()));
    assert(rejects(json::parse(R"({"rpc": "x"})")));
    assert(rejects(json::parse(R"({"ingest": {"x": {"entity": "utxos"}}})")));
    assert(rejects(json::parse(R"({"ingest": {"txids": {"segment_size": 0}}})")));
    assert(rejects(json::parse(R"({"ingest": {"txids": {"segment_size": -5}}})")));
    assert(rejects(json::parse(R"({"ingest": {"txids": {"mode": "sideways"}}})")));
    assert(rejects(json::parse(R"({"ingest": {"txids": {"out_dir": 7}}})")));
    assert(rejects(json::parse(R"({"sitemap": {"txids": {"max_urls_per_shard": 0}}})")));
    assert(rejects(json::parse(R"({"sitemap": {"txids": {"extra_locs": "x"}}})")));
    assert(rejects(json::parse(R"({"sitemap": {"txids": {"batch_size": 100, "replay_ring_size": 10}}})")));
    assert(rejects(json::parse(R"({"ingest": {"txids": {"poll_interval_sec": 1e12}}})")));
    assert(rejects(json::parse(R"({"sitemap": {"txids": {"poll_interval_sec": 5000000}}})")));

    auto cfg = config_from_json(json::parse(R"({"sitemap": {"txids": {"batch_size": 100, "replay_ring_size": 0}},
                                                "ingest": {"txids": {"poll_interval_sec": 4294967}}})"));
    assert(find_sitemap(cfg, "txids").replay_ring_size == 0);
    assert(find_ingest(cfg, "txids").poll_interval_ms == 4294967000u);
}

static void test_load_and_env() {
    auto dir = fs::temp_directory_path() / ("chainseg_config_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    const auto path = dir / "chainseg.json";
    std::ofstream(path) << R"({"ingest":{"blocks":{"confirmations":3}},"sitemap":{"blocks":{}}})";

    ::setenv("CHAINSEG_RPC_URL", "http://env:8332", 1);
    ::setenv("CHAINSEG_CONFIRMATIONS", "11", 1);
    ::setenv("CHAINSEG_POLL_SEC", "4", 1);
    auto cfg = load_config(path);
    assert(cfg.rpc.url == "http://env:8332");
    assert(find_ingest(cfg, "blocks").finality_lag == 11);
    assert(find_ingest(cfg, "blocks").poll_interval_ms == 4000);
    assert(find_sitemap(cfg, "blocks").poll_interval_ms == 4000);

    ::setenv("CHAINSEG_CONFIRMATIONS", "many", 1);
    bool threw = false;
    try {
        load_config(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    ::unsetenv("CHAINSEG_RPC_URL");
    ::unsetenv("CHAINSEG_CONFIRMATIONS");
    ::unsetenv("CHAINSEG_POLL_SEC");

    std::ofstream(path, std::ios::trunc) << "{ not json";
    threw = false;
    try {
        load_config(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        load_config(dir / "missing.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
}

int main() {
    test_defaults();
    test_explicit_values();
    test_invalid();
    test_load_and_env();
    return 0;
}
