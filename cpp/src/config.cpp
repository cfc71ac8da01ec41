// chainseg/cpp/src/config.cpp
#include "chainseg/config.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"

#include <cstdint>
#include <cstdlib>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace chainseg {

namespace {

std::string get_str(const json& j, const char* key, const std::string& def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_string()) throw ConfigError(std::string("config field '") + key + "' must be a string");
    return it->get<std::string>();
}

uint64_t get_u64(const json& j, const char* key, uint64_t def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) return (uint64_t)it->get<int64_t>();
    throw ConfigError(std::string("config field '") + key + "' must be a non-negative integer");
}

uint32_t get_u32(const json& j, const char* key, uint32_t def) {
    const uint64_t v = get_u64(j, key, def);
    if (v > UINT32_MAX) throw ConfigError(std::string("config field '") + key + "' is too large");
    return (uint32_t)v;
}

// seconds in the file, milliseconds inside
uint32_t get_sec_as_ms(const json& j, const char* key, uint32_t def_ms) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def_ms;
    if (!it->is_number() || it->get<double>() < 0) {
        throw ConfigError(std::string("config field '") + key + "' must be a non-negative number");
    }
    const double sec = it->get<double>();
    if (!(sec <= UINT32_MAX / 1000)) throw ConfigError(std::string("config field '") + key + "' is too large");
    return (uint32_t)(sec * 1000.0);
}

EntityKind get_entity(const json& j, const std::string& fallback_name) {
    const std::string name = get_str(j, "entity", fallback_name);
    auto k = entity_from_name(name);
    if (!k) throw ConfigError("unknown entity '" + name + "'");
    return *k;
}

IngestOptions ingest_from_json(const std::string& stream, const json& j) {
    if (!j.is_object()) throw ConfigError("ingest." + stream + " must be an object");

    IngestOptions o;
    o.entity = get_entity(j, stream);
    const std::string entity = entity_name(o.entity);

    o.out_dir = get_str(j, "out_dir", "data/segments/" + entity);
    o.state_path = get_str(j, "state_path", "data/state/" + entity + "_checkpoint.json");
    o.segment_size = get_u64(j, "segment_size", o.segment_size);
    o.finality_lag = get_u64(j, "confirmations", 2);
    o.checkpoint_every = get_u32(j, "checkpoint_every", o.checkpoint_every);
    o.fsync_every = get_u32(j, "fsync_every", o.fsync_every);
    o.fsync_interval_ms = get_u32(j, "fsync_interval_ms", o.fsync_interval_ms);
    o.max_buffered_records = get_u32(j, "max_buffered_records", o.max_buffered_records);
    o.poll_interval_ms = get_sec_as_ms(j, "poll_interval_sec", o.poll_interval_ms);
    o.throttle_ms = get_u32(j, "throttle_ms", o.throttle_ms);
    o.log_every = get_u32(j, "log_every", o.log_every);
    o.retry.attempts = get_u32(j, "retry_attempts", o.retry.attempts);
    o.retry.backoff_ms = get_u32(j, "retry_backoff_ms", o.retry.backoff_ms);
    o.retry.cooldown_ms = get_u32(j, "cooldown_ms", o.retry.cooldown_ms);
    o.meta_key = get_str(j, "meta_key", "");

    const std::string mode = get_str(j, "mode", "follow");
    if (mode == "follow") {
        o.mode = IngestMode::Follow;
    } else if (mode == "backfill") {
        o.mode = IngestMode::Backfill;
    } else {
        throw ConfigError("ingest." + stream + ": unknown mode '" + mode + "'");
    }

    if (o.segment_size == 0) throw ConfigError("ingest." + stream + ": segment_size must be > 0");
    if (o.checkpoint_every == 0) throw ConfigError("ingest." + stream + ": checkpoint_every must be > 0");
    if (o.max_buffered_records == 0) throw ConfigError("ingest." + stream + ": max_buffered_records must be > 0");
    if (o.retry.attempts == 0) throw ConfigError("ingest." + stream + ": retry_attempts must be > 0");
    return o;
}

ShardIndexOptions sitemap_from_json(const std::string& family, const json& j) {
    if (!j.is_object()) throw ConfigError("sitemap." + family + " must be an object");

    ShardIndexOptions o;
    o.family = family;
    o.entity = get_entity(j, family);
    const std::string entity = entity_name(o.entity);

    o.segments_dir = get_str(j, "segments_dir", "data/segments/" + entity);
    o.segment_ext = get_str(j, "segment_ext", o.segment_ext);
    o.state_path = get_str(j, "state_path", "data/state/sitemap_" + family + "_state.json");

    o.layout.dir = get_str(j, "shards_dir", "data/sitemaps/" + family);
    o.layout.prefix = get_str(j, "shard_prefix", "sitemap_" + family);
    o.layout.pad = (int)get_u32(j, "shard_pad", (uint32_t)o.layout.pad);

    o.index.index_path = get_str(j, "index_path", "data/sitemaps/sitemap_" + family + "_index.xml");
    o.index.base_url = get_str(j, "base_url", "");
    if (auto it = j.find("extra_locs"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw ConfigError("sitemap." + family + ": extra_locs must be an array");
        for (const auto& loc : *it) {
            if (!loc.is_string()) throw ConfigError("sitemap." + family + ": extra_locs entries must be strings");
            o.index.extra_locs.push_back(loc.get<std::string>());
        }
    }

    o.url_prefix = get_str(j, "url_prefix", "");
    o.key_field = get_str(j, "key_field", default_key_field(o.entity));
    o.style.changefreq = get_str(j, "changefreq", o.style.changefreq);
    o.style.priority = get_str(j, "priority", o.entity == EntityKind::Blocks ? "0.7" : o.style.priority);

    o.max_urls_per_shard = get_u64(j, "max_urls_per_shard", o.max_urls_per_shard);
    o.batch_size = get_u32(j, "batch_size", o.batch_size);
    o.replay_ring_size = get_u32(j, "replay_ring_size", o.replay_ring_size);
    o.poll_interval_ms = get_sec_as_ms(j, "poll_interval_sec", o.poll_interval_ms);
    o.heartbeat_sec = get_u32(j, "heartbeat_sec", o.heartbeat_sec);
    o.meta_key = get_str(j, "meta_key", "");

    if (o.max_urls_per_shard == 0) throw ConfigError("sitemap." + family + ": max_urls_per_shard must be > 0");
    if (o.batch_size == 0) throw ConfigError("sitemap." + family + ": batch_size must be > 0");
    if (o.replay_ring_size != 0 && o.replay_ring_size < o.batch_size) {
        throw ConfigError("sitemap." + family + ": replay_ring_size must be 0 or >= batch_size");
    }
    if (o.layout.pad < 1 || o.layout.pad > 19) throw ConfigError("sitemap." + family + ": shard_pad out of range");
    return o;
}

bool env_str(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

uint64_t env_u64(const char* name, const std::string& v) {
    size_t used = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(v, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != v.size() || v.empty() || v[0] == '-') throw ConfigError(std::string(name) + " must be a non-negative integer");
    return n;
}

} // namespace

ChainsegConfig config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be an object");

    ChainsegConfig cfg;
    if (auto it = j.find("rpc"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("rpc must be an object");
        cfg.rpc.url = get_str(*it, "url", cfg.rpc.url);
        cfg.rpc.user = get_str(*it, "user", "");
        cfg.rpc.password = get_str(*it, "password", "");
        cfg.rpc.cookie_file = get_str(*it, "cookie_file", "");
        cfg.rpc.timeout_sec = get_u32(*it, "timeout_sec", cfg.rpc.timeout_sec);
    }
    cfg.meta_db = get_str(j, "meta_db", "");

    if (auto it = j.find("ingest"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("ingest must be an object");
        for (auto s = it->begin(); s != it->end(); ++s) cfg.ingest[s.key()] = ingest_from_json(s.key(), s.value());
    }
    if (auto it = j.find("sitemap"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("sitemap must be an object");
        for (auto s = it->begin(); s != it->end(); ++s) cfg.sitemap[s.key()] = sitemap_from_json(s.key(), s.value());
    }
    return cfg;
}

void apply_env_overrides(ChainsegConfig& cfg) {
    std::string v;
    if (env_str("CHAINSEG_RPC_URL", v)) cfg.rpc.url = v;
    if (env_str("CHAINSEG_RPC_USER", v)) cfg.rpc.user = v;
    if (env_str("CHAINSEG_RPC_PASS", v)) cfg.rpc.password = v;
    if (env_str("CHAINSEG_RPC_COOKIE", v)) cfg.rpc.cookie_file = v;
    if (env_str("CHAINSEG_META_DB", v)) cfg.meta_db = v;

    if (env_str("CHAINSEG_CONFIRMATIONS", v)) {
        const uint64_t lag = env_u64("CHAINSEG_CONFIRMATIONS", v);
        for (auto& kv : cfg.ingest) kv.second.finality_lag = lag;
    }
    if (env_str("CHAINSEG_POLL_SEC", v)) {
        const uint64_t sec = env_u64("CHAINSEG_POLL_SEC", v);
        if (sec > UINT32_MAX / 1000) throw ConfigError("CHAINSEG_POLL_SEC is too large");
        for (auto& kv : cfg.ingest) kv.second.poll_interval_ms = (uint32_t)(sec * 1000);
        for (auto& kv : cfg.sitemap) kv.second.poll_interval_ms = (uint32_t)(sec * 1000);
    }
}

ChainsegConfig load_config(const fs::path& path) {
    std::string text;
    if (!read_file_to_string(path, text)) throw ConfigError("cannot read config " + path.string());

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) throw ConfigError("config is not valid json: " + path.string());

    ChainsegConfig cfg = config_from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

const IngestOptions& find_ingest(const ChainsegConfig& cfg, const std::string& stream) {
    auto it = cfg.ingest.find(stream);
    if (it == cfg.ingest.end()) throw ConfigError("no ingest stream '" + stream + "' in config");
    return it->second;
}

const ShardIndexOptions& find_sitemap(const ChainsegConfig& cfg, const std::string& family) {
    auto it = cfg.sitemap.find(family);
    if (it == cfg.sitemap.end()) throw ConfigError("no sitemap family '" + family + "' in config");
    return it->second;
}

} // namespace chainseg
