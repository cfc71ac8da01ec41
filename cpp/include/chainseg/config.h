// chainseg/cpp/include/chainseg/config.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "chainseg/ingest.h"
#include "chainseg/shard_builder.h"

namespace chainseg {

struct RpcConfig {
    std::string url{"http://127.0.0.1:8332"};
    std::string user;
    std::string password;
    std::string cookie_file; // used when user is empty
    uint32_t timeout_sec{30};
};

struct ChainsegConfig {
    RpcConfig rpc;
    std::filesystem::path meta_db; // empty = no meta sink

    std::map<std::string, IngestOptions> ingest;      // by stream name
    std::map<std::string, ShardIndexOptions> sitemap; // by family name
};

// Every field has a default; a present field of the wrong type or an invalid
// value throws ConfigError.
ChainsegConfig config_from_json(const nlohmann::json& j);

// Reads the file, parses it, then applies the CHAINSEG_* environment overrides.
ChainsegConfig load_config(const std::filesystem::path& path);

// CHAINSEG_RPC_URL, CHAINSEG_RPC_USER, CHAINSEG_RPC_PASS, CHAINSEG_RPC_COOKIE,
// CHAINSEG_CONFIRMATIONS, CHAINSEG_POLL_SEC, CHAINSEG_META_DB
void apply_env_overrides(ChainsegConfig& cfg);

const IngestOptions& find_ingest(const ChainsegConfig& cfg, const std::string& stream);
const ShardIndexOptions& find_sitemap(const ChainsegConfig& cfg, const std::string& family);

} // namespace chainseg
