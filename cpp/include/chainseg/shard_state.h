// chainseg/cpp/include/chainseg/shard_state.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chainseg {

// Progress of one sitemap family: where reading stopped in the segment stream
// and how far the shards have been filled.
struct ShardIndexState {
    std::string source_file;    // segment file name (no directory), empty before the first file
    uint64_t source_offset{0};  // byte after the last consumed line
    uint64_t shard_index{1};
    uint64_t urls_in_shard{0};
    uint64_t written_total{0};
    std::vector<std::string> replay_ring; // oldest first
    std::string updated_at;
};

nlohmann::json shard_state_to_json(const ShardIndexState& s);

// Also accepts the older key names (current_file, offset, shard_idx, last_txids).
bool shard_state_from_json(const nlohmann::json& j, ShardIndexState& out, std::string* err);

struct ShardStateLoad {
    ShardIndexState state;
    bool created{false};
    bool recovered{false};
};

// Same contract as load_checkpoint: missing or corrupt -> defaults, persisted;
// present but unreadable -> DurabilityError.
ShardStateLoad load_shard_state(const std::filesystem::path& path);

void save_shard_state(const std::filesystem::path& path, ShardIndexState& state);

} // namespace chainseg
