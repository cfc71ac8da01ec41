// chainseg/cpp/include/chainseg/checkpoint.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace chainseg {

struct CheckpointState {
    std::string entity;
    uint64_t segment_size{10000};

    int64_t last_position_written{-1}; // -1: nothing written yet
    uint64_t current_segment_start{0};
    uint64_t current_segment_end{9999};

    uint64_t segments_completed{0};
    uint64_t records_written_total{0};

    // durable byte length of the active segment when this checkpoint was taken;
    // unknown for state files written before the field existed
    uint64_t segment_bytes_durable{0};
    bool segment_bytes_known{true};

    std::string updated_at;

    uint64_t next_position() const { return (uint64_t)(last_position_written + 1); }
    void refresh_segment_for(uint64_t position);
};

CheckpointState default_checkpoint(const std::string& entity, uint64_t segment_size);

nlohmann::json checkpoint_to_json(const CheckpointState& s);

// Missing keys take their value from `defaults`; a present key of the wrong type is an error.
bool checkpoint_from_json(const nlohmann::json& j,
                          const CheckpointState& defaults,
                          CheckpointState& out,
                          std::string* err);

struct CheckpointLoad {
    CheckpointState state;
    bool created{false};   // file was missing
    bool recovered{false}; // file was corrupt and got reset
};

// Never returns a partially parsed state: either the full prior state or
// `defaults`, which are then persisted. A file that exists but cannot be read
// throws DurabilityError.
CheckpointLoad load_checkpoint(const std::filesystem::path& path, const CheckpointState& defaults);

// Stamps updated_at, then tmp + fsync + rename.
void save_checkpoint(const std::filesystem::path& path, CheckpointState& state);

// Throws ConfigError when a persisted checkpoint belongs to another stream layout.
void require_checkpoint_matches(const CheckpointState& s,
                                const std::string& entity,
                                uint64_t segment_size);

} // namespace chainseg
