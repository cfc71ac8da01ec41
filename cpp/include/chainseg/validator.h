// chainseg/cpp/include/chainseg/validator.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chainseg/records.h"
#include "chainseg/shard_writer.h"

namespace chainseg {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
    uint64_t items{0}; // entries (shards) or records (segments) seen
};

// Header once at the start, footer once at the end, balanced <url> entries,
// at most max_entries of them (0 = unchecked).
ValidationResult validate_shard_file(const std::filesystem::path& p,
                                     const ShardLayout& layout,
                                     uint64_t max_entries = 0);

// Every shard of the family, indices contiguous from 1.
ValidationResult validate_shard_dir(const ShardLayout& layout, uint64_t max_entries = 0);

// Names parse, every line is a complete record of `entity` whose position lies in
// its file's range, positions never decrease. With a checkpoint: the files hold
// at least what it claims.
ValidationResult validate_segments(const std::filesystem::path& dir,
                                   EntityKind entity,
                                   const std::filesystem::path& checkpoint_path = {});

} // namespace chainseg
