// chainseg/cpp/include/chainseg/segment_name.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chainseg {

constexpr int kSegmentNamePad = 9;
constexpr const char* kSegmentExt = "jsonl";

struct SegmentRange {
    uint64_t start{0};
    uint64_t end{0};

    bool contains(uint64_t position) const { return position >= start && position <= end; }
    bool operator==(const SegmentRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const SegmentRange& o) const { return !(*this == o); }
};

// start = floor(position / segment_size) * segment_size, end = start + segment_size - 1.
// segment_size == 0 throws std::invalid_argument.
SegmentRange segment_range_for(uint64_t position, uint64_t segment_size);

// txids_000930000_000939999.jsonl
std::string segment_file_name(const std::string& entity,
                              uint64_t start,
                              uint64_t end,
                              const std::string& ext = kSegmentExt);

std::string segment_file_name(const std::string& entity,
                              const SegmentRange& r,
                              const std::string& ext = kSegmentExt);

struct SegmentFileInfo {
    std::string entity;
    SegmentRange range;
    std::string file_name;
};

std::optional<SegmentFileInfo> parse_segment_file_name(const std::string& file_name,
                                                       const std::string& ext = kSegmentExt);

// File names (not paths) of `entity` segments in dir, sorted lexically == by position.
std::vector<std::string> list_segment_files(const std::filesystem::path& dir,
                                            const std::string& entity,
                                            const std::string& ext = kSegmentExt);

} // namespace chainseg
