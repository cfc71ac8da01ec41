// chainseg/cpp/src/segment_name.cpp
#include "chainseg/segment_name.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chainseg {

SegmentRange segment_range_for(uint64_t position, uint64_t segment_size) {
    if (segment_size == 0) throw std::invalid_argument("segment_size must be > 0");
    SegmentRange r;
    r.start = (position / segment_size) * segment_size;
    r.end = r.start + (segment_size - 1);
    return r;
}

std::string segment_file_name(const std::string& entity,
                              uint64_t start,
                              uint64_t end,
                              const std::string& ext) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "_%0*llu_%0*llu.",
                  kSegmentNamePad, (unsigned long long)start,
                  kSegmentNamePad, (unsigned long long)end);
    return entity + buf + ext;
}

std::string segment_file_name(const std::string& entity, const SegmentRange& r, const std::string& ext) {
    return segment_file_name(entity, r.start, r.end, ext);
}

static bool parse_u64_digits(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit((unsigned char)c)) return false;
        const uint64_t d = (uint64_t)(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

std::optional<SegmentFileInfo> parse_segment_file_name(const std::string& file_name, const std::string& ext) {
    const std::string suffix = "." + ext;
    if (file_name.size() <= suffix.size()) return std::nullopt;
    if (file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    const std::string stem = file_name.substr(0, file_name.size() - suffix.size());
    const size_t p2 = stem.rfind('_');
    if (p2 == std::string::npos || p2 == 0) return std::nullopt;
    const size_t p1 = stem.rfind('_', p2 - 1);
    if (p1 == std::string::npos || p1 == 0) return std::nullopt;

    SegmentFileInfo info;
    info.entity = stem.substr(0, p1);
    if (!parse_u64_digits(stem.substr(p1 + 1, p2 - p1 - 1), info.range.start)) return std::nullopt;
    if (!parse_u64_digits(stem.substr(p2 + 1), info.range.end)) return std::nullopt;
    if (info.range.end < info.range.start) return std::nullopt;
    info.file_name = file_name;
    return info;
}

std::vector<std::string> list_segment_files(const fs::path& dir, const std::string& entity, const std::string& ext) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        auto info = parse_segment_file_name(name, ext);
        if (!info || info->entity != entity) continue;
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace chainseg
