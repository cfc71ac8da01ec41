// chainseg/cpp/src/validator.cpp
#include "chainseg/validator.h"
#include "chainseg/checkpoint.h"
#include "chainseg/format.h"
#include "chainseg/segment_name.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace fs = std::filesystem;

namespace chainseg {

static size_t count_of(const std::string& doc, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t n = 0;
    for (size_t pos = doc.find(needle); pos != std::string::npos; pos = doc.find(needle, pos + needle.size())) ++n;
    return n;
}

ValidationResult validate_shard_file(const fs::path& p, const ShardLayout& layout, uint64_t max_entries) {
    ValidationResult vr;
    std::string doc;
    if (!read_file_to_string(p, doc)) {
        vr.errors.push_back("cannot read " + p.string());
        return vr;
    }

    if (doc.compare(0, layout.header.size(), layout.header) != 0) {
        vr.errors.push_back("header missing at start");
    } else if (count_of(doc, layout.header) != 1) {
        vr.errors.push_back("header repeated");
    }

    if (doc.size() < layout.footer.size() ||
        doc.compare(doc.size() - layout.footer.size(), layout.footer.size(), layout.footer) != 0) {
        vr.errors.push_back("footer missing at end");
    }
    if (count_of(doc, layout.footer_marker) != 1) {
        vr.errors.push_back("footer marker count is " + std::to_string(count_of(doc, layout.footer_marker)));
    }

    const size_t opens = count_of(doc, "<url>");
    const size_t closes = count_of(doc, layout.entry_close);
    const size_t locs = count_of(doc, "<loc>");
    if (opens != closes || opens != locs) {
        std::ostringstream oss;
        oss << "unbalanced entries: <url>=" << opens << " </url>=" << closes << " <loc>=" << locs;
        vr.errors.push_back(oss.str());
    }
    vr.items = closes;

    if (max_entries > 0 && vr.items > max_entries) {
        vr.errors.push_back("entries " + std::to_string(vr.items) + " > max " + std::to_string(max_entries));
    }

    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_shard_dir(const ShardLayout& layout, uint64_t max_entries) {
    ValidationResult vr;
    const auto shards = list_shard_indices(layout);
    if (shards.empty()) {
        vr.errors.push_back("no shards with prefix " + layout.prefix + " in " + layout.dir.string());
        return vr;
    }

    for (size_t i = 0; i < shards.size(); ++i) {
        if (shards[i] != i + 1) {
            vr.errors.push_back("shard indices not contiguous at " + std::to_string(shards[i]));
            break;
        }
    }

    for (uint64_t idx : shards) {
        const std::string name = layout.shard_file_name(idx);
        auto r = validate_shard_file(layout.dir / name, layout, max_entries);
        for (auto& e : r.errors) vr.errors.push_back(name + ": " + e);
        vr.items += r.items;
    }
    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_segments(const fs::path& dir, EntityKind entity, const fs::path& checkpoint_path) {
    ValidationResult vr;
    const std::string ename = entity_name(entity);
    const auto files = list_segment_files(dir, ename);

    RecordParser parser;
    bool have_prev = false;
    uint64_t prev_pos = 0;
    uint64_t seg_size = 0;

    for (const auto& name : files) {
        auto info = parse_segment_file_name(name);
        if (!info || info->entity != ename || info->range.end < info->range.start) {
            vr.errors.push_back(name + ": bad segment name");
            continue;
        }
        const uint64_t size = info->range.end - info->range.start + 1;
        if (seg_size == 0) seg_size = size;
        if (size != seg_size || info->range.start % size != 0) {
            vr.errors.push_back(name + ": range does not match segment size " + std::to_string(seg_size));
        }

        std::string data;
        if (!read_file_to_string(dir / name, data)) {
            vr.errors.push_back(name + ": cannot read");
            continue;
        }
        if (!data.empty() && data.back() != '\n') vr.errors.push_back(name + ": torn trailing line");

        size_t begin = 0;
        uint64_t line_no = 0;
        while (begin < data.size()) {
            size_t nl = data.find('\n', begin);
            if (nl == std::string::npos) break;
            const std::string_view line(data.data() + begin, nl - begin);
            begin = nl + 1;
            ++line_no;

            Record rec;
            std::string err;
            if (!parser.parse(line, entity, rec, &err)) {
                vr.errors.push_back(name + ":" + std::to_string(line_no) + ": " + err);
                continue;
            }
            const uint64_t pos = record_position(rec);
            if (!info->range.contains(pos)) {
                vr.errors.push_back(name + ":" + std::to_string(line_no) + ": position " + std::to_string(pos) +
                                    " outside file range");
            }
            if (have_prev && pos < prev_pos) {
                vr.errors.push_back(name + ":" + std::to_string(line_no) + ": position decreases");
            }
            prev_pos = pos;
            have_prev = true;
            ++vr.items;
        }
    }

    if (!checkpoint_path.empty()) {
        std::string text;
        CheckpointState cp;
        std::string err;
        if (!read_file_to_string(checkpoint_path, text)) {
            vr.errors.push_back("cannot read checkpoint " + checkpoint_path.string());
        } else {
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_discarded() || !checkpoint_from_json(j, default_checkpoint(ename, seg_size ? seg_size : 10000), cp, &err)) {
                vr.errors.push_back("checkpoint invalid: " + (err.empty() ? std::string("unparseable json") : err));
            } else if (cp.last_position_written >= 0) {
                const SegmentRange r = segment_range_for((uint64_t)cp.last_position_written, cp.segment_size);
                const fs::path seg = dir / segment_file_name(ename, r);
                std::error_code ec;
                const uint64_t size = fs::exists(seg, ec) ? (uint64_t)fs::file_size(seg, ec) : 0;
                if (!fs::exists(seg, ec)) {
                    vr.errors.push_back("checkpoint segment missing: " + seg.filename().string());
                } else if (cp.segment_bytes_known && size < cp.segment_bytes_durable) {
                    vr.errors.push_back("checkpoint claims " + std::to_string(cp.segment_bytes_durable) +
                                        " bytes, " + seg.filename().string() + " has " + std::to_string(size));
                }
                // every block and every block's coinbase yields a record; address deltas may skip heights
                const bool dense = entity != EntityKind::Addresses;
                if (dense && (!have_prev || prev_pos < (uint64_t)cp.last_position_written)) {
                    vr.errors.push_back("checkpoint ahead of data: last position " +
                                        (have_prev ? std::to_string(prev_pos) : std::string("none")) +
                                        " < " + std::to_string(cp.last_position_written));
                }
            }
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace chainseg
