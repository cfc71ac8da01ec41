// chainseg/cpp/src/checkpoint.cpp
#include "chainseg/checkpoint.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"
#include "chainseg/segment_name.h"

#include <iostream>

using json = nlohmann::json;

namespace chainseg {

void CheckpointState::refresh_segment_for(uint64_t position) {
    const SegmentRange r = segment_range_for(position, segment_size);
    current_segment_start = r.start;
    current_segment_end = r.end;
}

CheckpointState default_checkpoint(const std::string& entity, uint64_t segment_size) {
    CheckpointState s;
    s.entity = entity;
    s.segment_size = segment_size;
    s.last_position_written = -1;
    s.refresh_segment_for(0);
    return s;
}

json checkpoint_to_json(const CheckpointState& s) {
    return {
        {"entity", s.entity},
        {"segment_size", s.segment_size},
        {"last_position_written", s.last_position_written},
        {"current_segment_start", s.current_segment_start},
        {"current_segment_end", s.current_segment_end},
        {"segments_completed", s.segments_completed},
        {"records_written_total", s.records_written_total},
        {"segment_bytes_durable", s.segment_bytes_durable},
        {"updated_at", s.updated_at.empty() ? json(nullptr) : json(s.updated_at)},
    };
}

namespace {

bool read_u64(const json& j, const char* key, uint64_t& out, std::string* err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        if (err) *err = std::string("bad field ") + key;
        return false;
    }
    out = it->get<uint64_t>();
    return true;
}

bool read_i64(const json& j, const char* key, int64_t& out, std::string* err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) {
        if (err) *err = std::string("bad field ") + key;
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

} // namespace

bool checkpoint_from_json(const json& j, const CheckpointState& defaults, CheckpointState& out, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "checkpoint is not an object";
        return false;
    }
    CheckpointState s = defaults;

    if (j.contains("entity")) {
        if (!j["entity"].is_string()) {
            if (err) *err = "bad field entity";
            return false;
        }
        s.entity = j["entity"].get<std::string>();
    }
    if (!read_u64(j, "segment_size", s.segment_size, err)) return false;
    if (!read_i64(j, "last_position_written", s.last_position_written, err)) return false;
    if (!read_u64(j, "current_segment_start", s.current_segment_start, err)) return false;
    if (!read_u64(j, "current_segment_end", s.current_segment_end, err)) return false;
    if (!read_u64(j, "segments_completed", s.segments_completed, err)) return false;
    if (!read_u64(j, "records_written_total", s.records_written_total, err)) return false;
    s.segment_bytes_known = j.contains("segment_bytes_durable");
    if (!read_u64(j, "segment_bytes_durable", s.segment_bytes_durable, err)) return false;
    if (j.contains("updated_at") && j["updated_at"].is_string()) {
        s.updated_at = j["updated_at"].get<std::string>();
    }

    if (s.segment_size == 0) {
        if (err) *err = "segment_size is 0";
        return false;
    }
    if (s.last_position_written < -1) {
        if (err) *err = "last_position_written < -1";
        return false;
    }
    out = std::move(s);
    return true;
}

CheckpointLoad load_checkpoint(const std::filesystem::path& path, const CheckpointState& defaults) {
    CheckpointLoad res;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) throw DurabilityError("cannot stat checkpoint " + path.string() + ": " + ec.message());
        res.state = defaults;
        res.created = true;
        save_checkpoint(path, res.state);
        return res;
    }
    // present but unreadable: the progress in it must not be overwritten
    std::string text;
    if (!read_file_to_string(path, text)) throw DurabilityError("cannot read checkpoint " + path.string());

    std::string err;
    json j = json::parse(text, nullptr, false);
    if (!j.is_discarded() && checkpoint_from_json(j, defaults, res.state, &err)) {
        return res;
    }
    if (j.is_discarded()) err = "unparseable json";

    std::cerr << "[chainseg] checkpoint corrupt (" << err << "), reset to defaults: "
              << path << "\n";
    res.state = defaults;
    res.recovered = true;
    save_checkpoint(path, res.state);
    return res;
}

void save_checkpoint(const std::filesystem::path& path, CheckpointState& state) {
    state.updated_at = utc_now_iso();
    atomic_write_file(path, checkpoint_to_json(state).dump());
}

void require_checkpoint_matches(const CheckpointState& s, const std::string& entity, uint64_t segment_size) {
    if (s.entity != entity) {
        throw ConfigError("checkpoint entity mismatch: file=" + s.entity + " configured=" + entity);
    }
    if (s.segment_size != segment_size) {
        throw ConfigError("checkpoint segment_size mismatch: file=" + std::to_string(s.segment_size) +
                          " configured=" + std::to_string(segment_size));
    }
}

} // namespace chainseg
