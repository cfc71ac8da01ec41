// chainseg/cpp/src/shard_state.cpp
#include "chainseg/shard_state.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"

#include <iostream>

using json = nlohmann::json;

namespace chainseg {

json shard_state_to_json(const ShardIndexState& s) {
    return {
        {"source_file", s.source_file.empty() ? json(nullptr) : json(s.source_file)},
        {"source_offset", s.source_offset},
        {"shard_index", s.shard_index},
        {"urls_in_shard", s.urls_in_shard},
        {"written_total", s.written_total},
        {"replay_ring", s.replay_ring},
        {"updated_at", s.updated_at.empty() ? json(nullptr) : json(s.updated_at)},
    };
}

namespace {

const json* find_any(const json& j, const char* key, const char* legacy) {
    auto it = j.find(key);
    if (it != j.end()) return &*it;
    it = j.find(legacy);
    if (it != j.end()) return &*it;
    return nullptr;
}

bool read_u64(const json& j, const char* key, const char* legacy, uint64_t& out, std::string* err) {
    const json* v = find_any(j, key, legacy);
    if (!v || v->is_null()) return true;
    if (!v->is_number_unsigned() && !(v->is_number_integer() && v->get<int64_t>() >= 0)) {
        if (err) *err = std::string("bad field ") + key;
        return false;
    }
    out = v->get<uint64_t>();
    return true;
}

} // namespace

bool shard_state_from_json(const json& j, ShardIndexState& out, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "shard state is not an object";
        return false;
    }
    ShardIndexState s;

    if (const json* f = find_any(j, "source_file", "current_file")) {
        if (f->is_string()) {
            // older states kept a full path
            s.source_file = std::filesystem::path(f->get<std::string>()).filename().string();
        } else if (!f->is_null()) {
            if (err) *err = "bad field source_file";
            return false;
        }
    }
    if (!read_u64(j, "source_offset", "offset", s.source_offset, err)) return false;
    if (!read_u64(j, "shard_index", "shard_idx", s.shard_index, err)) return false;
    if (!read_u64(j, "urls_in_shard", "urls_in_shard", s.urls_in_shard, err)) return false;
    if (!read_u64(j, "written_total", "written_total", s.written_total, err)) return false;

    if (const json* r = find_any(j, "replay_ring", "last_txids")) {
        if (r->is_array()) {
            for (const auto& k : *r) {
                if (k.is_string()) s.replay_ring.push_back(k.get<std::string>());
            }
        }
    }
    if (const json* u = find_any(j, "updated_at", "updated_utc")) {
        if (u->is_string()) s.updated_at = u->get<std::string>();
    }

    if (s.shard_index == 0) {
        if (err) *err = "shard_index is 0";
        return false;
    }
    out = std::move(s);
    return true;
}

ShardStateLoad load_shard_state(const std::filesystem::path& path) {
    ShardStateLoad res;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) throw DurabilityError("cannot stat shard state " + path.string() + ": " + ec.message());
        res.created = true;
        save_shard_state(path, res.state);
        return res;
    }
    std::string text;
    if (!read_file_to_string(path, text)) throw DurabilityError("cannot read shard state " + path.string());

    std::string err;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        err = "unparseable json";
    } else if (shard_state_from_json(j, res.state, &err)) {
        return res;
    }

    std::cerr << "[chainseg] shard state corrupt (" << err << "), reset to defaults: " << path << "\n";
    res.state = ShardIndexState{};
    res.recovered = true;
    save_shard_state(path, res.state);
    return res;
}

void save_shard_state(const std::filesystem::path& path, ShardIndexState& state) {
    state.updated_at = utc_now_iso();
    atomic_write_file(path, shard_state_to_json(state).dump());
}

} // namespace chainseg
