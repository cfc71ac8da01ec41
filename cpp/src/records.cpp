// chainseg/cpp/src/records.cpp
#include "chainseg/records.h"

#include <nlohmann/json.hpp>
#include <simdjson.h>

using json = nlohmann::json;

namespace chainseg {

const char* entity_name(EntityKind k) {
    switch (k) {
        case EntityKind::Blocks: return "blocks";
        case EntityKind::Txids: return "txids";
        case EntityKind::Addresses: return "addresses";
    }
    return "unknown";
}

std::optional<EntityKind> entity_from_name(std::string_view name) {
    if (name == "blocks") return EntityKind::Blocks;
    if (name == "txids") return EntityKind::Txids;
    if (name == "addresses") return EntityKind::Addresses;
    return std::nullopt;
}

EntityKind record_kind(const Record& r) {
    if (std::holds_alternative<BlockHeaderRecord>(r)) return EntityKind::Blocks;
    if (std::holds_alternative<TxidRecord>(r)) return EntityKind::Txids;
    return EntityKind::Addresses;
}

uint64_t record_position(const Record& r) {
    return std::visit([](const auto& v) -> uint64_t { return v.height; }, r);
}

std::string encode_record_line(const Record& r) {
    json j;
    if (auto* b = std::get_if<BlockHeaderRecord>(&r)) {
        j = {{"height", b->height}, {"hash", b->hash}, {"time", b->time}};
    } else if (auto* t = std::get_if<TxidRecord>(&r)) {
        j = {{"height", t->height}, {"block_hash", t->block_hash},
             {"block_time", t->block_time}, {"txid", t->txid}};
    } else {
        const auto& a = std::get<AddressDeltaRecord>(r);
        j = {{"address", a.address}, {"txid", a.txid},
             {"height", a.height}, {"delta_sat", a.delta_sat}};
    }
    return j.dump();
}

std::optional<std::string> record_field_text(const Record& r, std::string_view field) {
    if (field == "height") return std::to_string(record_position(r));
    if (auto* b = std::get_if<BlockHeaderRecord>(&r)) {
        if (field == "hash") return b->hash;
    } else if (auto* t = std::get_if<TxidRecord>(&r)) {
        if (field == "txid") return t->txid;
        if (field == "block_hash") return t->block_hash;
    } else if (auto* a = std::get_if<AddressDeltaRecord>(&r)) {
        if (field == "address") return a->address;
        if (field == "txid") return a->txid;
    }
    return std::nullopt;
}

const char* default_key_field(EntityKind k) {
    switch (k) {
        case EntityKind::Blocks: return "height";
        case EntityKind::Txids: return "txid";
        case EntityKind::Addresses: return "address";
    }
    return "height";
}

// --------------------
// parsing (simdjson dom)
// --------------------

namespace {

bool is_clean_token(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (c <= 0x20 || c == 0x7f) return false;
    }
    return true;
}

bool get_u64(const simdjson::dom::element& e, const char* key, uint64_t& out) {
    return !e.at_key(key).get(out);
}

bool get_i64(const simdjson::dom::element& e, const char* key, int64_t& out) {
    return !e.at_key(key).get(out);
}

bool get_token(const simdjson::dom::element& e, const char* key, std::string& out) {
    std::string_view sv;
    if (e.at_key(key).get(sv)) return false;
    if (!is_clean_token(sv)) return false;
    out.assign(sv.data(), sv.size());
    return true;
}

} // namespace

struct RecordParser::Impl {
    simdjson::dom::parser parser;
};

RecordParser::RecordParser() : impl_(std::make_unique<Impl>()) {}
RecordParser::~RecordParser() = default;

bool RecordParser::parse(std::string_view line, EntityKind kind, Record& out, std::string* err) {
    simdjson::dom::element doc;
    auto perr = impl_->parser.parse(line.data(), line.size()).get(doc);
    if (perr) {
        if (err) *err = std::string("json: ") + simdjson::error_message(perr);
        return false;
    }
    if (!doc.is_object()) {
        if (err) *err = "record is not an object";
        return false;
    }

    switch (kind) {
        case EntityKind::Blocks: {
            BlockHeaderRecord b;
            if (!get_u64(doc, "height", b.height) || !get_token(doc, "hash", b.hash) ||
                !get_i64(doc, "time", b.time)) {
                if (err) *err = "block record: need height, hash, time";
                return false;
            }
            out = std::move(b);
            return true;
        }
        case EntityKind::Txids: {
            TxidRecord t;
            if (!get_u64(doc, "height", t.height) || !get_token(doc, "txid", t.txid)) {
                if (err) *err = "txid record: need height, txid";
                return false;
            }
            // block_hash/block_time are absent in realtime-writer segments
            if (!get_token(doc, "block_hash", t.block_hash)) t.block_hash.clear();
            if (!get_i64(doc, "block_time", t.block_time)) t.block_time = 0;
            out = std::move(t);
            return true;
        }
        case EntityKind::Addresses: {
            AddressDeltaRecord a;
            if (!get_token(doc, "address", a.address) || !get_token(doc, "txid", a.txid) ||
                !get_u64(doc, "height", a.height) || !get_i64(doc, "delta_sat", a.delta_sat)) {
                if (err) *err = "address record: need address, txid, height, delta_sat";
                return false;
            }
            if (a.delta_sat == 0) {
                if (err) *err = "address record: zero delta";
                return false;
            }
            out = std::move(a);
            return true;
        }
    }
    if (err) *err = "unknown entity";
    return false;
}

} // namespace chainseg
