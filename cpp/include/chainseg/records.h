// chainseg/cpp/include/chainseg/records.h
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chainseg {

enum class EntityKind {
    Blocks,
    Txids,
    Addresses,
};

// "blocks" / "txids" / "addresses": also the segment file prefix
const char* entity_name(EntityKind k);
std::optional<EntityKind> entity_from_name(std::string_view name);

struct BlockHeaderRecord {
    uint64_t height{0};
    std::string hash;
    int64_t time{0};
};

struct TxidRecord {
    uint64_t height{0};
    std::string block_hash;
    int64_t block_time{0};
    std::string txid;
};

struct AddressDeltaRecord {
    std::string address;
    std::string txid;
    uint64_t height{0};
    int64_t delta_sat{0}; // outputs > 0, spent prevouts < 0
};

using Record = std::variant<BlockHeaderRecord, TxidRecord, AddressDeltaRecord>;

EntityKind record_kind(const Record& r);
uint64_t record_position(const Record& r);

// Compact single-line JSON, no trailing newline.
std::string encode_record_line(const Record& r);

// Text of a named field ("height", "hash", "txid", "block_hash", "address"), nullopt if absent.
std::optional<std::string> record_field_text(const Record& r, std::string_view field);

// Default sitemap key per entity: blocks -> height, txids -> txid, addresses -> address.
const char* default_key_field(EntityKind k);

// Reuses one simdjson parser across lines.
class RecordParser {
public:
    RecordParser();
    ~RecordParser();
    RecordParser(const RecordParser&) = delete;
    RecordParser& operator=(const RecordParser&) = delete;

    // false + err on bad JSON or schema mismatch for `kind`
    bool parse(std::string_view line, EntityKind kind, Record& out, std::string* err);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chainseg
