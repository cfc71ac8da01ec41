#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rpc_client.h"
#include "rpc_producer.h"

using json = nlohmann::json;
using namespace chainseg;

static std::filesystem::path test_data_file(const char* name) {
#ifndef CHAINSEG_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name; // fallback
#else
    return std::filesystem::path(CHAINSEG_TEST_DATA_DIR) / name;
#endif
}

static json load_json(const char* name) {
    std::ifstream in(test_data_file(name));
    assert(in.good());
    return json::parse(in);
}

static void expect_delta(const Record& r, const std::string& addr, const std::string& txid_suffix, int64_t sat) {
    const auto& a = std::get<AddressDeltaRecord>(r);
    assert(a.address == addr);
    assert(a.height == 800000);
    assert(a.txid.size() >= txid_suffix.size());
    assert(a.txid.compare(a.txid.size() - txid_suffix.size(), txid_suffix.size(), txid_suffix) == 0);
    assert(a.delta_sat == sat);
}

static void test_address_deltas() {
    const json block = load_json("block_v3.json");
    std::vector<Record> out;
    std::string err;
    assert(address_records_from_block(block, 800000, out, &err));

    // coinbase input and nulldata output carry no address, the zero output is dropped
    assert(out.size() == 6);
    expect_delta(out[0], "bc1qminer", "01", 625000000);
    expect_delta(out[1], "1Bob", "02", 70000000);
    expect_delta(out[2], "bc1qalice", "02", 29999000);
    expect_delta(out[3], "bc1qalice", "02", -100000000);
    expect_delta(out[4], "bc1qeve", "03", 10000000);
    expect_delta(out[5], "bc1qcarol", "03", -10000000);

    for (const auto& r : out) assert(record_kind(r) == EntityKind::Addresses);

    out.clear();
    assert(!address_records_from_block(json::parse(R"({"tx":["abc"]})"), 1, out, &err));
    assert(!address_records_from_block(json::parse(R"({"hash":"h"})"), 1, out, &err));
}

static void test_txids() {
    std::vector<Record> out;
    std::string err;
    assert(txid_records_from_block(json::parse(R"({"hash":"h1","time":1700,"tx":["a","b",{"txid":"c"}]})"), 7, out, &err));
    assert(out.size() == 3);
    const auto& t = std::get<TxidRecord>(out[2]);
    assert(t.txid == "c" && t.height == 7 && t.block_hash == "h1" && t.block_time == 1700);

    out.clear();
    assert(!txid_records_from_block(json::parse(R"({"hash":"h1","time":1700})"), 7, out, &err));
    assert(!txid_records_from_block(json::parse(R"({"hash":"h1","time":1700,"tx":[5]})"), 7, out, &err));
    assert(!txid_records_from_block(json::parse(R"({"time":1700,"tx":[]})"), 7, out, &err));
}

static void test_block_header() {
    std::vector<Record> out;
    std::string err;
    assert(block_record_from_header(json::parse(R"({"hash":"h9","time":1234,"height":9})"), 9, out, &err));
    assert(out.size() == 1);
    const auto& b = std::get<BlockHeaderRecord>(out[0]);
    assert(b.hash == "h9" && b.time == 1234 && b.height == 9);

    out.clear();
    assert(!block_record_from_header(json::parse(R"({"hash":"h9","time":"x"})"), 9, out, &err));
    assert(out.empty());
}

static void test_helpers() {
    assert(satoshis_from_btc(0.1) == 10000000);
    assert(satoshis_from_btc(0.00000001) == 1);
    assert(satoshis_from_btc(6.25) == 625000000);

    assert(*address_from_script_pubkey(json::parse(R"({"address":"bc1q"})")) == "bc1q");
    assert(*address_from_script_pubkey(json::parse(R"({"addresses":["1A","1B"]})")) == "1A");
    assert(!address_from_script_pubkey(json::parse(R"({"type":"nonstandard"})")));
    assert(!address_from_script_pubkey(json::parse(R"({"address":""})")));
}

static void test_error_classes() {
    assert(classify_rpc_error(401, 0) == FetchStatus::Fatal);
    assert(classify_rpc_error(403, 0) == FetchStatus::Fatal);
    assert(classify_rpc_error(500, -28) == FetchStatus::Retryable); // warming up
    assert(classify_rpc_error(500, -8) == FetchStatus::Fatal);      // invalid parameter
    assert(classify_rpc_error(404, -32601) == FetchStatus::Fatal);  // method not found
    assert(classify_rpc_error(503, 0) == FetchStatus::Retryable);
    assert(classify_rpc_error(0, 0) == FetchStatus::Retryable);
    assert(classify_rpc_error(404, 0) == FetchStatus::Fatal);
}

int main() {
    test_address_deltas();
    test_txids();
    test_block_header();
    test_helpers();
    test_error_classes();
    return 0;
}
