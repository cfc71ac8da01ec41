// service/rpc_producer.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chainseg/producer.h"
#include "chainseg/records.h"
#include "rpc_client.h"

// One Producer per stream: height -> block header, txids or address deltas.
class RpcProducer : public chainseg::Producer {
public:
  RpcProducer(RpcClient& rpc, chainseg::EntityKind entity) : rpc_(rpc), entity_(entity) {}

  chainseg::FrontierResult current_frontier() override;
  chainseg::FetchResult fetch(uint64_t position) override;

private:
  RpcClient& rpc_;
  chainseg::EntityKind entity_;
};

// Decoding of node responses, false + err on an unexpected shape.
bool block_record_from_header(const nlohmann::json& header, uint64_t height,
                              std::vector<chainseg::Record>& out, std::string* err);
bool txid_records_from_block(const nlohmann::json& block, uint64_t height,
                             std::vector<chainseg::Record>& out, std::string* err);
// getblock verbosity 3: outputs positive, spent prevouts negative, coinbase inputs skipped
bool address_records_from_block(const nlohmann::json& block, uint64_t height,
                                std::vector<chainseg::Record>& out, std::string* err);

int64_t satoshis_from_btc(double value);
std::optional<std::string> address_from_script_pubkey(const nlohmann::json& spk);
