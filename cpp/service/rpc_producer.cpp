// service/rpc_producer.cpp
#include "rpc_producer.h"

#include <cmath>

using json = nlohmann::json;
using chainseg::FetchResult;
using chainseg::FetchStatus;
using chainseg::FrontierResult;

int64_t satoshis_from_btc(double value) {
  return (int64_t)std::llround(value * 100000000.0);
}

std::optional<std::string> address_from_script_pubkey(const json& spk) {
  if (!spk.is_object()) return std::nullopt;
  auto a = spk.find("address");
  if (a != spk.end() && a->is_string() && !a->get<std::string>().empty()) return a->get<std::string>();

  // older nodes: "addresses": [...]
  auto as = spk.find("addresses");
  if (as != spk.end() && as->is_array() && !as->empty() && (*as)[0].is_string()) {
    return (*as)[0].get<std::string>();
  }
  return std::nullopt;
}

static bool block_hash_time(const json& j, std::string& hash, int64_t& time, std::string* err) {
  if (!j.is_object() || !j.contains("hash") || !j["hash"].is_string()) {
    if (err) *err = "missing hash";
    return false;
  }
  if (!j.contains("time") || !j["time"].is_number_integer()) {
    if (err) *err = "missing time";
    return false;
  }
  hash = j["hash"].get<std::string>();
  time = j["time"].get<int64_t>();
  return true;
}

bool block_record_from_header(const json& header, uint64_t height,
                              std::vector<chainseg::Record>& out, std::string* err) {
  chainseg::BlockHeaderRecord r;
  r.height = height;
  if (!block_hash_time(header, r.hash, r.time, err)) return false;
  out.push_back(std::move(r));
  return true;
}

bool txid_records_from_block(const json& block, uint64_t height,
                             std::vector<chainseg::Record>& out, std::string* err) {
  std::string hash;
  int64_t time = 0;
  if (!block_hash_time(block, hash, time, err)) return false;

  auto tx = block.find("tx");
  if (tx == block.end() || !tx->is_array()) {
    if (err) *err = "missing tx array";
    return false;
  }
  for (const auto& t : *tx) {
    // verbosity 1 gives ids; tolerate verbosity 2 objects
    std::string txid;
    if (t.is_string()) {
      txid = t.get<std::string>();
    } else if (t.is_object() && t.contains("txid") && t["txid"].is_string()) {
      txid = t["txid"].get<std::string>();
    } else {
      if (err) *err = "bad tx entry";
      return false;
    }
    chainseg::TxidRecord r;
    r.height = height;
    r.block_hash = hash;
    r.block_time = time;
    r.txid = std::move(txid);
    out.push_back(std::move(r));
  }
  return true;
}

static bool btc_value(const json& j, double& v) {
  if (!j.is_number()) return false;
  v = j.get<double>();
  return true;
}

bool address_records_from_block(const json& block, uint64_t height,
                                std::vector<chainseg::Record>& out, std::string* err) {
  auto tx = block.find("tx");
  if (!block.is_object() || tx == block.end() || !tx->is_array()) {
    if (err) *err = "missing tx array";
    return false;
  }

  for (const auto& t : *tx) {
    if (!t.is_object() || !t.contains("txid") || !t["txid"].is_string()) {
      if (err) *err = "tx without txid (verbosity 3 expected)";
      return false;
    }
    const std::string txid = t["txid"].get<std::string>();

    auto push = [&](const std::string& addr, int64_t delta) {
      if (delta == 0) return;
      chainseg::AddressDeltaRecord r;
      r.address = addr;
      r.txid = txid;
      r.height = height;
      r.delta_sat = delta;
      out.push_back(std::move(r));
    };

    if (auto vout = t.find("vout"); vout != t.end() && vout->is_array()) {
      for (const auto& o : *vout) {
        if (!o.is_object()) continue;
        auto addr = address_from_script_pubkey(o.value("scriptPubKey", json::object()));
        double v = 0;
        if (!addr || !o.contains("value") || !btc_value(o["value"], v)) continue;
        push(*addr, satoshis_from_btc(v));
      }
    }

    if (auto vin = t.find("vin"); vin != t.end() && vin->is_array()) {
      for (const auto& i : *vin) {
        if (!i.is_object() || i.contains("coinbase")) continue;
        auto pv = i.find("prevout");
        if (pv == i.end() || !pv->is_object()) continue;
        auto addr = address_from_script_pubkey(pv->value("scriptPubKey", json::object()));
        double v = 0;
        if (!addr || !pv->contains("value") || !btc_value((*pv)["value"], v)) continue;
        push(*addr, -satoshis_from_btc(v));
      }
    }
  }
  return true;
}

FrontierResult RpcProducer::current_frontier() {
  FrontierResult fr;
  RpcResult r = rpc_.call("getblockcount");
  if (r.status != FetchStatus::Ok) {
    fr.status = r.status;
    fr.error = r.error;
    return fr;
  }
  if (!r.result.is_number_unsigned() && !(r.result.is_number_integer() && r.result.get<int64_t>() >= 0)) {
    fr.status = FetchStatus::Fatal;
    fr.error = "getblockcount: not a height";
    return fr;
  }
  fr.frontier = r.result.get<uint64_t>();
  return fr;
}

FetchResult RpcProducer::fetch(uint64_t position) {
  FetchResult out;

  RpcResult h = rpc_.call("getblockhash", json::array({position}));
  if (h.status != FetchStatus::Ok) {
    out.status = h.status;
    out.error = h.error;
    return out;
  }
  if (!h.result.is_string()) {
    out.status = FetchStatus::Fatal;
    out.error = "getblockhash: not a string";
    return out;
  }
  const std::string hash = h.result.get<std::string>();

  RpcResult b;
  switch (entity_) {
    case chainseg::EntityKind::Blocks: b = rpc_.call("getblockheader", json::array({hash, true})); break;
    case chainseg::EntityKind::Txids: b = rpc_.call("getblock", json::array({hash, 1})); break;
    case chainseg::EntityKind::Addresses: b = rpc_.call("getblock", json::array({hash, 3})); break;
  }
  if (b.status != FetchStatus::Ok) {
    out.status = b.status;
    out.error = b.error;
    return out;
  }

  std::string err;
  bool ok = false;
  switch (entity_) {
    case chainseg::EntityKind::Blocks: ok = block_record_from_header(b.result, position, out.records, &err); break;
    case chainseg::EntityKind::Txids: ok = txid_records_from_block(b.result, position, out.records, &err); break;
    case chainseg::EntityKind::Addresses: ok = address_records_from_block(b.result, position, out.records, &err); break;
  }
  if (!ok) {
    out.records.clear();
    out.status = FetchStatus::Fatal;
    out.error = "block " + std::to_string(position) + ": " + err;
  }
  return out;
}
