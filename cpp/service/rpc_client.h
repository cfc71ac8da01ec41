// service/rpc_client.h
#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "chainseg/config.h"
#include "chainseg/producer.h"

namespace httplib {
class Client;
}

struct RpcResult {
  chainseg::FetchStatus status{chainseg::FetchStatus::Ok};
  nlohmann::json result;
  std::string error;
};

// Bitcoin Core JSON-RPC over HTTP. Transport problems and node-side
// "try again" answers come back Retryable, everything else unexpected is Fatal.
class RpcClient {
public:
  explicit RpcClient(const chainseg::RpcConfig& cfg);
  ~RpcClient();

  RpcResult call(const std::string& method, const nlohmann::json& params = nlohmann::json::array());

private:
  void load_credentials(const chainseg::RpcConfig& cfg);

  std::unique_ptr<httplib::Client> cli_;
  std::string path_{"/"};
  std::string user_;
  std::string password_;
  uint64_t next_id_{1};
};

// exposed for tests
chainseg::FetchStatus classify_rpc_error(int http_status, int rpc_code);
