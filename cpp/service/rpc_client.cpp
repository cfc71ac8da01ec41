// service/rpc_client.cpp
#include "rpc_client.h"

#include "httplib.h"

#include "chainseg/errors.h"
#include "chainseg/format.h"

using json = nlohmann::json;
using chainseg::FetchStatus;

namespace {

// RPC_IN_WARMUP, RPC_CLIENT_NOT_CONNECTED, RPC_CLIENT_IN_INITIAL_DOWNLOAD
constexpr int kRetryableRpcCodes[] = {-28, -9, -10};

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

} // namespace

FetchStatus classify_rpc_error(int http_status, int rpc_code) {
  if (http_status == 401 || http_status == 403) return FetchStatus::Fatal;
  for (int c : kRetryableRpcCodes) {
    if (rpc_code == c) return FetchStatus::Retryable;
  }
  if (rpc_code != 0) return FetchStatus::Fatal;
  // no rpc error object: 5xx (work queue full, restarting) is worth another try
  if (http_status >= 500 || http_status == 0) return FetchStatus::Retryable;
  return FetchStatus::Fatal;
}

RpcClient::RpcClient(const chainseg::RpcConfig& cfg) {
  // "http://host:port/wallet/x" -> client on scheme+host+port, requests on the path
  std::string base = cfg.url;
  const size_t scheme = base.find("://");
  const size_t path_at = base.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (path_at != std::string::npos) {
    path_ = base.substr(path_at);
    base = base.substr(0, path_at);
  }
  if (base.empty()) throw chainseg::ConfigError("rpc url is empty");

  cli_ = std::make_unique<httplib::Client>(base);
  cli_->set_connection_timeout((time_t)cfg.timeout_sec, 0);
  cli_->set_read_timeout((time_t)cfg.timeout_sec, 0);
  cli_->set_write_timeout((time_t)cfg.timeout_sec, 0);
  cli_->set_keep_alive(true);

  load_credentials(cfg);
  if (!user_.empty()) cli_->set_basic_auth(user_, password_);
}

RpcClient::~RpcClient() = default;

void RpcClient::load_credentials(const chainseg::RpcConfig& cfg) {
  if (!cfg.user.empty()) {
    user_ = cfg.user;
    password_ = cfg.password;
    return;
  }
  if (cfg.cookie_file.empty()) return;

  // bitcoind .cookie: "__cookie__:<hex>"
  std::string text;
  if (!chainseg::read_file_to_string(cfg.cookie_file, text)) {
    throw chainseg::ConfigError("cannot read rpc cookie file " + cfg.cookie_file);
  }
  text = trim(text);
  const size_t colon = text.find(':');
  if (colon == std::string::npos) throw chainseg::ConfigError("malformed rpc cookie file " + cfg.cookie_file);
  user_ = text.substr(0, colon);
  password_ = text.substr(colon + 1);
}

RpcResult RpcClient::call(const std::string& method, const json& params) {
  RpcResult out;

  const json req = {
    {"jsonrpc", "1.0"},
    {"id", next_id_++},
    {"method", method},
    {"params", params},
  };

  auto res = cli_->Post(path_, req.dump(), "application/json");
  if (!res) {
    out.status = FetchStatus::Retryable;
    out.error = method + ": " + httplib::to_string(res.error());
    return out;
  }

  json body = json::parse(res->body, nullptr, false);
  int rpc_code = 0;
  std::string rpc_msg;
  if (!body.is_discarded() && body.is_object()) {
    auto err = body.find("error");
    if (err != body.end() && err->is_object()) {
      rpc_code = err->value("code", 0);
      rpc_msg = err->value("message", "");
      if (rpc_code == 0) rpc_code = -1;
    }
  }

  if (res->status != 200 || rpc_code != 0) {
    out.status = classify_rpc_error(res->status, rpc_code);
    out.error = method + ": http " + std::to_string(res->status);
    if (rpc_code != 0) out.error += " rpc " + std::to_string(rpc_code) + " " + rpc_msg;
    return out;
  }
  if (body.is_discarded() || !body.is_object() || !body.contains("result")) {
    out.status = FetchStatus::Fatal;
    out.error = method + ": malformed response";
    return out;
  }

  out.result = std::move(body["result"]);
  return out;
}
