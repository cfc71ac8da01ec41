// service/main.cpp
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <csignal>

#include "chainseg/config.h"
#include "chainseg/errors.h"
#include "chainseg/ingest.h"
#include "chainseg/shard_builder.h"
#include "chainseg/stop_signal.h"

#include "rpc_client.h"
#include "rpc_producer.h"
#include "storage.h"

namespace fs = std::filesystem;

static void on_signal(int) {
  chainseg::StopSignal::notify_from_signal_handler();
}

static void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static std::string arg_value(int& i, int argc, char** argv) {
  if (i + 1 >= argc) return "";
  return argv[++i];
}

static void usage() {
  std::cerr << "Usage:\n"
            << "  chainseg_worker ingest <stream> --config FILE [--mode backfill|follow]\n"
            << "  chainseg_worker sitemap <family> --config FILE\n";
}

// Meta bookkeeping must never stop a worker: without a usable db we run without it.
static std::unique_ptr<SqliteMetaSink> open_meta_sink(const fs::path& db) {
  if (db.empty()) return nullptr;
  try {
    auto sink = std::make_unique<SqliteMetaSink>(db.string());
    sink->init();
    return sink;
  } catch (const std::exception& e) {
    std::cerr << "[chainseg] meta db unavailable (" << db << "): " << e.what() << "\n";
    return nullptr;
  }
}

static int run_ingest(const chainseg::ChainsegConfig& cfg, const std::string& stream, const std::string& mode) {
  chainseg::IngestOptions opt = chainseg::find_ingest(cfg, stream);
  if (mode == "backfill") {
    opt.mode = chainseg::IngestMode::Backfill;
  } else if (mode == "follow") {
    opt.mode = chainseg::IngestMode::Follow;
  } else if (!mode.empty()) {
    throw chainseg::ConfigError("unknown --mode " + mode);
  }

  RpcClient rpc(cfg.rpc);
  RpcProducer producer(rpc, opt.entity);
  auto meta = open_meta_sink(cfg.meta_db);

  std::cerr << "[chainseg ingest " << chainseg::entity_name(opt.entity) << "] started: out=" << opt.out_dir
            << " state=" << opt.state_path << " segment_size=" << opt.segment_size
            << " confirmations=" << opt.finality_lag
            << " mode=" << (opt.mode == chainseg::IngestMode::Backfill ? "backfill" : "follow") << "\n";

  chainseg::StopSignal stop;
  chainseg::IngestionLoop loop(opt, producer, meta.get());
  const chainseg::IngestStats st = loop.run(stop);

  std::cerr << "[chainseg ingest " << chainseg::entity_name(opt.entity) << "] done: positions="
            << st.positions_processed << " records=" << st.records_written
            << " checkpoints=" << st.checkpoints_saved << " retries=" << st.retries
            << " aborted=" << st.aborted_iterations << " last=" << st.last_position_written
            << " phase=" << chainseg::ingest_phase_name(st.final_phase) << "\n";
  return 0;
}

static int run_sitemap(const chainseg::ChainsegConfig& cfg, const std::string& family) {
  const chainseg::ShardIndexOptions& opt = chainseg::find_sitemap(cfg, family);
  auto meta = open_meta_sink(cfg.meta_db);

  chainseg::StopSignal stop;
  chainseg::ShardIndexBuilder builder(opt, meta.get());
  builder.run(stop);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    usage();
    return 1;
  }

  const std::string cmd = argv[1];
  const std::string name = argv[2];
  std::string config_path;
  std::string mode;

  for (int i = 3; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config") config_path = arg_value(i, argc, argv);
    else if (a == "--mode") mode = arg_value(i, argc, argv);
    else {
      std::cerr << "unknown argument: " << a << "\n";
      usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    usage();
    return 1;
  }

  install_signal_handlers();

  try {
    const chainseg::ChainsegConfig cfg = chainseg::load_config(config_path);
    if (cmd == "ingest") return run_ingest(cfg, name, mode);
    if (cmd == "sitemap") return run_sitemap(cfg, name);
    usage();
    return 1;
  } catch (const chainseg::ConfigError& e) {
    std::cerr << "[chainseg] config error: " << e.what() << "\n";
    return 1;
  } catch (const chainseg::DurabilityError& e) {
    std::cerr << "[chainseg] durability error, exiting for restart: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "[chainseg] fatal: " << e.what() << "\n";
    return 2;
  }
}
