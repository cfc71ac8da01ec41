// service/storage.h
#pragma once
#include <optional>
#include <string>

#include "chainseg/producer.h"

struct MetaRow {
  std::string key;
  int dirty{0};
  std::string value;
  std::string updated_at_utc;
};

// Bookkeeping for the web surface: last build timestamps and dirty markers.
class SqliteMetaSink : public chainseg::MetaSink {
public:
  explicit SqliteMetaSink(const std::string& db_path);
  ~SqliteMetaSink() override;

  SqliteMetaSink(const SqliteMetaSink&) = delete;
  SqliteMetaSink& operator=(const SqliteMetaSink&) = delete;

  void init();

  void mark_dirty(const std::string& key) override;
  void set_timestamp(const std::string& key, const std::string& value) override;

  std::optional<MetaRow> get(const std::string& key);
  void clear_dirty(const std::string& key);

private:
  void* db_{nullptr}; // sqlite3*
  std::string path_;
};
