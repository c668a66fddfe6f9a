#pragma once

#include <sqlite3.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "transfer_types.hpp"

// Durable transfer ledger. One row per transfer keyed by transfer_id; every
// write replaces the whole record so a row is always a complete snapshot.
class TransferStore {
public:
  explicit TransferStore(std::string db_path);
  ~TransferStore();

  TransferStore(const TransferStore&) = delete;
  TransferStore& operator=(const TransferStore&) = delete;

  bool open(std::string& err);
  bool is_open() const { return db_ != nullptr; }
  void close();
  const std::string& path() const { return db_path_; }

  bool save(const Transfer& transfer, std::string& err);
  bool load(const std::string& transfer_id, Transfer& out, bool& found, std::string& err);
  bool load_active(std::vector<Transfer>& out, std::string& err);
  bool load_matching(const TransferFilter& filter, std::vector<Transfer>& out, std::string& err);
  bool find_active_by_pair(const std::string& job_id,
                           const std::string& file_id,
                           std::vector<Transfer>& out,
                           std::string& err);
  bool count_by_status(std::map<TransferStatus, std::size_t>& out, std::string& err);
  bool remove_terminal_before(TimePoint cutoff, std::size_t& removed, std::string& err);

private:
  bool init_schema(std::string& err);
  bool query(const std::string& sql,
             const std::vector<std::string>& text_params,
             std::vector<Transfer>& out,
             std::string& err);
  static Transfer row_to_transfer(sqlite3_stmt* stmt);

  std::string db_path_;
  sqlite3* db_ = nullptr;
  std::mutex mutex_;
};
