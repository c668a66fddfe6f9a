#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

std::int64_t to_millis(TimePoint tp);
TimePoint from_millis(std::int64_t ms);
std::string format_timestamp(TimePoint tp);

enum class TransferType { Upload, Download, Sync };

// Numeric values are the total order used by the queue: higher dispatches first.
enum class TransferPriority { Low = 0, Normal = 1, High = 2, Urgent = 3 };

enum class TransferStatus { Queued, Scheduled, Transferring, Completed, Failed, Cancelled };

std::string to_string(TransferType type);
std::string to_string(TransferPriority priority);
std::string to_string(TransferStatus status);

// Parsers accept any case and throw ValidationError on unknown names.
TransferType transfer_type_from_string(const std::string& text);
TransferPriority priority_from_string(const std::string& text);
TransferStatus status_from_string(const std::string& text);

int priority_rank(TransferPriority priority);
bool priority_outranks(TransferPriority a, TransferPriority b);

bool is_terminal(TransferStatus status);
bool is_active(TransferStatus status);

// Pull transfers (download, sync) move remote -> local.
bool is_pull(TransferType type);

struct SshTarget {
  std::string host;
  int port = 22;
  std::string user;
  std::string private_key_path;
  std::string password;

  std::string fingerprint() const;
  std::string display() const;
  bool operator==(const SshTarget& other) const;
};

struct RsyncOptions {
  bool archive = true;
  bool compress = true;
  bool partial = true;
  bool delete_extraneous = false;
  bool checksum = false;
  bool dry_run = false;
  bool inplace = false;
  bool mkpath = false;
  bool itemize = true;
  bool update_only = false;
  int bandwidth_limit_kbps = 0;
  int io_timeout_seconds = 300;
  std::uint64_t max_size = 0;
  std::uint64_t min_size = 0;
  std::vector<std::string> excludes;
  std::vector<std::string> includes;
  std::vector<std::string> extra_ssh_options;
};

struct TransferSpec {
  std::string job_id;
  std::string file_id;
  TransferType type = TransferType::Download;
  TransferPriority priority = TransferPriority::Normal;
  std::string source;
  std::string destination;
  std::string relative_path;
  std::string filename;
  std::uint64_t size = 0;
  SshTarget ssh;
  RsyncOptions rsync;
  std::optional<int> max_retries;
};

struct StateChange {
  TransferStatus from = TransferStatus::Queued;
  TransferStatus to = TransferStatus::Queued;
  TimePoint at;
  std::string reason;
};

struct ProgressUpdate {
  double percent = 0.0;
  std::string speed;
  std::string eta;
  std::uint64_t bytes_transferred = 0;
};

struct Transfer {
  std::string transfer_id;
  std::string job_id;
  std::string file_id;
  TransferType type = TransferType::Download;
  TransferPriority priority = TransferPriority::Normal;
  std::string source;
  std::string destination;
  std::string relative_path;
  std::string filename;
  std::uint64_t size = 0;
  SshTarget ssh;
  RsyncOptions rsync;

  int max_retries = 3;
  int retry_count = 0;
  TransferStatus status = TransferStatus::Queued;

  double progress = 0.0;
  std::string speed;
  std::string eta;
  std::uint64_t bytes_transferred = 0;

  std::string error_message;
  std::optional<ErrorCategory> error_category;
  std::optional<int> concurrency_slot;

  TimePoint queued_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  TimePoint last_state_change;
  std::optional<TimePoint> last_progress_at;

  std::vector<StateChange> history;

  // Latest moment the transfer showed any sign of life.
  TimePoint last_activity() const;
};

constexpr std::size_t kMaxStateHistory = 10;

struct TransferFilter {
  std::vector<TransferStatus> statuses;
  std::vector<TransferPriority> priorities;
  std::vector<TransferType> types;
  std::string job_id;
  std::string file_id;
  std::string filename_contains;
  std::optional<TimePoint> queued_after;
  std::optional<TimePoint> queued_before;

  bool matches(const Transfer& transfer) const;
};

struct QueueStats {
  std::size_t total = 0;
  std::size_t queued = 0;
  std::size_t scheduled = 0;
  std::size_t transferring = 0;
  std::size_t active = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t cancelled = 0;
  std::uint64_t queued_bytes = 0;
};

std::vector<std::string> validate_transfer_spec(const TransferSpec& spec);
Transfer make_transfer(const TransferSpec& spec, int default_max_retries);

void to_json(nlohmann::json& j, const SshTarget& target);
void from_json(const nlohmann::json& j, SshTarget& target);
void to_json(nlohmann::json& j, const RsyncOptions& options);
void from_json(const nlohmann::json& j, RsyncOptions& options);
void to_json(nlohmann::json& j, const StateChange& change);
void from_json(const nlohmann::json& j, StateChange& change);

// Public view of a transfer. Credentials are left out.
nlohmann::json transfer_summary(const Transfer& transfer);
nlohmann::json stats_to_json(const QueueStats& stats);
