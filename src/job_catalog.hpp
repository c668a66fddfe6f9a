#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

class Logger;

struct JobRecord {
  std::string id;
  std::string name;
  bool enabled = true;
  std::string remote_path;
  std::string local_path;
  TransferType direction = TransferType::Download;
  int scan_interval_minutes = 60;
  std::optional<int> max_concurrent_transfers;
  // Cap on open SSH connections to `server`.
  std::optional<int> max_connections;
  int max_retries = 3;
  TransferPriority priority = TransferPriority::Normal;
  RsyncOptions rsync;
  SshTarget server;
  std::optional<TimePoint> last_scan;
};

void to_json(nlohmann::json& j, const JobRecord& job);
void from_json(const nlohmann::json& j, JobRecord& job);

// Read-mostly source of job definitions. The only write is a job's last scan time.
class JobCatalog {
public:
  virtual ~JobCatalog() = default;
  virtual std::vector<JobRecord> list_jobs() = 0;
  virtual std::optional<JobRecord> get_job(const std::string& job_id) = 0;
  virtual bool set_last_scan(const std::string& job_id, TimePoint when, std::string& err) = 0;
};

// Jobs from a JSON file: {"jobs": [ {...}, ... ]}. Reloaded when the file's
// modification time changes.
class JsonJobCatalog : public JobCatalog {
public:
  explicit JsonJobCatalog(std::filesystem::path path, std::shared_ptr<Logger> logger = nullptr);

  bool load(std::string& err);

  std::vector<JobRecord> list_jobs() override;
  std::optional<JobRecord> get_job(const std::string& job_id) override;
  bool set_last_scan(const std::string& job_id, TimePoint when, std::string& err) override;

  const std::filesystem::path& path() const { return path_; }

private:
  bool load_locked(std::string& err);
  void reload_if_changed();

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  std::mutex mutex_;
  nlohmann::json document_;
  std::vector<JobRecord> jobs_;
  std::filesystem::file_time_type loaded_mtime_{};
};
