#include "job_catalog.hpp"

#include <fstream>

#include "log.hpp"

void to_json(nlohmann::json& j, const JobRecord& job) {
  j = nlohmann::json{
    {"id", job.id},
    {"name", job.name},
    {"enabled", job.enabled},
    {"remote_path", job.remote_path},
    {"local_path", job.local_path},
    {"direction", to_string(job.direction)},
    {"scan_interval_minutes", job.scan_interval_minutes},
    {"max_retries", job.max_retries},
    {"priority", to_string(job.priority)},
    {"rsync", job.rsync},
    {"server", job.server}
  };
  if(job.max_concurrent_transfers) j["max_concurrent_transfers"] = *job.max_concurrent_transfers;
  if(job.max_connections) j["max_connections"] = *job.max_connections;
  if(job.last_scan) j["last_scan"] = to_millis(*job.last_scan);
}

void from_json(const nlohmann::json& j, JobRecord& job) {
  job.id = j.at("id").get<std::string>();
  job.name = j.value("name", job.id);
  job.enabled = j.value("enabled", true);
  job.remote_path = j.at("remote_path").get<std::string>();
  job.local_path = j.at("local_path").get<std::string>();
  job.direction = transfer_type_from_string(j.value("direction", std::string("download")));
  job.scan_interval_minutes = j.value("scan_interval_minutes", 60);
  if(j.contains("max_concurrent_transfers")) {
    job.max_concurrent_transfers = j.at("max_concurrent_transfers").get<int>();
  }
  if(j.contains("max_connections")) {
    job.max_connections = j.at("max_connections").get<int>();
  }
  job.max_retries = j.value("max_retries", 3);
  job.priority = priority_from_string(j.value("priority", std::string("normal")));
  if(j.contains("rsync")) job.rsync = j.at("rsync").get<RsyncOptions>();
  job.server = j.at("server").get<SshTarget>();
  if(j.contains("last_scan") && j.at("last_scan").is_number()) {
    job.last_scan = from_millis(j.at("last_scan").get<std::int64_t>());
  }
}

JsonJobCatalog::JsonJobCatalog(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : make_component_logger("job-catalog")) {}

bool JsonJobCatalog::load(std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_locked(err);
}

bool JsonJobCatalog::load_locked(std::string& err) {
  std::ifstream in(path_);
  if(!in) {
    err = "cannot open " + path_.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    err = "cannot parse " + path_.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object() || !doc.contains("jobs") || !doc.at("jobs").is_array()) {
    err = path_.string() + " has no \"jobs\" array";
    return false;
  }

  std::vector<JobRecord> jobs;
  for(const auto& entry : doc.at("jobs")) {
    try {
      jobs.push_back(entry.get<JobRecord>());
    } catch(const std::exception& e) {
      logger_->warn("Skipping job entry in {}: {}", path_.string(), e.what());
    }
  }

  std::error_code ec;
  loaded_mtime_ = std::filesystem::last_write_time(path_, ec);
  document_ = std::move(doc);
  jobs_ = std::move(jobs);
  logger_->debug("Loaded {} jobs from {}", jobs_.size(), path_.string());
  return true;
}

void JsonJobCatalog::reload_if_changed() {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path_, ec);
  if(ec || mtime == loaded_mtime_) return;
  std::string err;
  if(!load_locked(err)) {
    logger_->warn("Keeping previous job list: {}", err);
  }
}

std::vector<JobRecord> JsonJobCatalog::list_jobs() {
  std::lock_guard<std::mutex> lock(mutex_);
  reload_if_changed();
  return jobs_;
}

std::optional<JobRecord> JsonJobCatalog::get_job(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  reload_if_changed();
  for(const auto& job : jobs_) {
    if(job.id == job_id) return job;
  }
  return std::nullopt;
}

bool JsonJobCatalog::set_last_scan(const std::string& job_id, TimePoint when, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool found = false;
  for(auto& entry : document_["jobs"]) {
    if(entry.is_object() && entry.value("id", std::string()) == job_id) {
      entry["last_scan"] = to_millis(when);
      found = true;
      break;
    }
  }
  if(!found) {
    err = "unknown job " + job_id;
    return false;
  }

  // Written beside the target and renamed over it.
  const auto tmp = path_.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      err = "cannot write " + tmp;
      return false;
    }
    out << document_.dump(2);
    if(!out) {
      err = "write to " + tmp + " failed";
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if(ec) {
    err = "cannot replace " + path_.string() + ": " + ec.message();
    return false;
  }
  loaded_mtime_ = std::filesystem::last_write_time(path_, ec);
  for(auto& job : jobs_) {
    if(job.id == job_id) job.last_scan = when;
  }
  return true;
}
