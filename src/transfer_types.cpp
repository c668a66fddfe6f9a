#include "transfer_types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "utils.hpp"

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool has_control_chars(const std::string& value) {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch){ return ch == '\0' || ch == '\n' || ch == '\r'; });
}

template<typename T>
bool contains(const std::vector<T>& values, const T& needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

} // namespace

std::int64_t to_millis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string format_timestamp(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  auto ms = to_millis(tp) % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

std::string to_string(TransferType type) {
  switch(type) {
    case TransferType::Upload: return "upload";
    case TransferType::Download: return "download";
    case TransferType::Sync: return "sync";
  }
  return "download";
}

std::string to_string(TransferPriority priority) {
  switch(priority) {
    case TransferPriority::Low: return "LOW";
    case TransferPriority::Normal: return "NORMAL";
    case TransferPriority::High: return "HIGH";
    case TransferPriority::Urgent: return "URGENT";
  }
  return "NORMAL";
}

std::string to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::Queued: return "QUEUED";
    case TransferStatus::Scheduled: return "SCHEDULED";
    case TransferStatus::Transferring: return "TRANSFERRING";
    case TransferStatus::Completed: return "COMPLETED";
    case TransferStatus::Failed: return "FAILED";
    case TransferStatus::Cancelled: return "CANCELLED";
  }
  return "QUEUED";
}

TransferType transfer_type_from_string(const std::string& text) {
  auto v = lowered(text);
  if(v == "upload") return TransferType::Upload;
  if(v == "download") return TransferType::Download;
  if(v == "sync") return TransferType::Sync;
  throw ValidationError("unknown transfer type '" + text + "'");
}

TransferPriority priority_from_string(const std::string& text) {
  auto v = lowered(text);
  if(v == "low") return TransferPriority::Low;
  if(v == "normal") return TransferPriority::Normal;
  if(v == "high") return TransferPriority::High;
  if(v == "urgent") return TransferPriority::Urgent;
  throw ValidationError("unknown priority '" + text + "'");
}

TransferStatus status_from_string(const std::string& text) {
  auto v = lowered(text);
  if(v == "queued") return TransferStatus::Queued;
  if(v == "scheduled") return TransferStatus::Scheduled;
  if(v == "transferring") return TransferStatus::Transferring;
  if(v == "completed") return TransferStatus::Completed;
  if(v == "failed") return TransferStatus::Failed;
  if(v == "cancelled") return TransferStatus::Cancelled;
  throw ValidationError("unknown transfer status '" + text + "'");
}

int priority_rank(TransferPriority priority) {
  return static_cast<int>(priority);
}

bool priority_outranks(TransferPriority a, TransferPriority b) {
  return priority_rank(a) > priority_rank(b);
}

bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Completed ||
         status == TransferStatus::Failed ||
         status == TransferStatus::Cancelled;
}

bool is_active(TransferStatus status) {
  return status == TransferStatus::Queued ||
         status == TransferStatus::Scheduled ||
         status == TransferStatus::Transferring;
}

bool is_pull(TransferType type) {
  return type != TransferType::Upload;
}

std::string SshTarget::fingerprint() const {
  const std::string& credential = private_key_path.empty() ? password : private_key_path;
  return sha256_hex(host + ":" + std::to_string(port) + ":" + user + ":" + credential).substr(0, 32);
}

std::string SshTarget::display() const {
  return user + "@" + host + ":" + std::to_string(port);
}

bool SshTarget::operator==(const SshTarget& other) const {
  return host == other.host && port == other.port && user == other.user &&
         private_key_path == other.private_key_path && password == other.password;
}

TimePoint Transfer::last_activity() const {
  if(last_progress_at && *last_progress_at > last_state_change) return *last_progress_at;
  return last_state_change;
}

bool TransferFilter::matches(const Transfer& transfer) const {
  if(!statuses.empty() && !contains(statuses, transfer.status)) return false;
  if(!priorities.empty() && !contains(priorities, transfer.priority)) return false;
  if(!types.empty() && !contains(types, transfer.type)) return false;
  if(!job_id.empty() && transfer.job_id != job_id) return false;
  if(!file_id.empty() && transfer.file_id != file_id) return false;
  if(!filename_contains.empty() &&
     lowered(transfer.filename).find(lowered(filename_contains)) == std::string::npos) {
    return false;
  }
  if(queued_after && transfer.queued_at < *queued_after) return false;
  if(queued_before && transfer.queued_at > *queued_before) return false;
  return true;
}

std::vector<std::string> validate_transfer_spec(const TransferSpec& spec) {
  std::vector<std::string> errors;
  if(spec.job_id.empty()) errors.push_back("job id is required");
  if(spec.file_id.empty()) errors.push_back("file id is required");
  if(spec.source.empty()) errors.push_back("source path is required");
  if(spec.destination.empty()) errors.push_back("destination path is required");
  if(has_control_chars(spec.source) || has_control_chars(spec.destination)) {
    errors.push_back("paths may not contain NUL or line breaks");
  }

  const std::string& local = is_pull(spec.type) ? spec.destination : spec.source;
  if(!local.empty() && local.front() != '/') {
    errors.push_back("local path must be absolute: " + local);
  }

  if(spec.ssh.host.empty()) errors.push_back("ssh host is required");
  if(spec.ssh.user.empty()) errors.push_back("ssh user is required");
  if(spec.ssh.port < 1 || spec.ssh.port > 65535) {
    errors.push_back("ssh port out of range: " + std::to_string(spec.ssh.port));
  }
  if(has_control_chars(spec.ssh.host) || spec.ssh.host.find(' ') != std::string::npos) {
    errors.push_back("ssh host contains invalid characters");
  }
  if(spec.max_retries && (*spec.max_retries < 0 || *spec.max_retries > 20)) {
    errors.push_back("max retries must be between 0 and 20");
  }
  if(spec.rsync.bandwidth_limit_kbps < 0) errors.push_back("bandwidth limit cannot be negative");
  if(spec.rsync.io_timeout_seconds < 0) errors.push_back("rsync timeout cannot be negative");
  return errors;
}

Transfer make_transfer(const TransferSpec& spec, int default_max_retries) {
  Transfer t;
  t.transfer_id = generate_transfer_id();
  t.job_id = spec.job_id;
  t.file_id = spec.file_id;
  t.type = spec.type;
  t.priority = spec.priority;
  t.source = spec.source;
  t.destination = spec.destination;
  t.relative_path = spec.relative_path;
  t.filename = spec.filename;
  if(t.filename.empty()) {
    const std::string& path = spec.relative_path.empty() ? spec.source : spec.relative_path;
    auto pos = path.find_last_of('/');
    t.filename = (pos == std::string::npos) ? path : path.substr(pos + 1);
  }
  t.size = spec.size;
  t.ssh = spec.ssh;
  t.rsync = spec.rsync;
  t.max_retries = spec.max_retries.value_or(default_max_retries);
  t.status = TransferStatus::Queued;
  t.queued_at = Clock::now();
  t.last_state_change = t.queued_at;
  return t;
}

void to_json(nlohmann::json& j, const SshTarget& target) {
  j = nlohmann::json{
    {"host", target.host},
    {"port", target.port},
    {"user", target.user},
    {"private_key_path", target.private_key_path},
    {"password", target.password}
  };
}

void from_json(const nlohmann::json& j, SshTarget& target) {
  target.host = j.value("host", "");
  target.port = j.value("port", 22);
  target.user = j.value("user", j.value("username", ""));
  target.private_key_path = j.value("private_key_path", j.value("privateKey", ""));
  target.password = j.value("password", "");
}

void to_json(nlohmann::json& j, const RsyncOptions& o) {
  j = nlohmann::json{
    {"archive", o.archive},
    {"compress", o.compress},
    {"partial", o.partial},
    {"delete", o.delete_extraneous},
    {"checksum", o.checksum},
    {"dry_run", o.dry_run},
    {"inplace", o.inplace},
    {"mkpath", o.mkpath},
    {"itemize", o.itemize},
    {"update", o.update_only},
    {"bwlimit", o.bandwidth_limit_kbps},
    {"timeout", o.io_timeout_seconds},
    {"max_size", o.max_size},
    {"min_size", o.min_size},
    {"exclude", o.excludes},
    {"include", o.includes},
    {"ssh_options", o.extra_ssh_options}
  };
}

void from_json(const nlohmann::json& j, RsyncOptions& o) {
  RsyncOptions d;
  o.archive = j.value("archive", d.archive);
  o.compress = j.value("compress", d.compress);
  o.partial = j.value("partial", d.partial);
  o.delete_extraneous = j.value("delete", d.delete_extraneous);
  o.checksum = j.value("checksum", d.checksum);
  o.dry_run = j.value("dry_run", d.dry_run);
  o.inplace = j.value("inplace", d.inplace);
  o.mkpath = j.value("mkpath", d.mkpath);
  o.itemize = j.value("itemize", d.itemize);
  o.update_only = j.value("update", d.update_only);
  o.bandwidth_limit_kbps = j.value("bwlimit", d.bandwidth_limit_kbps);
  o.io_timeout_seconds = j.value("timeout", d.io_timeout_seconds);
  o.max_size = j.value("max_size", d.max_size);
  o.min_size = j.value("min_size", d.min_size);
  o.excludes = j.value("exclude", std::vector<std::string>{});
  o.includes = j.value("include", std::vector<std::string>{});
  o.extra_ssh_options = j.value("ssh_options", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const StateChange& change) {
  j = nlohmann::json{
    {"from", to_string(change.from)},
    {"to", to_string(change.to)},
    {"at", to_millis(change.at)},
    {"reason", change.reason}
  };
}

void from_json(const nlohmann::json& j, StateChange& change) {
  change.from = status_from_string(j.at("from").get<std::string>());
  change.to = status_from_string(j.at("to").get<std::string>());
  change.at = from_millis(j.value("at", std::int64_t{0}));
  change.reason = j.value("reason", "");
}

nlohmann::json transfer_summary(const Transfer& t) {
  nlohmann::json j{
    {"transferId", t.transfer_id},
    {"jobId", t.job_id},
    {"fileId", t.file_id},
    {"type", to_string(t.type)},
    {"priority", to_string(t.priority)},
    {"status", to_string(t.status)},
    {"source", t.source},
    {"destination", t.destination},
    {"filename", t.filename},
    {"size", t.size},
    {"target", t.ssh.display()},
    {"progress", t.progress},
    {"speed", t.speed},
    {"eta", t.eta},
    {"bytesTransferred", t.bytes_transferred},
    {"retryCount", t.retry_count},
    {"maxRetries", t.max_retries},
    {"queuedAt", format_timestamp(t.queued_at)},
    {"lastStateChange", format_timestamp(t.last_state_change)}
  };
  if(t.started_at) j["startedAt"] = format_timestamp(*t.started_at);
  if(t.completed_at) j["completedAt"] = format_timestamp(*t.completed_at);
  if(t.concurrency_slot) j["slot"] = *t.concurrency_slot;
  if(!t.error_message.empty()) j["error"] = t.error_message;
  return j;
}

nlohmann::json stats_to_json(const QueueStats& s) {
  return nlohmann::json{
    {"total", s.total},
    {"queued", s.queued},
    {"scheduled", s.scheduled},
    {"transferring", s.transferring},
    {"active", s.active},
    {"completed", s.completed},
    {"failed", s.failed},
    {"cancelled", s.cancelled},
    {"queuedBytes", s.queued_bytes}
  };
}
