#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// One entry per setting. "min"/"max" bound numeric values; "env" names an
// environment variable that overrides the settings file.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","database_path"},       {"aliases", {"db"}},             {"type","string"}, {"default",".warpsync/transfers.db"}, {"env","WARPSYNC_DATABASE"}, {"description","SQLite file holding the transfer ledger"}},
  {{"key","jobs_file"},           {"aliases", {"jobs"}},           {"type","string"}, {"default","jobs.json"}, {"env","WARPSYNC_JOBS_FILE"}, {"description","JSON job catalog"}},
  {{"key","scanner_command"},     {"aliases", {"scanner"}},        {"type","string"}, {"default",""},        {"description","External scan command (receives job id, remote path, local path)"}},
  {{"key","rsync_binary"},        {"aliases", {"rsync"}},          {"type","string"}, {"default","rsync"},   {"description","rsync executable"}},
  {{"key","max_concurrent_transfers"}, {"aliases", {"mct"}},       {"type","int"},    {"default",3},         {"min",1}, {"max",64}, {"description","Global ceiling on running transfers"}},
  {{"key","max_queue_size"},      {"aliases", {"mqs"}},            {"type","int"},    {"default",1000},      {"min",1}, {"description","Maximum queued transfers"}},
  {{"key","default_max_retries"}, {"aliases", {"retries"}},        {"type","int"},    {"default",3},         {"min",0}, {"max",20}, {"description","Retries for transfers that do not set their own"}},
  {{"key","per_job_max_concurrency"}, {"aliases", {"pjmc"}},       {"type","int"},    {"default",3},         {"min",1}, {"max",64}, {"description","Per-job slot limit when the job does not set one"}},
  {{"key","limit_cache_ttl_seconds"}, {"aliases", {"lct"}},        {"type","int"},    {"default",300},       {"min",1}, {"description","Lifetime of cached per-job limits"}},
  {{"key","ssh_connect_timeout_ms"}, {"aliases", {"sct"}},         {"type","int"},    {"default",30000},     {"min",1000}, {"description","SSH connect + auth timeout"}},
  {{"key","ssh_acquire_timeout_ms"}, {"aliases", {"sat"}},         {"type","int"},    {"default",60000},     {"min",1000}, {"description","Wait for a pooled SSH connection"}},
  {{"key","ssh_max_idle_ms"},     {"aliases", {"smi"}},            {"type","int"},    {"default",300000},    {"min",1000}, {"description","Idle SSH connections older than this are closed"}},
  {{"key","ssh_connection_ttl_ms"}, {"aliases", {"sttl"}},         {"type","int"},    {"default",1800000},   {"min",1000}, {"description","Maximum age of an SSH connection"}},
  {{"key","ssh_pool_sweep_ms"},   {"aliases", {"sps"}},            {"type","int"},    {"default",60000},     {"min",1000}, {"description","Interval of the idle connection sweep"}},
  {{"key","ssh_pool_min_per_target"}, {"aliases", {"spmin"}},      {"type","int"},    {"default",0},         {"min",0}, {"max",32}, {"description","Idle connections kept per target"}},
  {{"key","ssh_pool_max_per_target"}, {"aliases", {"spmax"}},      {"type","int"},    {"default",4},         {"min",1}, {"max",64}, {"description","Open connections allowed per target"}},
  {{"key","ssh_known_hosts"},     {"aliases", {"known_hosts"}},    {"type","string"}, {"default",""},        {"description","known_hosts file; empty accepts any host key"}},
  {{"key","progress_interval_ms"}, {"aliases", {"pim"}},           {"type","int"},    {"default",1000},      {"min",50}, {"description","Minimum milliseconds between progress updates"}},
  {{"key","cancel_grace_ms"},     {"aliases", {"grace"}},          {"type","int"},    {"default",5000},      {"min",100}, {"description","SIGTERM to SIGKILL grace period"}},
  {{"key","scheduler_check_interval_ms"}, {"aliases", {"sci"}},    {"type","int"},    {"default",30000},     {"min",5000}, {"env","SCHEDULER_CHECK_INTERVAL"}, {"description","Scheduler tick interval"}},
  {{"key","scheduler_max_concurrent_scans"}, {"aliases", {"smcs"}}, {"type","int"},   {"default",3},         {"min",1}, {"max",10}, {"env","SCHEDULER_MAX_CONCURRENT_SCANS"}, {"description","Scans running at once"}},
  {{"key","scheduler_scan_timeout_ms"}, {"aliases", {"sst"}},      {"type","int"},    {"default",600000},    {"min",60000}, {"env","SCHEDULER_SCAN_TIMEOUT"}, {"description","Upper bound for one scan"}},
  {{"key","scheduler_error_retry_delay_ms"}, {"aliases", {"serd"}}, {"type","int"},   {"default",300000},    {"min",30000}, {"env","SCHEDULER_ERROR_RETRY_DELAY"}, {"description","Delay before rescanning a failed job"}},
  {{"key","scheduler_max_error_count"}, {"aliases", {"smec"}},     {"type","int"},    {"default",5},         {"min",1}, {"max",20}, {"env","SCHEDULER_MAX_ERROR_COUNT"}, {"description","Consecutive scan failures before a job is parked in ERROR"}},
  {{"key","scheduler_health_check_interval_ms"}, {"aliases", {"shci"}}, {"type","int"}, {"default",60000},   {"min",30000}, {"env","SCHEDULER_HEALTH_CHECK_INTERVAL"}, {"description","Health check interval"}},
  {{"key","stuck_threshold_minutes"}, {"aliases", {"stuck"}},      {"type","int"},    {"default",30},        {"min",1}, {"description","Minutes without progress before a transfer counts as stuck"}},
  {{"key","recovery_interval_ms"}, {"aliases", {"ri"}},            {"type","int"},    {"default",300000},    {"min",10000}, {"description","Interval between recovery passes"}},
  {{"key","transfer_retention_hours"}, {"aliases", {"retention"}}, {"type","int"},    {"default",24},        {"min",1}, {"description","Terminal transfers older than this are purged"}},
  {{"key","event_port"},          {"aliases", {"ep"}},             {"type","int"},    {"default",7077},      {"min",-1}, {"max",65535}, {"description","Event stream TCP port (0 = ephemeral, -1 = disabled)"}},
  {{"key","event_listen_ip"},     {"aliases", {"eli"}},            {"type","string"}, {"default","127.0.0.1"},{"description","Interface/IP for the event stream"}},
  {{"key","console"},             {"aliases", {"c"}},              {"type","bool"},   {"default",false},     {"description","Start the interactive operator console"}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Shorthand for --log_level debug"}},
  {{"key","log_level"},           {"aliases", {"ll"}},             {"type","string"}, {"default","info"},    {"env","LOG_LEVEL"}, {"description","trace|debug|info|warn|error|off"}},
  {{"key","log_components"},      {"aliases", {"lc"}},             {"type","string"}, {"default",""},        {"description","Per-component levels, e.g. ssh-pool=debug,scheduler=warn"}},
  {{"key","log_file"},            {"aliases", {"lf"}},             {"type","string"}, {"default",""},        {"description","Rotating log file (empty = console only)"}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String };

struct SettingDefinition {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  bool persistent = true;
  std::optional<long long> min_value;
  std::optional<long long> max_value;
  std::string env;

  // "<int>", "<string>" or "[true|false]" for usage output.
  std::string argument_hint() const;
  std::string default_as_string() const;
};

// Typed key/value settings backed by a definition table. Values come from
// defaults, then the settings file, then the environment, then the command line.
class SettingsManager {
public:
  using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;
  std::chrono::milliseconds get_millis(const std::string& key) const;
  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Missing file is not an error. Invalid entries are skipped and reported in
  // warnings; a file that does not parse fails.
  bool load_from_file(const std::filesystem::path& path, std::vector<std::string>& warnings, std::string& err);
  bool save_to_file(const std::filesystem::path& path, std::string& err) const;
  bool load();
  bool save() const;

  // Applies every defined "env" override present. Returns false on the first
  // value the setting rejects.
  bool apply_environment(std::string& err, const EnvLookup& lookup = EnvLookup());

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  const std::vector<SettingDefinition>& definitions() const { return definitions_; }
  const SettingDefinition* find(const std::string& token) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json to_json(bool persistent_only = true) const;

  static std::optional<bool> parse_bool(const std::string& text);

private:
  static std::vector<SettingDefinition> parse_definitions(const nlohmann::json& specification);
  bool store(const SettingDefinition& def, const nlohmann::json& value, std::string& error);
  static bool parse_text(const SettingDefinition& def, const std::string& text,
                         nlohmann::json& out, std::string& error);

  std::vector<SettingDefinition> definitions_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

template<typename T>
T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
