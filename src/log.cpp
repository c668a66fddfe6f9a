#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace {

constexpr std::size_t kLogFileMaxBytes = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 5;
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::mutex mutex;
  // Indexed by LogStream.
  std::array<std::shared_ptr<spdlog::logger>, 4> streams;
  std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file;
  std::string file_path;
};

struct ComponentRegistry {
  std::mutex mutex;
  std::vector<std::pair<std::string, std::weak_ptr<Logger>>> loggers;
  std::map<std::string, spdlog::level::level_enum> levels;
  spdlog::level::level_enum default_level = spdlog::level::trace;
};

Sinks& sinks() {
  static Sinks s;
  return s;
}

ComponentRegistry& registry() {
  static ComponentRegistry r;
  return r;
}

std::atomic<bool> g_passthrough{true};

std::size_t index_of(LogStream stream) {
  return static_cast<std::size_t>(stream);
}

std::shared_ptr<spdlog::logger> make_stream(const char* name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::trace);
  return logger;
}

// Caller holds sinks().mutex.
void create_streams_locked(Sinks& s) {
  if(s.streams[0]) return;
  s.streams[index_of(LogStream::Diagnostic)] =
    make_stream("warpsync.log", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kStampedPattern);
  s.streams[index_of(LogStream::Error)] =
    make_stream("warpsync.error", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kStampedPattern);
  s.streams[index_of(LogStream::Print)] =
    make_stream("warpsync.print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
  s.streams[index_of(LogStream::PrintErr)] =
    make_stream("warpsync.print_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");
  s.streams[index_of(LogStream::Diagnostic)]->flush_on(spdlog::level::warn);
  s.streams[index_of(LogStream::Error)]->flush_on(spdlog::level::err);
  s.streams[index_of(LogStream::Print)]->flush_on(spdlog::level::info);
  s.streams[index_of(LogStream::PrintErr)]->flush_on(spdlog::level::err);
}

std::shared_ptr<spdlog::logger> stream_logger(LogStream stream) {
  auto& s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  create_streams_locked(s);
  return s.streams[index_of(stream)];
}

bool attach_file_sink_locked(Sinks& s, const std::string& path, std::string& err) {
  if(path.empty() || path == s.file_path) return true;
  std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> sink;
  try {
    sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, kLogFileMaxBytes, kLogFileCount);
  } catch(const spdlog::spdlog_ex& e) {
    err = "cannot open log file " + path + ": " + e.what();
    return false;
  }
  sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  for(auto& logger : s.streams) {
    auto& list = logger->sinks();
    if(s.file) list.erase(std::remove(list.begin(), list.end(), s.file), list.end());
    list.push_back(sink);
  }
  s.file = std::move(sink);
  s.file_path = path;
  return true;
}

std::string trimmed(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c){ return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool parse_component_levels(const std::string& text,
                            std::map<std::string, spdlog::level::level_enum>& out,
                            std::string& err) {
  std::stringstream ss(text);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item = trimmed(item);
    if(item.empty()) continue;
    const auto eq = item.find('=');
    if(eq == std::string::npos || eq == 0) {
      err = "expected component=level, got '" + item + "'";
      return false;
    }
    const auto level = parse_log_level(item.substr(eq + 1));
    if(!level) {
      err = "unknown log level in '" + item + "'";
      return false;
    }
    out[trimmed(item.substr(0, eq))] = *level;
  }
  return true;
}

spdlog::level::level_enum level_for_locked(const ComponentRegistry& r, const std::string& component) {
  auto it = r.levels.find(component);
  return it != r.levels.end() ? it->second : r.default_level;
}

void apply_levels_locked(ComponentRegistry& r) {
  auto& loggers = r.loggers;
  loggers.erase(std::remove_if(loggers.begin(), loggers.end(),
    [](const auto& entry){ return entry.second.expired(); }), loggers.end());
  for(auto& entry : loggers) {
    if(auto logger = entry.second.lock()) logger->set_level(level_for_locked(r, entry.first));
  }
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
  std::string v = trimmed(text);
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if(v == "trace") return spdlog::level::trace;
  if(v == "debug") return spdlog::level::debug;
  if(v == "info") return spdlog::level::info;
  if(v == "warn" || v == "warning") return spdlog::level::warn;
  if(v == "error" || v == "err") return spdlog::level::err;
  if(v == "off") return spdlog::level::off;
  return std::nullopt;
}

bool init_logging(const LogConfig& config, std::string& err) {
  bool ok = true;
  {
    auto& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    create_streams_locked(s);
    if(!attach_file_sink_locked(s, config.file, err)) {
      std::cerr << err << "\n";
      ok = false;
    }
    spdlog::set_default_logger(s.streams[index_of(LogStream::Diagnostic)]);
  }

  std::map<std::string, spdlog::level::level_enum> levels;
  std::string level_err;
  if(!parse_component_levels(config.component_levels, levels, level_err)) {
    err = level_err;
    levels.clear();
    ok = false;
  }
  auto& r = registry();
  std::lock_guard<std::mutex> lock(r.mutex);
  r.default_level = config.level;
  r.levels = std::move(levels);
  apply_levels_locked(r);
  return ok;
}

void init(bool verbose, const std::string& log_file) {
  LogConfig config;
  config.level = verbose ? spdlog::level::debug : spdlog::level::info;
  config.file = log_file;
  std::string err;
  init_logging(config, err);
}

void shutdown_logging() {
  auto& s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  for(auto& logger : s.streams) {
    if(logger) logger->flush();
  }
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

std::shared_ptr<Logger> make_component_logger(const std::string& component) {
  auto logger = std::make_shared<Logger>("warpsync." + component);
  auto& r = registry();
  std::lock_guard<std::mutex> lock(r.mutex);
  logger->set_level(level_for_locked(r, component));
  r.loggers.emplace_back(component, logger);
  return logger;
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::notify_listeners(spdlog::level::level_enum level, const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool claimed = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, name_, level, message)) claimed = true;
    } catch(const std::exception& e) {
      std::cerr << "log listener on " << name_ << " threw: " << e.what() << "\n";
    }
  }
  return claimed;
}

void Logger::write(LogStream stream, spdlog::level::level_enum level, const std::string& message) {
  if(notify_listeners(level, message)) return;
  if(!log_passthrough()) return;
  auto sink = stream_logger(stream);
  if(name_.empty() || stream == LogStream::Print || stream == LogStream::PrintErr) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", name_, message));
  }
}

namespace detail {

void write_unowned(LogStream stream, spdlog::level::level_enum level, const std::string& message) {
  if(!log_passthrough()) return;
  stream_logger(stream)->log(level, message);
}

} // namespace detail
