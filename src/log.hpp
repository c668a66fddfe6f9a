#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

// Where a message ends up when no listener claims it.
enum class LogStream {
  Diagnostic,  // timestamped stdout
  Error,       // timestamped stderr
  Print,       // bare stdout, operator-facing output
  PrintErr     // bare stderr
};

struct LogConfig {
  spdlog::level::level_enum level = spdlog::level::info;
  // Rotating file that receives every stream; empty for console only.
  std::string file;
  // "component=level,..." applied to component loggers, e.g. "ssh-pool=debug".
  std::string component_levels;
};

// Configures the shared sinks and the level of component loggers. Returns
// false with err set when component_levels does not parse; the global level
// still applies.
bool init_logging(const LogConfig& config, std::string& err);
void init(bool verbose = false, const std::string& log_file = std::string());
void shutdown_logging();

// Off while tests capture output through listeners.
void set_log_passthrough(bool enabled);
bool log_passthrough();

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

using LogListenerHandle = std::size_t;

class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  // Messages below this level are dropped before formatting, for listeners too.
  void set_level(spdlog::level::level_enum level) { level_.store(level); }
  spdlog::level::level_enum level() const { return level_.load(); }
  bool should_log(spdlog::level::level_enum level) const { return level >= level_.load(); }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::Diagnostic, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::Diagnostic, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::Diagnostic, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::Error, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogStream::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void emit(LogStream stream,
            spdlog::level::level_enum level,
            spdlog::format_string_t<Args...> fmt,
            Args&&... args) {
    if(!should_log(level)) return;
    write(stream, level, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void write(LogStream stream, spdlog::level::level_enum level, const std::string& message);
  bool notify_listeners(spdlog::level::level_enum level, const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::atomic<spdlog::level::level_enum> level_{spdlog::level::trace};
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

// Loggers named "warpsync.<component>". The level comes from the
// component_levels given to init_logging, also for loggers created earlier.
std::shared_ptr<Logger> make_component_logger(const std::string& component);

namespace detail {
void write_unowned(LogStream stream, spdlog::level::level_enum level, const std::string& message);
} // namespace detail

// For code that may run without a logger of its own.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogStream stream,
                   spdlog::level::level_enum level,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  if(logger) {
    logger->emit(stream, level, fmt, std::forward<Args>(args)...);
  } else {
    detail::write_unowned(stream, level, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::Diagnostic, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::Diagnostic, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::Diagnostic, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
}
