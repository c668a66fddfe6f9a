#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include <readline/readline.h>
#include <readline/history.h>

#include <nlohmann/json.hpp>

#include "concurrency_controller.hpp"
#include "errors.hpp"
#include "job_scheduler.hpp"
#include "ssh_connection_pool.hpp"
#include "state_recovery_service.hpp"
#include "sync_engine.hpp"
#include "transfer_queue.hpp"
#include "utils.hpp"

// Interactive operator commands on top of a running engine.
class OperatorConsole {
public:
  OperatorConsole(SyncEngine& engine, std::function<void()> on_quit)
    : engine_(engine), on_quit_(std::move(on_quit)), running_(true) {}

  ~OperatorConsole() {
    stop();
  }

  void start() {
    console_thread_ = std::thread([this](){ run_loop(); });
  }

  // The input loop polls stdin, so a stop lands within one poll interval.
  void stop() {
    running_ = false;
    if(console_thread_.joinable() && console_thread_.get_id() != std::this_thread::get_id()) {
      console_thread_.join();
    }
  }

  // Returns false for "quit".
  bool execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    std::string args;
    std::getline(iss, args);
    trim(args);

    try {
      if(cmd == "stats") {
        print_stats();
      } else if(cmd == "list" || cmd == "ls") {
        list_transfers(args);
      } else if(cmd == "cancel") {
        cancel_transfer(args);
      } else if(cmd == "scan") {
        engine_.scheduler()->trigger_job_scan(args);
        std::cout << "Scan of " << args << " started\n";
      } else if(cmd == "reset") {
        if(engine_.scheduler()->reset_job(args)) {
          std::cout << "Job " << args << " reset\n";
        } else {
          std::cout << "Unknown job: " << args << "\n";
        }
      } else if(cmd == "jobs") {
        list_jobs();
      } else if(cmd == "pool") {
        print_pool();
      } else if(cmd == "recover") {
        auto report = engine_.recovery()->perform_system_recovery();
        if(report) {
          std::cout << report_to_json(*report).dump(2) << "\n";
        } else {
          std::cout << "Recovery already in progress\n";
        }
      } else if(cmd == "validate") {
        std::cout << report_to_json(engine_.recovery()->validate_state_consistency()).dump(2) << "\n";
      } else if(cmd == "health") {
        std::cout << health_to_json(engine_.scheduler()->health()).dump(2) << "\n";
      } else if(cmd == "help" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        return false;
      } else {
        print_help();
        std::cout << "Unknown command: " << cmd << "\n";
      }
    } catch(const WarpsyncError& e) {
      std::cout << "Error: " << e.prefixed() << "\n";
    }
    return true;
  }

private:
  static constexpr const char* kPrompt = "warpsync> ";

  // readline's callback interface takes a plain function; one console is active at a time.
  static OperatorConsole*& active_console() {
    static OperatorConsole* console = nullptr;
    return console;
  }

  static void on_readline(char* line) {
    OperatorConsole* self = active_console();
    if(!self) {
      free(line);
      return;
    }
    self->handle_line(line);
  }

  void run_loop() {
    active_console() = this;
    rl_callback_handler_install(kPrompt, &OperatorConsole::on_readline);
    while(running_) {
      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      int rc = ::poll(&pfd, 1, 200);
      if(rc < 0) {
        if(errno == EINTR) continue;
        break;
      }
      if(rc == 0) continue;
      rl_callback_read_char();
    }
    rl_callback_handler_remove();
    active_console() = nullptr;
    if(quit_requested_) {
      std::cout << "Quitting...\n";
      if(on_quit_) on_quit_();
    }
  }

  void handle_line(char* line) {
    if(!line) {
      // EOF
      running_ = false;
      quit_requested_ = true;
      return;
    }
    std::string input(line);
    free(line);
    if(!input.empty()) add_history(input.c_str());
    trim(input);
    if(input.empty()) return;
    if(!execute(input)) {
      running_ = false;
      quit_requested_ = true;
    }
  }

  static void trim(std::string& s) {
    auto not_space = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  }

  void print_help() {
    std::cout
      << "Commands:\n"
      << "  stats                 queue, pool and scheduler counters\n"
      << "  list [status]         transfers, optionally filtered by status\n"
      << "  cancel <transferId>   cancel a queued or running transfer\n"
      << "  scan <jobId>          start a scan now\n"
      << "  reset <jobId>         clear a job's error state\n"
      << "  jobs                  scheduled jobs\n"
      << "  pool                  SSH connection pool\n"
      << "  recover               run a recovery pass\n"
      << "  validate              check queue, slots and ledger agree\n"
      << "  health                scheduler health check\n"
      << "  quit                  stop the engine\n";
  }

  void print_stats() {
    const auto stats = engine_.stats();
    nlohmann::json j{
      {"queue", stats_to_json(stats.queue)},
      {"inFlight", stats.in_flight},
      {"runningProcesses", stats.running_processes},
      {"pool", pool_json(stats.pool)},
      {"scheduler", stats_to_json(stats.scheduler)}
    };
    std::cout << j.dump(2) << "\n";
  }

  void list_transfers(const std::string& status) {
    TransferFilter filter;
    if(!status.empty()) filter.statuses.push_back(status_from_string(status));
    const auto transfers = engine_.queue()->get_transfers(filter);
    if(transfers.empty()) {
      std::cout << "No transfers\n";
      return;
    }
    for(const auto& t : transfers) {
      std::cout << t.transfer_id << "  " << to_string(t.status) << "  " << to_string(t.priority)
                << "  " << t.job_id << "/" << t.file_id << "  " << t.progress << "%  "
                << format_bytes(t.size);
      if(!t.error_message.empty()) std::cout << "  " << t.error_message;
      std::cout << "\n";
    }
  }

  void cancel_transfer(const std::string& transfer_id) {
    if(transfer_id.empty()) {
      std::cout << "Usage: cancel <transferId>\n";
      return;
    }
    if(engine_.queue()->cancel(transfer_id)) {
      std::cout << "Cancel requested for " << transfer_id << "\n";
    } else {
      std::cout << "No active transfer " << transfer_id << "\n";
    }
  }

  void list_jobs() {
    nlohmann::json jobs = nlohmann::json::array();
    for(const auto& job : engine_.scheduler()->get_scheduled_jobs()) {
      jobs.push_back(job_to_json(job));
    }
    nlohmann::json running = nlohmann::json::array();
    for(const auto& execution : engine_.scheduler()->get_running_executions()) {
      running.push_back(execution_to_json(execution));
    }
    std::cout << nlohmann::json{{"jobs", jobs}, {"running", running}}.dump(2) << "\n";
  }

  void print_pool() {
    const auto cache = engine_.controller()->get_cache_stats();
    nlohmann::json j = pool_json(engine_.pool()->get_pool_stats());
    j["slots"] = {
      {"activeJobs", cache.active_jobs},
      {"occupied", cache.occupied_slots},
      {"cachedLimits", cache.cached_jobs},
      {"cacheHits", cache.hits},
      {"cacheMisses", cache.misses}
    };
    std::cout << j.dump(2) << "\n";
  }

  static nlohmann::json pool_json(const PoolStats& s) {
    return nlohmann::json{
      {"total", s.total},
      {"inUse", s.in_use},
      {"available", s.available},
      {"targets", s.targets},
      {"created", s.created},
      {"reused", s.reused},
      {"discarded", s.discarded},
      {"evicted", s.evicted}
    };
  }

  SyncEngine& engine_;
  std::function<void()> on_quit_;
  std::atomic<bool> running_;
  bool quit_requested_ = false;
  std::thread console_thread_;
};
