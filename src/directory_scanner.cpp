#include "directory_scanner.hpp"

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "process_runner.hpp"
#include "utils.hpp"

std::vector<ScanEntry> parse_scan_output(const std::string& text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch(const std::exception& e) {
    throw ValidationError(std::string("scanner output is not JSON: ") + e.what());
  }
  if(!doc.is_array()) {
    throw ValidationError("scanner output must be a JSON array");
  }

  std::vector<ScanEntry> entries;
  entries.reserve(doc.size());
  for(const auto& item : doc) {
    if(!item.is_object() || !item.contains("fileId") || !item.contains("relativePath")) {
      throw ValidationError("scanner entry needs fileId and relativePath: " + item.dump());
    }
    ScanEntry e;
    const auto& id = item.at("fileId");
    e.file_id = id.is_string() ? id.get<std::string>() : id.dump();
    e.relative_path = item.at("relativePath").get<std::string>();
    e.size = item.value("size", std::uint64_t{0});
    e.is_directory = item.value("isDirectory", false);
    e.action = item.value("action", std::string());
    entries.push_back(std::move(e));
  }
  return entries;
}

CommandDirectoryScanner::CommandDirectoryScanner(std::string command,
                                                 std::shared_ptr<ProcessRunner> runner,
                                                 std::shared_ptr<Logger> logger)
  : command_(std::move(command)),
    runner_(std::move(runner)),
    logger_(logger ? std::move(logger) : make_component_logger("scanner")) {}

std::vector<ScanEntry> CommandDirectoryScanner::scan(const JobRecord& job) {
  auto argv = split_whitespace(command_);
  if(argv.empty()) throw ValidationError("no scanner command configured");
  argv.push_back(job.id);
  argv.push_back(job.remote_path);
  argv.push_back(job.local_path);

  std::string output;
  const ProcessResult result = runner_->run(process_key(job.id), argv,
    [&output](const std::string& line, bool from_stderr) {
      if(from_stderr) return;
      output += line;
      output.push_back('\n');
    });
  // A cancel that lands after the process exited must not hit the next scan.
  runner_->clear_cancel(process_key(job.id));

  if(result.cancelled || result.timed_out) {
    throw TimeoutError("scan of " + job.id + " was interrupted");
  }
  if(!result.spawned) {
    throw TransferError("cannot start scanner: " + result.error);
  }
  if(result.exit_code != 0) {
    std::string detail = "scanner exited with code " + std::to_string(result.exit_code);
    if(result.term_signal) detail = "scanner killed by signal " + std::to_string(result.term_signal);
    if(!result.stderr_tail.empty()) detail += ": " + result.stderr_tail;
    throw TransferError(detail);
  }

  auto entries = parse_scan_output(output);
  logger_->debug("Scan of {} returned {} entries", job.id, entries.size());
  return entries;
}

void CommandDirectoryScanner::cancel(const std::string& job_id) {
  runner_->signal_running(process_key(job_id), CancelReason::Operator);
}
