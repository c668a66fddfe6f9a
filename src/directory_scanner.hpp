#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "job_catalog.hpp"

class Logger;
class ProcessRunner;

struct ScanEntry {
  std::string file_id;
  std::string relative_path;
  std::uint64_t size = 0;
  bool is_directory = false;
  // download | upload | sync | skip; empty follows the job direction
  std::string action;
};

std::vector<ScanEntry> parse_scan_output(const std::string& text);

// Produces the transfers a job wants. Throws WarpsyncError on failure.
class DirectoryScanner {
public:
  virtual ~DirectoryScanner() = default;
  virtual std::vector<ScanEntry> scan(const JobRecord& job) = 0;
  virtual void cancel(const std::string& job_id) = 0;
};

// Runs `<command> <jobId> <remotePath> <localPath>` and reads a JSON array of
// {fileId, relativePath, size, isDirectory, action} from its stdout.
class CommandDirectoryScanner : public DirectoryScanner {
public:
  CommandDirectoryScanner(std::string command,
                          std::shared_ptr<ProcessRunner> runner,
                          std::shared_ptr<Logger> logger = nullptr);

  std::vector<ScanEntry> scan(const JobRecord& job) override;
  void cancel(const std::string& job_id) override;

  static std::string process_key(const std::string& job_id) { return "scan:" + job_id; }

private:
  std::string command_;
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
};
