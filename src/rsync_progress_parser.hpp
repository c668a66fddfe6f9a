#pragma once

#include <cstdint>
#include <optional>
#include <string>

// One `--progress` sample, e.g.
//   "  1,234,567  78%   12.34MB/s    0:00:05 (xfr#3, to-chk=4/10)"
struct RsyncProgress {
  std::uint64_t bytes = 0;
  double percent = 0.0;
  std::string speed;
  std::string eta;
  std::optional<int> transfer_number;
  std::optional<int> files_remaining;
  std::optional<int> files_total;
  std::string current_file;

  // Whole-run estimate when rsync reports the to-check counter, otherwise the
  // current file's percentage.
  double overall_percent() const;
};

struct RsyncStats {
  std::uint64_t files_total = 0;
  std::uint64_t files_transferred = 0;
  std::uint64_t total_size = 0;
  std::uint64_t transferred_size = 0;
  std::uint64_t literal_data = 0;
  std::uint64_t matched_data = 0;
  std::uint64_t bytes_sent = 0;
  std::uint64_t bytes_received = 0;
  double bytes_per_second = 0.0;
  bool seen = false;
};

// Line-at-a-time parser for rsync's --progress/--itemize-changes/--stats
// output. Holds no resources; one instance per running transfer.
class RsyncProgressParser {
public:
  std::optional<RsyncProgress> parse_line(const std::string& line);
  bool parse_stats_line(const std::string& line);

  const RsyncStats& stats() const { return stats_; }
  const std::string& current_file() const { return current_file_; }
  std::optional<int> files_to_consider() const { return files_to_consider_; }
  void reset();

private:
  RsyncStats stats_;
  std::string current_file_;
  std::optional<int> files_to_consider_;
  std::optional<int> files_total_;
  std::optional<int> files_remaining_;
};
