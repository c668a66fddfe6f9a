#include "rsync_progress_parser.hpp"

#include <regex>

#include "utils.hpp"

namespace {

const std::regex& progress_re() {
  static const std::regex re(
    R"(^\s*([\d,]+)\s+(\d{1,3})%\s+(\S+/s)\s+(\d+:\d{2}:\d{2}(?::\d{2})?)(?:\s+\((.*)\))?\s*$)");
  return re;
}

const std::regex& xfr_re() {
  static const std::regex re(R"(xfr#(\d+))");
  return re;
}

const std::regex& to_check_re() {
  static const std::regex re(R"((?:to|ir)-chk=(\d+)/(\d+))");
  return re;
}

const std::regex& itemize_re() {
  static const std::regex re(R"(^([<>ch.*][fdLDS][a-zA-Z.+?\s]{7,9})\s(.+)$)");
  return re;
}

const std::regex& consider_re() {
  static const std::regex re(R"(^\s*([\d,]+) files? to consider)");
  return re;
}

const std::regex& sent_re() {
  static const std::regex re(
    R"(^sent ([\d,]+) bytes\s+received ([\d,]+) bytes\s+([\d,.]+) bytes/sec)");
  return re;
}

bool match_number(const std::string& line, const char* prefix, std::uint64_t& out) {
  const std::string p(prefix);
  if(line.compare(0, p.size(), p) != 0) return false;
  auto pos = line.find_first_of("0123456789", p.size());
  if(pos == std::string::npos) return false;
  out = parse_grouped_number(line.substr(pos));
  return true;
}

double parse_decimal(const std::string& text) {
  std::string clean;
  for(char c : text) {
    if(c != ',') clean.push_back(c);
  }
  try {
    return std::stod(clean);
  } catch(const std::exception&) {
    return 0.0;
  }
}

} // namespace

double RsyncProgress::overall_percent() const {
  if(files_total && *files_total > 1 && files_remaining) {
    double done = static_cast<double>(*files_total - *files_remaining);
    return 100.0 * done / static_cast<double>(*files_total);
  }
  return percent;
}

std::optional<RsyncProgress> RsyncProgressParser::parse_line(const std::string& line) {
  if(line.empty()) return std::nullopt;

  std::smatch m;
  if(std::regex_match(line, m, progress_re())) {
    RsyncProgress p;
    p.bytes = parse_grouped_number(m[1].str());
    p.percent = std::stod(m[2].str());
    if(p.percent > 100.0) p.percent = 100.0;
    p.speed = m[3].str();
    p.eta = m[4].str();
    if(m[5].matched) {
      const std::string tail = m[5].str();
      std::smatch sub;
      if(std::regex_search(tail, sub, xfr_re())) {
        p.transfer_number = std::stoi(sub[1].str());
      }
      if(std::regex_search(tail, sub, to_check_re())) {
        files_remaining_ = std::stoi(sub[1].str());
        files_total_ = std::stoi(sub[2].str());
      }
    }
    p.files_remaining = files_remaining_;
    p.files_total = files_total_;
    p.current_file = current_file_;
    return p;
  }

  if(std::regex_search(line, m, consider_re())) {
    files_to_consider_ = static_cast<int>(parse_grouped_number(m[1].str()));
    return std::nullopt;
  }

  if(parse_stats_line(line)) return std::nullopt;

  if(std::regex_match(line, m, itemize_re())) {
    current_file_ = m[2].str();
    return std::nullopt;
  }

  // Plain file names from -v without itemize.
  static const char* kNoise[] = {"sending ", "receiving ", "building ", "total size ", "created directory ",
                                 "delta-transmission ", "done"};
  for(const char* prefix : kNoise) {
    if(line.rfind(prefix, 0) == 0) return std::nullopt;
  }
  if(line.find(": ") == std::string::npos && line.find(" bytes") == std::string::npos &&
     line.back() != '/') {
    current_file_ = line;
  }
  return std::nullopt;
}

bool RsyncProgressParser::parse_stats_line(const std::string& line) {
  std::uint64_t value = 0;
  if(match_number(line, "Number of files:", value)) {
    stats_.files_total = value;
  } else if(match_number(line, "Number of regular files transferred:", value) ||
            match_number(line, "Number of files transferred:", value)) {
    stats_.files_transferred = value;
  } else if(match_number(line, "Total file size:", value)) {
    stats_.total_size = value;
  } else if(match_number(line, "Total transferred file size:", value)) {
    stats_.transferred_size = value;
  } else if(match_number(line, "Literal data:", value)) {
    stats_.literal_data = value;
  } else if(match_number(line, "Matched data:", value)) {
    stats_.matched_data = value;
  } else {
    std::smatch m;
    if(!std::regex_search(line, m, sent_re())) return false;
    stats_.bytes_sent = parse_grouped_number(m[1].str());
    stats_.bytes_received = parse_grouped_number(m[2].str());
    stats_.bytes_per_second = parse_decimal(m[3].str());
  }
  stats_.seen = true;
  return true;
}

void RsyncProgressParser::reset() {
  stats_ = RsyncStats{};
  current_file_.clear();
  files_to_consider_.reset();
  files_total_.reset();
  files_remaining_.reset();
}
