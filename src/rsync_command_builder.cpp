#include "rsync_command_builder.hpp"

#include <algorithm>
#include <regex>

#include "utils.hpp"

namespace {

bool unsafe_pattern(const std::string& value) {
  return value.empty() || value.find('\n') != std::string::npos || value.find('\0') != std::string::npos;
}

bool valid_ssh_option(const std::string& value) {
  // KEY=VALUE with no whitespace, so rsync's splitting of -e keeps it intact.
  static const std::regex re(R"(^[A-Za-z][A-Za-z0-9]*=[^\s'"]+$)");
  return std::regex_match(value, re);
}

} // namespace

RsyncInvocation RsyncCommandBuilder::from_transfer(const Transfer& transfer,
                                                   const std::string& rsync_binary,
                                                   int connect_timeout_seconds) {
  RsyncInvocation inv;
  inv.rsync_binary = rsync_binary.empty() ? "rsync" : rsync_binary;
  inv.type = transfer.type;
  if(is_pull(transfer.type)) {
    inv.remote_path = transfer.source;
    inv.local_path = transfer.destination;
  } else {
    inv.local_path = transfer.source;
    inv.remote_path = transfer.destination;
  }
  inv.ssh = transfer.ssh;
  inv.options = transfer.rsync;
  if(transfer.type == TransferType::Sync) inv.options.update_only = true;
  inv.connect_timeout_seconds = connect_timeout_seconds;
  return inv;
}

std::vector<std::string> RsyncCommandBuilder::validate(const RsyncInvocation& inv) {
  std::vector<std::string> errors;
  if(inv.rsync_binary.empty()) errors.push_back("rsync binary is not set");
  if(inv.local_path.empty()) errors.push_back("local path is empty");
  if(inv.remote_path.empty()) errors.push_back("remote path is empty");
  if(!inv.local_path.empty() && inv.local_path.front() == '-') {
    errors.push_back("local path may not start with '-'");
  }
  if(inv.ssh.host.empty()) errors.push_back("ssh host is empty");
  if(inv.ssh.user.empty()) errors.push_back("ssh user is empty");
  if(inv.ssh.port < 1 || inv.ssh.port > 65535) errors.push_back("ssh port out of range");
  if(inv.options.bandwidth_limit_kbps < 0) errors.push_back("bwlimit cannot be negative");
  if(inv.options.io_timeout_seconds < 0) errors.push_back("timeout cannot be negative");
  if(inv.options.max_size != 0 && inv.options.min_size > inv.options.max_size) {
    errors.push_back("min size exceeds max size");
  }
  for(const auto& p : inv.options.excludes) {
    if(unsafe_pattern(p)) errors.push_back("invalid exclude pattern");
  }
  for(const auto& p : inv.options.includes) {
    if(unsafe_pattern(p)) errors.push_back("invalid include pattern");
  }
  for(const auto& o : inv.options.extra_ssh_options) {
    if(!valid_ssh_option(o)) errors.push_back("invalid ssh option '" + o + "'");
  }
  return errors;
}

std::string RsyncCommandBuilder::ssh_command(const SshTarget& ssh,
                                             const RsyncOptions& options,
                                             int connect_timeout_seconds) {
  std::string cmd = "ssh -p " + std::to_string(ssh.port);
  if(!ssh.private_key_path.empty()) {
    cmd += " -i " + shell_quote(ssh.private_key_path);
  }
  cmd += " -o BatchMode=yes";
  cmd += " -o ConnectTimeout=" + std::to_string(std::max(1, connect_timeout_seconds));
  cmd += " -o ServerAliveInterval=60 -o ServerAliveCountMax=3";
  for(const auto& o : options.extra_ssh_options) {
    cmd += " -o " + o;
  }
  return cmd;
}

std::string RsyncCommandBuilder::remote_spec(const SshTarget& ssh, const std::string& path) {
  std::string host = ssh.host;
  if(host.find(':') != std::string::npos && host.front() != '[') {
    host = "[" + host + "]";
  }
  return ssh.user + "@" + host + ":" + shell_quote(path);
}

std::vector<std::string> RsyncCommandBuilder::build(const RsyncInvocation& inv) {
  auto errors = validate(inv);
  if(!errors.empty()) {
    std::string message = "invalid rsync invocation:";
    for(const auto& e : errors) message += " " + e + ";";
    throw ValidationError(message);
  }

  const auto& o = inv.options;
  std::vector<std::string> argv{inv.rsync_binary};
  if(o.archive) argv.push_back("-a");
  else argv.push_back("-rt");
  argv.push_back("-v");
  if(o.compress) argv.push_back("-z");
  if(o.partial) argv.push_back("--partial");
  argv.push_back("--progress");
  if(o.itemize) argv.push_back("--itemize-changes");
  argv.push_back("--stats");
  // Remote paths are shell-quoted here; newer rsync would quote them a second time.
  argv.push_back("--old-args");
  if(o.delete_extraneous) argv.push_back("--delete");
  if(o.checksum) argv.push_back("--checksum");
  if(o.dry_run) argv.push_back("--dry-run");
  if(o.inplace) argv.push_back("--inplace");
  if(o.mkpath) argv.push_back("--mkpath");
  if(o.update_only) argv.push_back("--update");
  if(o.bandwidth_limit_kbps > 0) argv.push_back("--bwlimit=" + std::to_string(o.bandwidth_limit_kbps));
  if(o.io_timeout_seconds > 0) argv.push_back("--timeout=" + std::to_string(o.io_timeout_seconds));
  if(o.max_size > 0) argv.push_back("--max-size=" + std::to_string(o.max_size));
  if(o.min_size > 0) argv.push_back("--min-size=" + std::to_string(o.min_size));
  // Includes precede excludes so they take effect.
  for(const auto& p : o.includes) argv.push_back("--include=" + p);
  for(const auto& p : o.excludes) argv.push_back("--exclude=" + p);

  argv.push_back("-e");
  argv.push_back(ssh_command(inv.ssh, o, inv.connect_timeout_seconds));

  if(is_pull(inv.type)) {
    argv.push_back(remote_spec(inv.ssh, inv.remote_path));
    argv.push_back(inv.local_path);
  } else {
    argv.push_back(inv.local_path);
    argv.push_back(remote_spec(inv.ssh, inv.remote_path));
  }
  return argv;
}

std::vector<std::string> RsyncCommandBuilder::redact(const std::vector<std::string>& argv) {
  static const std::regex key_re(R"(-i ('[^']*(?:'\\''[^']*)*'|\S+))");
  std::vector<std::string> out;
  out.reserve(argv.size());
  for(const auto& arg : argv) {
    out.push_back(std::regex_replace(arg, key_re, "-i <key>"));
  }
  return out;
}

std::string RsyncCommandBuilder::join_for_log(const std::vector<std::string>& argv) {
  std::string out;
  for(const auto& arg : redact(argv)) {
    if(!out.empty()) out.push_back(' ');
    if(arg.find_first_of(" \t'\"") != std::string::npos) out += shell_quote(arg);
    else out += arg;
  }
  return out;
}
