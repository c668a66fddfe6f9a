#pragma once

#include <string>
#include <vector>

#include "transfer_types.hpp"

struct RsyncInvocation {
  std::string rsync_binary = "rsync";
  TransferType type = TransferType::Download;
  std::string local_path;
  std::string remote_path;
  SshTarget ssh;
  RsyncOptions options;
  int connect_timeout_seconds = 30;
};

// Builds the argv for one rsync run. No shell is involved locally; the only
// quoting applied is for the remote side, where rsync hands the path to the
// remote shell, and inside the -e transport command that rsync itself splits.
class RsyncCommandBuilder {
public:
  static RsyncInvocation from_transfer(const Transfer& transfer,
                                       const std::string& rsync_binary,
                                       int connect_timeout_seconds);

  // Throws ValidationError listing every problem found.
  static std::vector<std::string> build(const RsyncInvocation& invocation);
  static std::vector<std::string> validate(const RsyncInvocation& invocation);

  static std::string ssh_command(const SshTarget& ssh,
                                 const RsyncOptions& options,
                                 int connect_timeout_seconds);
  static std::string remote_spec(const SshTarget& ssh, const std::string& path);

  // Copy of argv safe for logs: key paths are masked.
  static std::vector<std::string> redact(const std::vector<std::string>& argv);
  static std::string join_for_log(const std::vector<std::string>& argv);
};
