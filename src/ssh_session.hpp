#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "transfer_types.hpp"

// One authenticated SSH connection. Used for liveness checks and short
// preflight commands; bulk data goes through rsync's own ssh transport.
class SshSession {
public:
  virtual ~SshSession() = default;

  // Sends a keepalive and reports whether the peer is still reachable.
  virtual bool is_alive() = 0;

  // Runs a command on the remote shell. Returns the exit status, or -1 with
  // err set when the channel could not be used.
  virtual int exec(const std::string& command, std::string& output, std::string& err) = 0;

  virtual void close() = 0;
};

class SshSessionFactory {
public:
  virtual ~SshSessionFactory() = default;

  // nullptr with err set on connect, handshake or auth failure.
  virtual std::unique_ptr<SshSession> open(const SshTarget& target,
                                           std::chrono::milliseconds timeout,
                                           std::string& err) = 0;
};
