#pragma once
#include <libssh2.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "ssh_session.hpp"

class Logger;

// Blocking libssh2 session over a plain TCP socket. Not thread-safe; the pool
// hands a session to one borrower at a time.
class Libssh2Session : public SshSession {
public:
    Libssh2Session() = default;
    ~Libssh2Session() override;

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    bool connect(const SshTarget& target,
                 std::chrono::milliseconds timeout,
                 const std::string& known_hosts,
                 std::string& err);

    bool is_alive() override;
    int exec(const std::string& command, std::string& output, std::string& err) override;
    void close() override;

private:
    bool tcp_connect(const std::string& host, int port, std::chrono::milliseconds timeout, std::string& err);
    bool verify_host_key(const SshTarget& target, const std::string& known_hosts, std::string& err);
    bool authenticate(const SshTarget& target, std::string& err);
    std::string last_error() const;

    int sock_ = -1;
    LIBSSH2_SESSION* session_ = nullptr;
};

class Libssh2SessionFactory : public SshSessionFactory {
public:
    explicit Libssh2SessionFactory(std::string known_hosts = std::string(),
                                   std::shared_ptr<Logger> logger = nullptr);

    std::unique_ptr<SshSession> open(const SshTarget& target,
                                     std::chrono::milliseconds timeout,
                                     std::string& err) override;

private:
    std::string known_hosts_;
    std::shared_ptr<Logger> logger_;
};
