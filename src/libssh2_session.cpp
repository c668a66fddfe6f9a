#include "libssh2_session.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "log.hpp"

namespace {

std::once_flag g_libssh2_init;

void ensure_libssh2() {
    std::call_once(g_libssh2_init, []{ libssh2_init(0); });
}

bool wait_connected(int s, std::chrono::milliseconds timeout, std::string& err) {
    pollfd pfd{};
    pfd.fd = s;
    pfd.events = POLLOUT;
    int rv = 0;
    do {
        rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while(rv < 0 && errno == EINTR);
    if(rv == 0) {
        err = "connect timed out";
        return false;
    }
    if(rv < 0) {
        err = std::string("poll: ") + std::strerror(errno);
        return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if(::getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        err = std::string("connect: ") + std::strerror(so_error ? so_error : errno);
        return false;
    }
    return true;
}

} // namespace

Libssh2Session::~Libssh2Session() {
    close();
}

bool Libssh2Session::tcp_connect(const std::string& host, int port,
                                 std::chrono::milliseconds timeout, std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    const std::string port_str = std::to_string(port);

    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if(gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for(addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if(s == -1) continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));

        // Non-blocking connect so the timeout applies; blocking again afterwards.
        const int flags = ::fcntl(s, F_GETFL);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        bool ok = ::connect(s, rp->ai_addr, rp->ai_addrlen) == 0;
        if(!ok && errno == EINPROGRESS) ok = wait_connected(s, timeout, err);
        else if(!ok) err = std::string("connect: ") + std::strerror(errno);
        if(ok) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    if(err.empty()) err = "cannot connect to " + host + ":" + port_str;
    return false;
}

std::string Libssh2Session::last_error() const {
    if(!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    if(msg && len > 0) return std::string(msg, static_cast<std::size_t>(len));
    return "unknown libssh2 error";
}

bool Libssh2Session::verify_host_key(const SshTarget& target, const std::string& known_hosts, std::string& err) {
    if(known_hosts.empty()) return true;
    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if(!nh) {
        err = "cannot initialise known hosts";
        return false;
    }
    if(libssh2_knownhost_readfile(nh, known_hosts.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(nh);
        err = "cannot read known hosts file " + known_hosts;
        return false;
    }
    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if(!hostkey) {
        libssh2_knownhost_free(nh);
        err = "server sent no host key";
        return false;
    }
    libssh2_knownhost* host = nullptr;
    const int check = libssh2_knownhost_checkp(nh, target.host.c_str(), target.port, hostkey, keylen,
                                               LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                               &host);
    libssh2_knownhost_free(nh);
    if(check == LIBSSH2_KNOWNHOST_CHECK_MATCH) return true;
    err = check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH ? "host key mismatch" : "host key not in known hosts";
    return false;
}

bool Libssh2Session::authenticate(const SshTarget& target, std::string& err) {
    if(!target.private_key_path.empty()) {
        const char* passphrase = target.password.empty() ? nullptr : target.password.c_str();
        if(libssh2_userauth_publickey_fromfile(session_, target.user.c_str(), nullptr,
                                               target.private_key_path.c_str(), passphrase) != 0) {
            err = "public key authentication failed: " + last_error();
            return false;
        }
        return true;
    }
    if(!target.password.empty()) {
        if(libssh2_userauth_password(session_, target.user.c_str(), target.password.c_str()) != 0) {
            err = "password authentication failed: " + last_error();
            return false;
        }
        return true;
    }
    err = "no credential configured";
    return false;
}

bool Libssh2Session::connect(const SshTarget& target,
                             std::chrono::milliseconds timeout,
                             const std::string& known_hosts,
                             std::string& err) {
    ensure_libssh2();
    close();
    if(!tcp_connect(target.host, target.port, timeout, err)) return false;

    session_ = libssh2_session_init();
    if(!session_) {
        err = "libssh2_session_init failed";
        close();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(timeout.count()));
    if(libssh2_session_handshake(session_, sock_) != 0) {
        err = "handshake failed: " + last_error();
        close();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if(!verify_host_key(target, known_hosts, err) || !authenticate(target, err)) {
        close();
        return false;
    }
    return true;
}

bool Libssh2Session::is_alive() {
    if(!session_ || sock_ < 0) return false;
    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;
    if(::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))) return false;
    int next = 0;
    return libssh2_keepalive_send(session_, &next) == 0;
}

int Libssh2Session::exec(const std::string& command, std::string& output, std::string& err) {
    if(!session_) {
        err = "session closed";
        return -1;
    }
    LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(session_);
    if(!channel) {
        err = "cannot open channel: " + last_error();
        return -1;
    }
    if(libssh2_channel_exec(channel, command.c_str()) != 0) {
        err = "exec failed: " + last_error();
        libssh2_channel_free(channel);
        return -1;
    }

    char buf[4096];
    for(;;) {
        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if(n > 0) {
            output.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if(n < 0) err = "read failed: " + last_error();
        break;
    }
    for(;;) {
        ssize_t n = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if(n <= 0) break;
        output.append(buf, static_cast<std::size_t>(n));
    }

    int status = -1;
    if(libssh2_channel_close(channel) == 0) {
        libssh2_channel_wait_closed(channel);
        status = libssh2_channel_get_exit_status(channel);
    } else if(err.empty()) {
        err = "channel close failed: " + last_error();
    }
    libssh2_channel_free(channel);
    return status;
}

void Libssh2Session::close() {
    if(session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if(sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

Libssh2SessionFactory::Libssh2SessionFactory(std::string known_hosts, std::shared_ptr<Logger> logger)
    : known_hosts_(std::move(known_hosts)),
      logger_(logger ? std::move(logger) : make_component_logger("ssh-pool")) {}

std::unique_ptr<SshSession> Libssh2SessionFactory::open(const SshTarget& target,
                                                        std::chrono::milliseconds timeout,
                                                        std::string& err) {
    auto session = std::make_unique<Libssh2Session>();
    if(!session->connect(target, timeout, known_hosts_, err)) {
        log_debug(logger_.get(), "SSH connect to {} failed: {}", target.display(), err);
        return nullptr;
    }
    log_debug(logger_.get(), "SSH session opened to {}", target.display());
    return session;
}
