#pragma once
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "event_sink.hpp"

class Logger;
class EventBroadcaster;

// One TCP subscriber. Reads JSON lines ({"subscribe": "<jobId>"|"*"},
// {"unsubscribe": ...}) and receives matching events as JSON lines.
class EventSubscriber : public std::enable_shared_from_this<EventSubscriber> {
public:
    static std::shared_ptr<EventSubscriber> create(asio::ip::tcp::socket sock,
                                                   std::weak_ptr<EventBroadcaster> owner);
    ~EventSubscriber();

    void start();
    void async_send_line(std::string line);
    bool wants(const std::string& job_id) const;
    bool is_open() const { return open_; }
    void close();

private:
    EventSubscriber(asio::ip::tcp::socket sock, std::weak_ptr<EventBroadcaster> owner);
    void do_read();
    void handle_line(const std::string& line);
    void do_write();

    asio::ip::tcp::socket socket_;
    std::weak_ptr<EventBroadcaster> owner_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::set<std::string> rooms_;
    bool open_ = true;
};

class EventBroadcaster : public EventSink,
                         public std::enable_shared_from_this<EventBroadcaster> {
public:
    static constexpr std::size_t kMaxPendingLines = 1024;

    EventBroadcaster(asio::io_context& io, std::shared_ptr<Logger> logger);
    ~EventBroadcaster() override;

    bool listen(const std::string& ip, unsigned short port, std::string& err);
    unsigned short port() const { return port_; }
    void close();

    // Thread-safe; delivery happens on the io thread.
    void publish(const TransferEvent& event) override;

    std::size_t subscriber_count() const { return subscriber_count_.load(); }
    Logger* logger() const { return logger_.get(); }

private:
    void start_accept();
    void deliver(const std::string& job_id, const std::string& line);

    asio::io_context& io_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::weak_ptr<EventSubscriber>> subscribers_;
    std::atomic<std::size_t> subscriber_count_{0};
    unsigned short port_ = 0;
    bool listening_ = false;
};
