#include "event_broadcaster.hpp"
#include "log.hpp"
#include <algorithm>
#include <istream>

using json = nlohmann::json;

std::shared_ptr<EventSubscriber> EventSubscriber::create(asio::ip::tcp::socket sock,
                                                         std::weak_ptr<EventBroadcaster> owner)
{
    auto s = std::shared_ptr<EventSubscriber>(new EventSubscriber(std::move(sock), std::move(owner)));
    s->start();
    return s;
}

EventSubscriber::EventSubscriber(asio::ip::tcp::socket sock, std::weak_ptr<EventBroadcaster> owner)
: socket_(std::move(sock)), owner_(std::move(owner))
{
}

EventSubscriber::~EventSubscriber(){
    std::error_code ec;
    socket_.close(ec);
}

void EventSubscriber::start(){
    async_send_line(json{{"event", "hello"}, {"subscribe", "send {\"subscribe\": \"<jobId>|*\"}"}}.dump() + "\n");
    do_read();
}

bool EventSubscriber::wants(const std::string& job_id) const {
    return rooms_.count("*") > 0 || rooms_.count(job_id) > 0;
}

void EventSubscriber::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty()){
                handle_line(line);
            }
            if(open_) do_read();
        });
}

void EventSubscriber::handle_line(const std::string& line){
    auto owner = owner_.lock();
    Logger* logger = owner ? owner->logger() : nullptr;
    try{
        auto j = json::parse(line);
        if(j.contains("subscribe") && j["subscribe"].is_string()){
            rooms_.insert(j["subscribe"].get<std::string>());
            async_send_line(json{{"event", "subscribed"}, {"room", j["subscribe"]}}.dump() + "\n");
        } else if(j.contains("unsubscribe") && j["unsubscribe"].is_string()){
            rooms_.erase(j["unsubscribe"].get<std::string>());
        } else {
            log_debug(logger, "Ignoring subscriber message: {}", line);
        }
    } catch(const json::exception& ex){
        log_warn(logger, "Failed to parse subscriber JSON: {}  raw: {}", ex.what(), line);
    }
}

void EventSubscriber::async_send_line(std::string line){
    if(!open_) return;
    if(write_queue_.size() >= EventBroadcaster::kMaxPendingLines){
        // slow consumer: drop the oldest pending line, never the one in flight
        write_queue_.erase(write_queue_.begin() + 1);
    }
    bool start_write = write_queue_.empty();
    write_queue_.push_back(std::move(line));
    if(start_write){
        do_write();
    }
}

void EventSubscriber::do_write(){
    if(write_queue_.empty() || !open_) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                close();
                return;
            }
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
            }
        });
}

void EventSubscriber::close(){
    if(!open_) return;
    open_ = false;
    write_queue_.clear();
    std::error_code ec;
    socket_.close(ec);
}

EventBroadcaster::EventBroadcaster(asio::io_context& io, std::shared_ptr<Logger> logger)
: io_(io), logger_(std::move(logger))
{
}

EventBroadcaster::~EventBroadcaster(){
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
}

bool EventBroadcaster::listen(const std::string& ip, unsigned short port, std::string& err){
    using tcp = asio::ip::tcp;
    std::error_code ec;
    auto address = asio::ip::make_address(ip, ec);
    if(ec){
        err = "invalid event_listen_ip '" + ip + "': " + ec.message();
        return false;
    }
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(address, port);
    acceptor_->open(endpoint.protocol(), ec);
    if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if(!ec) acceptor_->bind(endpoint, ec);
    if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    if(ec){
        err = "cannot listen on " + ip + ":" + std::to_string(port) + ": " + ec.message();
        acceptor_.reset();
        return false;
    }
    port_ = acceptor_->local_endpoint().port();
    listening_ = true;
    log_info(logger_.get(), "Event stream listening on {}:{}", ip, port_);
    start_accept();
    return true;
}

void EventBroadcaster::start_accept(){
    if(!acceptor_) return;
    auto weak = weak_from_this();
    acceptor_->async_accept(
        [this, weak](std::error_code ec, asio::ip::tcp::socket socket){
            auto self = weak.lock();
            if(!self) return;
            if(ec){
                if(listening_) log_warn(logger_.get(), "Event accept error: {}", ec.message());
            } else {
                std::error_code rec;
                auto remote = socket.remote_endpoint(rec);
                log_info(logger_.get(), "Event subscriber connected from {}",
                         rec ? std::string("?") : remote.address().to_string());
                subscribers_.push_back(EventSubscriber::create(std::move(socket), weak));
                // the strong reference lives in the pending async ops
                subscriber_count_.store(subscribers_.size());
            }
            if(listening_) start_accept();
        });
}

void EventBroadcaster::close(){
    auto self = shared_from_this();
    asio::post(io_, [self](){
        self->listening_ = false;
        std::error_code ec;
        if(self->acceptor_) self->acceptor_->close(ec);
        for(auto& weak : self->subscribers_){
            if(auto sub = weak.lock()) sub->close();
        }
        self->subscribers_.clear();
        self->subscriber_count_.store(0);
    });
}

void EventBroadcaster::publish(const TransferEvent& event){
    auto line = event_to_json(event).dump() + "\n";
    auto self = shared_from_this();
    asio::post(io_, [self, job_id = event.job_id, line = std::move(line)](){
        self->deliver(job_id, line);
    });
}

void EventBroadcaster::deliver(const std::string& job_id, const std::string& line){
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
        [](const std::weak_ptr<EventSubscriber>& weak){
            auto sub = weak.lock();
            return !sub || !sub->is_open();
        }), subscribers_.end());
    subscriber_count_.store(subscribers_.size());
    for(auto& weak : subscribers_){
        auto sub = weak.lock();
        if(sub && sub->wants(job_id)) sub->async_send_line(line);
    }
}
