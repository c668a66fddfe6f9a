#include "event_sink.hpp"

#include "log.hpp"

std::string to_string(TransferEventKind kind) {
  switch(kind) {
    case TransferEventKind::Progress: return "progress";
    case TransferEventKind::Status: return "status";
    case TransferEventKind::Error: return "error";
    case TransferEventKind::Complete: return "complete";
  }
  return "status";
}

nlohmann::json event_to_json(const TransferEvent& event) {
  return nlohmann::json{
    {"transferId", event.transfer_id},
    {"jobId", event.job_id},
    {"event", to_string(event.kind)},
    {"payload", event.payload},
    {"timestamp", format_timestamp(event.at)}
  };
}

LogEventSink::LogEventSink(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

void LogEventSink::publish(const TransferEvent& event) {
  if(event.kind == TransferEventKind::Progress) {
    log_debug(logger_.get(), "{} {} {}", event.transfer_id, to_string(event.kind), event.payload.dump());
    return;
  }
  if(event.kind == TransferEventKind::Error) {
    log_warn(logger_.get(), "{} {} {}", event.transfer_id, to_string(event.kind), event.payload.dump());
    return;
  }
  log_info(logger_.get(), "{} {} {}", event.transfer_id, to_string(event.kind), event.payload.dump());
}

void FanoutEventSink::add(std::shared_ptr<EventSink> sink) {
  if(!sink) return;
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void FanoutEventSink::publish(const TransferEvent& event) {
  std::vector<std::shared_ptr<EventSink>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = sinks_;
  }
  for(auto& sink : snapshot) {
    sink->publish(event);
  }
}
