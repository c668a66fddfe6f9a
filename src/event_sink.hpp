#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

class Logger;

enum class TransferEventKind { Progress, Status, Error, Complete };

std::string to_string(TransferEventKind kind);

struct TransferEvent {
  std::string transfer_id;
  std::string job_id;
  TransferEventKind kind = TransferEventKind::Status;
  nlohmann::json payload;
  TimePoint at;
};

nlohmann::json event_to_json(const TransferEvent& event);

// Fire-and-forget. Implementations must not block and must not call back into
// the transfer state manager.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void publish(const TransferEvent& event) = 0;
};

class LogEventSink : public EventSink {
public:
  explicit LogEventSink(std::shared_ptr<Logger> logger);
  void publish(const TransferEvent& event) override;

private:
  std::shared_ptr<Logger> logger_;
};

class FanoutEventSink : public EventSink {
public:
  void add(std::shared_ptr<EventSink> sink);
  void publish(const TransferEvent& event) override;

private:
  std::mutex mutex_;
  std::vector<std::shared_ptr<EventSink>> sinks_;
};
