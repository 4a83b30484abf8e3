#include "cli/console_bridge.hpp"
#include <boost/log/trivial.hpp>

namespace codedrop {
namespace cli {

const char* event_type_to_string(EventType type) {
  switch (type) {
    case EventType::CONFIRMATION_REQUESTED: return "CONFIRMATION_REQUESTED";
    case EventType::PROGRESS: return "PROGRESS";
    case EventType::COMPLETED: return "COMPLETED";
    case EventType::CANCELED: return "CANCELED";
    case EventType::TEXT_RECEIVED: return "TEXT_RECEIVED";
    case EventType::ERROR: return "ERROR";
    case EventType::CODE_CHANGED: return "CODE_CHANGED";
    default: return "UNKNOWN";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConsoleBridge::~ConsoleBridge() {
  close();
}


//==============================================
// ENGINE SIDE
//==============================================

void ConsoleBridge::report(const transfer::TransferError& error) {
  EngineEvent event;
  event.type = EventType::ERROR;
  event.text = error.what();
  event.error_kind = error.kind();
  if (const auto* bind_error = dynamic_cast<const transfer::BindError*>(&error)) {
    event.fatal = bind_error->is_fatal();
  }
  publish(std::move(event));
}

std::future<transfer::ConfirmationDecision> ConsoleBridge::ask(const transfer::FileHeader& header) {
  std::future<transfer::ConfirmationDecision> future;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_) {
      BOOST_LOG_TRIVIAL(warning) << "Console bridge: Replacing an unanswered offer";
      pending_->set_value(transfer::ConfirmationDecision{});
    }
    pending_.emplace();
    future = pending_->get_future();
    cancel_requested_ = false;
  }

  EngineEvent event;
  event.type = EventType::CONFIRMATION_REQUESTED;
  event.header = header;
  event.total_size = header.size;
  publish(std::move(event));
  return future;
}

void ConsoleBridge::update(std::uint64_t bytes_written, std::uint64_t total_size) {
  EngineEvent event;
  event.type = EventType::PROGRESS;
  event.bytes_written = bytes_written;
  event.total_size = total_size;
  publish(std::move(event));
}

bool ConsoleBridge::cancel_requested() {
  return cancel_requested_.load();
}

void ConsoleBridge::completed(const std::filesystem::path& destination, std::chrono::duration<double> elapsed) {
  EngineEvent event;
  event.type = EventType::COMPLETED;
  event.destination = destination;
  event.elapsed_seconds = elapsed.count();
  publish(std::move(event));
}

void ConsoleBridge::canceled(const std::filesystem::path& destination, std::uint64_t bytes_written) {
  EngineEvent event;
  event.type = EventType::CANCELED;
  event.destination = destination;
  event.bytes_written = bytes_written;
  publish(std::move(event));
}

void ConsoleBridge::display(const std::string& text) {
  EngineEvent event;
  event.type = EventType::TEXT_RECEIVED;
  event.text = text;
  publish(std::move(event));
}

void ConsoleBridge::code_changed(const std::string& code) {
  EngineEvent event;
  event.type = EventType::CODE_CHANGED;
  event.text = code;
  publish(std::move(event));
}


//==============================================
// CONSOLE SIDE
//==============================================

bool ConsoleBridge::decide(const transfer::ConfirmationDecision& decision) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  if (!pending_) {
    return false;
  }
  pending_->set_value(decision);
  pending_.reset();
  return true;
}

bool ConsoleBridge::has_pending_confirmation() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.has_value();
}

void ConsoleBridge::request_cancel() {
  BOOST_LOG_TRIVIAL(debug) << "Console bridge: Cancel requested";
  cancel_requested_ = true;
}

void ConsoleBridge::close() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_) {
      pending_->set_value(transfer::ConfirmationDecision{});
      pending_.reset();
    }
  }
  events_.close();
}

void ConsoleBridge::publish(EngineEvent event) {
  const EventType type = event.type;
  if (!events_.produce(std::move(event))) {
    BOOST_LOG_TRIVIAL(debug) << "Console bridge: Dropped " << event_type_to_string(type) << " event after close";
  }
}

} // namespace cli
} // namespace codedrop
