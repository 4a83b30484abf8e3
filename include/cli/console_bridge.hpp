#ifndef CODEDROP_CLI_CONSOLE_BRIDGE_HPP
#define CODEDROP_CLI_CONSOLE_BRIDGE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include "transfer/collaborators.hpp"
#include "utils/channel.hpp"

namespace codedrop {
namespace cli {

enum class EventType {
  CONFIRMATION_REQUESTED,
  PROGRESS,
  COMPLETED,
  CANCELED,
  TEXT_RECEIVED,
  ERROR,
  CODE_CHANGED
};

const char* event_type_to_string(EventType type);

// One notification from the engine to the console. Only the fields relevant to the type are set.
struct EngineEvent {
  EventType type{EventType::ERROR};
  // Text payload, error message or new code
  std::string text;
  transfer::FileHeader header;
  std::uint64_t bytes_written{0};
  std::uint64_t total_size{0};
  std::filesystem::path destination;
  double elapsed_seconds{0.0};
  transfer::ErrorKind error_kind{transfer::ErrorKind::IO};
  bool fatal{false};
};

/*
 * Implements every engine collaborator by publishing EngineEvents on a channel.
 * Engine threads never block on the console: confirmations come back through the
 * future returned by ask(), cancellation through an atomic flag.
 */
class ConsoleBridge : public transfer::ErrorSink,
                      public transfer::ConfirmationPrompt,
                      public transfer::ProgressSink,
                      public transfer::TextSink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConsoleBridge() = default;
  ~ConsoleBridge() override;

  ConsoleBridge(const ConsoleBridge&) = delete;
  ConsoleBridge& operator=(const ConsoleBridge&) = delete;


  // ---- ENGINE SIDE ----
  void report(const transfer::TransferError& error) override;
  std::future<transfer::ConfirmationDecision> ask(const transfer::FileHeader& header) override;
  void update(std::uint64_t bytes_written, std::uint64_t total_size) override;
  bool cancel_requested() override;
  void completed(const std::filesystem::path& destination, std::chrono::duration<double> elapsed) override;
  void canceled(const std::filesystem::path& destination, std::uint64_t bytes_written) override;
  void display(const std::string& text) override;
  void code_changed(const std::string& code);


  // ---- CONSOLE SIDE ----
  // Answers the pending offer, returns false if there is none
  bool decide(const transfer::ConfirmationDecision& decision);
  bool has_pending_confirmation() const;
  void request_cancel();
  utils::Channel<EngineEvent>& events() { return events_; }
  // Rejects any pending offer and closes the event channel
  void close();

private:
  // ---- PARAMETERS ----
  utils::Channel<EngineEvent> events_;
  mutable std::mutex pending_mutex_;
  std::optional<std::promise<transfer::ConfirmationDecision>> pending_;
  std::atomic<bool> cancel_requested_{false};


  void publish(EngineEvent event);
};

} // namespace cli
} // namespace codedrop

#endif // CODEDROP_CLI_CONSOLE_BRIDGE_HPP
