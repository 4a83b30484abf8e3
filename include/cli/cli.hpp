#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "cli/console_bridge.hpp"
#include "transfer/transfer_engine.hpp"

namespace codedrop {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(transfer::TransferEngine& engine, ConsoleBridge& bridge, std::filesystem::path download_dir,
      std::istream& input = std::cin, std::ostream& output = std::cout);
  ~CLI();


  // ---- STARTUP ----
  // Reads commands until quit or end of input, pumping engine events on a second thread
  void run();


  // ---- COMMAND PROCESSING ----
  // Returns false once the user asked to quit
  bool process_command(const std::string& line);
  // Handles every queued engine event on the calling thread
  void drain_events();

private:
  // ---- PARAMETERS ----
  std::atomic<bool> running_{false};
  // System components
  transfer::TransferEngine& engine_;
  ConsoleBridge& bridge_;
  const std::filesystem::path download_dir_;
  std::istream& input_;
  std::ostream& output_;

  std::mutex output_mutex_;
  std::thread event_thread_;
  transfer::CodeAuthority::SubscriptionId code_subscription_{0};

  // Offer awaiting accept/reject
  std::mutex offer_mutex_;
  std::optional<transfer::FileHeader> pending_offer_;
  int last_progress_percent_{-1};

  struct PendingSend {
    std::string description;
    std::future<bool> result;
  };
  std::vector<PendingSend> pending_sends_;


  // ---- COMMAND PROCESSING ----
  void handle_code_command();
  void handle_send_text_command(std::istringstream& args);
  void handle_send_file_command(std::istringstream& args);
  void handle_accept_command(std::istringstream& args);
  void handle_reject_command();
  void handle_cancel_command();
  void handle_help_command();
  // Prints results of finished sends, waits for all of them if wait is set
  void collect_sends(bool wait);


  // ---- EVENT PROCESSING ----
  void pump_events();
  void handle_event(const EngineEvent& event);
  std::filesystem::path default_destination(const transfer::FileHeader& header) const;
  void print(const std::string& message);
};

} // namespace cli
} // namespace codedrop
