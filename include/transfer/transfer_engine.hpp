#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include "transfer/code_authority.hpp"
#include "transfer/collaborators.hpp"
#include "transfer/connection_listener.hpp"
#include "transfer/engine_config.hpp"
#include "transfer/file_receiver.hpp"
#include "transfer/sender.hpp"
#include "transfer/text_receiver.hpp"
#include "transfer/transfer_dispatcher.hpp"

namespace codedrop {
namespace transfer {

// Collaborators the engine reports to. They must outlive the engine.
struct Collaborators {
  ErrorSink& error_sink;
  ConfirmationPrompt& confirmation_prompt;
  ProgressSink& progress_sink;
  TextSink& text_sink;
};

class TransferEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferEngine(const EngineConfig& config, const Collaborators& collaborators);
  // Starts from a fixed code instead of a random one
  TransferEngine(const EngineConfig& config, const Collaborators& collaborators,
                 const std::string& initial_code);
  ~TransferEngine();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Starts the listener
  bool start();
  // Stops the listener, abandoning any session in progress
  void stop();


  // ---- OUTGOING TRANSFERS ----
  // Run on the calling thread, failures go to the error sink
  bool send_text(const std::string& host, const std::string& code, const std::string& text);
  bool send_file(const std::string& host, const std::string& code, const std::filesystem::path& path,
                 Sender::ProgressCallback on_progress = nullptr);
  // Run on a background worker
  std::future<bool> send_text_async(const std::string& host, const std::string& code, const std::string& text);
  std::future<bool> send_file_async(const std::string& host, const std::string& code,
                                    const std::filesystem::path& path,
                                    Sender::ProgressCallback on_progress = nullptr);


  // ---- GETTERS AND SETTERS ----
  std::string current_code() const { return code_authority_->current_code(); }
  CodeAuthority& code_authority() { return *code_authority_; }
  ConnectionListener& listener() { return *listener_; }
  const EngineConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  EngineConfig config_;
  Collaborators collaborators_;
  std::atomic<bool> stop_requested_{false};

  // System components
  std::unique_ptr<CodeAuthority> code_authority_;
  std::unique_ptr<FileReceiver> file_receiver_;
  std::unique_ptr<TextReceiver> text_receiver_;
  std::unique_ptr<TransferDispatcher> dispatcher_;
  std::unique_ptr<ConnectionListener> listener_;
  std::unique_ptr<Sender> sender_;


  // ---- INITIALIZATION ----
  // Creates all components around an existing code authority
  void create_components();
};

} // namespace transfer
} // namespace codedrop
