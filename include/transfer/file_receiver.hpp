#ifndef CODEDROP_TRANSFER_FILE_RECEIVER_HPP
#define CODEDROP_TRANSFER_FILE_RECEIVER_HPP

#include <atomic>
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include "transfer/code_authority.hpp"
#include "transfer/collaborators.hpp"
#include "transfer/protocol_framer.hpp"

namespace codedrop {
namespace transfer {

enum class ReceiveOutcome {
    COMPLETED,
    REJECTED,
    CANCELED,
    FAILED,
    ABORTED
};

const char* receive_outcome_to_string(ReceiveOutcome outcome);

class FileReceiver {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileReceiver(CodeAuthority& code_authority, ConfirmationPrompt& prompt,
               ProgressSink& progress_sink, ErrorSink& error_sink,
               const std::atomic<bool>& stop_requested);


  // ---- SESSION PROCESSING ----
  // Reads the file header from the stream, then confirms and copies the payload
  ReceiveOutcome receive(std::istream& input);
  // Confirms and copies a payload whose header was already read
  ReceiveOutcome receive(std::istream& input, const FileHeader& header);

private:
  // ---- PARAMETERS ----
  static constexpr std::chrono::milliseconds DECISION_POLL_INTERVAL{100};

  // System components
  CodeAuthority& code_authority_;
  ConfirmationPrompt& prompt_;
  ProgressSink& progress_sink_;
  ErrorSink& error_sink_;
  const std::atomic<bool>& stop_requested_;


  // ---- CONFIRMATION ----
  // Waits for the prompt's answer, returns nullopt if the listener is stopping
  std::optional<ConfirmationDecision> await_decision(std::future<ConfirmationDecision>& pending);


  // ---- PAYLOAD COPY ----
  // Copies exactly header.size bytes in CHUNK_SIZE pieces, stops early on cancellation.
  // Returns the number of bytes written.
  std::uint64_t copy_payload(std::istream& input, std::ofstream& output,
                             const FileHeader& header, bool& canceled);
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_FILE_RECEIVER_HPP
