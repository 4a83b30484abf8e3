#include "transfer/file_receiver.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <vector>

namespace codedrop {
namespace transfer {

const char* receive_outcome_to_string(ReceiveOutcome outcome) {
  switch (outcome) {
    case ReceiveOutcome::COMPLETED: return "COMPLETED";
    case ReceiveOutcome::REJECTED: return "REJECTED";
    case ReceiveOutcome::CANCELED: return "CANCELED";
    case ReceiveOutcome::FAILED: return "FAILED";
    case ReceiveOutcome::ABORTED: return "ABORTED";
    default: return "UNKNOWN";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileReceiver::FileReceiver(CodeAuthority& code_authority, ConfirmationPrompt& prompt,
                           ProgressSink& progress_sink, ErrorSink& error_sink,
                           const std::atomic<bool>& stop_requested)
  : code_authority_(code_authority)
  , prompt_(prompt)
  , progress_sink_(progress_sink)
  , error_sink_(error_sink)
  , stop_requested_(stop_requested) {
  BOOST_LOG_TRIVIAL(debug) << "File receiver: Initialized";
}


//==============================================
// SESSION PROCESSING
//==============================================

ReceiveOutcome FileReceiver::receive(std::istream& input) {
  FileHeader header;
  try {
    header = ProtocolFramer::read_file_header(input);
  } catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Invalid file header: " << e.what();
    error_sink_.report(e);
    return ReceiveOutcome::FAILED;
  }
  return receive(input, header);
}

ReceiveOutcome FileReceiver::receive(std::istream& input, const FileHeader& header) {
  BOOST_LOG_TRIVIAL(info) << "File receiver: Incoming file " << header.filename
                          << " (" << header.size << " bytes)";

  std::future<ConfirmationDecision> pending = prompt_.ask(header);
  std::optional<ConfirmationDecision> decision = await_decision(pending);
  if (!decision) {
    BOOST_LOG_TRIVIAL(info) << "File receiver: Listener stopping, abandoning " << header.filename;
    return ReceiveOutcome::ABORTED;
  }

  if (!decision->accept || !decision->destination) {
    BOOST_LOG_TRIVIAL(info) << "File receiver: Transfer of " << header.filename << " rejected";
    return ReceiveOutcome::REJECTED;
  }

  const std::filesystem::path destination = *decision->destination;
  std::ofstream output(destination, std::ios::binary | std::ios::trunc);
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Failed to open destination " << destination.string();
    error_sink_.report(IOError("Failed to open " + destination.string() + " for writing"));
    return ReceiveOutcome::FAILED;
  }

  BOOST_LOG_TRIVIAL(info) << "File receiver: Starting to write file to " << destination.string();
  const auto start_time = std::chrono::steady_clock::now();
  bool canceled = false;
  std::uint64_t bytes_written = 0;

  try {
    // The copy runs on its own worker, the session waits for it before the listener moves on
    auto copy_task = std::async(std::launch::async, [this, &input, &output, &header, &canceled]() {
      return copy_payload(input, output, header, canceled);
    });
    bytes_written = copy_task.get();
  } catch (const TransferError& e) {
    if (stop_requested_) {
      BOOST_LOG_TRIVIAL(info) << "File receiver: Copy interrupted by shutdown: " << e.what();
      return ReceiveOutcome::ABORTED;
    }
    BOOST_LOG_TRIVIAL(error) << "File receiver: Copy failed: " << e.what();
    error_sink_.report(e);
    return ReceiveOutcome::FAILED;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Copy failed: " << e.what();
    error_sink_.report(IOError(e.what()));
    return ReceiveOutcome::FAILED;
  }

  output.close();
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "File receiver: Failed to close " << destination.string();
    error_sink_.report(IOError("Failed to close " + destination.string()));
    return ReceiveOutcome::FAILED;
  }

  if (canceled) {
    // Partial file stays on disk and the code stays valid
    BOOST_LOG_TRIVIAL(info) << "File receiver: Transfer canceled after " << bytes_written
                            << " of " << header.size << " bytes";
    if (stop_requested_) {
      return ReceiveOutcome::ABORTED;
    }
    progress_sink_.canceled(destination, bytes_written);
    return ReceiveOutcome::CANCELED;
  }

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
  BOOST_LOG_TRIVIAL(info) << "File receiver: Written " << bytes_written << " bytes to "
                          << destination.string() << " in " << elapsed.count() << " seconds";

  code_authority_.rotate();
  progress_sink_.completed(destination, elapsed);
  return ReceiveOutcome::COMPLETED;
}


//==============================================
// CONFIRMATION
//==============================================

std::optional<ConfirmationDecision> FileReceiver::await_decision(std::future<ConfirmationDecision>& pending) {
  if (!pending.valid()) {
    BOOST_LOG_TRIVIAL(warning) << "File receiver: Prompt returned no pending decision";
    return ConfirmationDecision{};
  }

  while (pending.wait_for(DECISION_POLL_INTERVAL) != std::future_status::ready) {
    if (stop_requested_) {
      return std::nullopt;
    }
  }

  try {
    return pending.get();
  } catch (const std::exception& e) {
    // A prompt that went away without answering counts as a rejection
    BOOST_LOG_TRIVIAL(warning) << "File receiver: Confirmation failed: " << e.what();
    return ConfirmationDecision{};
  }
}


//==============================================
// PAYLOAD COPY
//==============================================

std::uint64_t FileReceiver::copy_payload(std::istream& input, std::ofstream& output,
                                         const FileHeader& header, bool& canceled) {
  std::vector<char> buffer(ProtocolFramer::CHUNK_SIZE);
  ProgressState progress{0, header.size};

  while (progress.bytes_written < progress.total_size) {
    if (stop_requested_ || progress_sink_.cancel_requested()) {
      canceled = true;
      break;
    }

    std::uint64_t remaining = progress.total_size - progress.bytes_written;
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<std::uint64_t>(ProtocolFramer::CHUNK_SIZE, remaining));

    // Blocks until the whole chunk arrived or the peer closed the connection
    input.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
    std::size_t bytes_read = static_cast<std::size_t>(input.gcount());

    if (bytes_read > 0) {
      output.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
      if (!output) {
        throw IOError("Failed to write to destination file");
      }
      progress.bytes_written += bytes_read;
      progress_sink_.update(progress.bytes_written, progress.total_size);
      BOOST_LOG_TRIVIAL(trace) << "File receiver: Written " << progress.bytes_written
                               << " / " << progress.total_size;
    }

    if (bytes_read < chunk_size) {
      ProtocolFramer::check_transport(input, "file payload");
      throw IOError("Connection closed after " + std::to_string(progress.bytes_written) +
                    " of " + std::to_string(progress.total_size) + " bytes");
    }
  }

  output.flush();
  if (!output) {
    throw IOError("Failed to flush destination file");
  }
  return progress.bytes_written;
}

} // namespace transfer
} // namespace codedrop
