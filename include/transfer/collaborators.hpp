#ifndef CODEDROP_TRANSFER_COLLABORATORS_HPP
#define CODEDROP_TRANSFER_COLLABORATORS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include "transfer/protocol_framer.hpp"
#include "transfer/transfer_error.hpp"

namespace codedrop {
namespace transfer {

// Answer to an incoming file offer
struct ConfirmationDecision {
    bool accept{false};
    std::optional<std::filesystem::path> destination;
};

// Progress of one receive session, reset per session
struct ProgressState {
    std::uint64_t bytes_written{0};
    std::uint64_t total_size{0};
};

// Receives every surfaced failure (everything except code mismatches)
class ErrorSink {
public:
    virtual ~ErrorSink() = default;
    virtual void report(const TransferError& error) = 0;

protected:
    ErrorSink() = default;
};

// Asks the user whether to accept an incoming file. The answer may arrive on any thread.
class ConfirmationPrompt {
public:
    virtual ~ConfirmationPrompt() = default;
    virtual std::future<ConfirmationDecision> ask(const FileHeader& header) = 0;

protected:
    ConfirmationPrompt() = default;
};

// Observes an inbound file copy. Called from the copy worker.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // Published after every chunk
    virtual void update(std::uint64_t bytes_written, std::uint64_t total_size) = 0;
    // Polled between chunks
    virtual bool cancel_requested() = 0;
    virtual void completed(const std::filesystem::path& destination,
                           std::chrono::duration<double> elapsed) = 0;
    virtual void canceled(const std::filesystem::path& destination, std::uint64_t bytes_written) = 0;

protected:
    ProgressSink() = default;
};

class TextSink {
public:
    virtual ~TextSink() = default;
    virtual void display(const std::string& text) = 0;

protected:
    TextSink() = default;
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_COLLABORATORS_HPP
