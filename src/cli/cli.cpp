#include "cli/cli.hpp"
#include <chrono>
#include <cstdio>
#include <boost/log/trivial.hpp>
#include "utils/byte_format.hpp"

namespace codedrop {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(transfer::TransferEngine& engine, ConsoleBridge& bridge, std::filesystem::path download_dir,
         std::istream& input, std::ostream& output)
  : engine_(engine)
  , bridge_(bridge)
  , download_dir_(std::move(download_dir))
  , input_(input)
  , output_(output) {
  code_subscription_ = engine_.code_authority().subscribe([this](const std::string& code) {
    bridge_.code_changed(code);
  });
  BOOST_LOG_TRIVIAL(info) << "CLI initialized, downloads go to " << download_dir_.string();
}

CLI::~CLI() {
  running_ = false;
  if (event_thread_.joinable()) {
    event_thread_.join();
  }
  engine_.code_authority().unsubscribe(code_subscription_);
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  event_thread_ = std::thread([this]() { pump_events(); });

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  print("Your code: " + engine_.current_code() + " (type 'help' for commands)");

  std::string line;
  {
    std::lock_guard<std::mutex> lock(output_mutex_);
    output_ << "codedrop> " << std::flush;
  }
  while (running_ && std::getline(input_, line)) {
    if (!process_command(line)) {
      break;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    output_ << "codedrop> " << std::flush;
  }

  collect_sends(true);
  running_ = false;
  if (event_thread_.joinable()) {
    event_thread_.join();
  }
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::process_command(const std::string& line) {
  std::istringstream args(line);
  std::string command;
  args >> command;
  if (command.empty()) {
    collect_sends(false);
    return true;
  }

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command;

  if (command == "quit") {
    return false;
  }
  else if (command == "code") {
    handle_code_command();
  }
  else if (command == "send-text") {
    handle_send_text_command(args);
  }
  else if (command == "send-file") {
    handle_send_file_command(args);
  }
  else if (command == "accept") {
    handle_accept_command(args);
  }
  else if (command == "reject") {
    handle_reject_command();
  }
  else if (command == "cancel") {
    handle_cancel_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    print("Unknown command: " + command + " (type 'help' for commands)");
  }

  collect_sends(false);
  return true;
}

void CLI::handle_code_command() {
  print("Your code: " + engine_.current_code());
}

void CLI::handle_send_text_command(std::istringstream& args) {
  std::string host, code;
  if (!(args >> host >> code)) {
    print("Usage: send-text <host> <code> <text...>");
    return;
  }
  std::string text;
  std::getline(args >> std::ws, text);
  if (text.empty()) {
    print("Usage: send-text <host> <code> <text...>");
    return;
  }
  if (!transfer::CodeAuthority::is_valid_code(code)) {
    print("The code must be exactly 6 digits");
    return;
  }

  pending_sends_.push_back({"Text to " + host, engine_.send_text_async(host, code, text)});
}

void CLI::handle_send_file_command(std::istringstream& args) {
  std::string host, code;
  if (!(args >> host >> code)) {
    print("Usage: send-file <host> <code> <path>");
    return;
  }
  std::string path;
  std::getline(args >> std::ws, path);
  if (path.empty()) {
    print("Usage: send-file <host> <code> <path>");
    return;
  }
  if (!transfer::CodeAuthority::is_valid_code(code)) {
    print("The code must be exactly 6 digits");
    return;
  }

  std::filesystem::path file_path(path);
  pending_sends_.push_back({file_path.filename().string() + " to " + host,
                            engine_.send_file_async(host, code, file_path)});
}

void CLI::handle_accept_command(std::istringstream& args) {
  std::optional<transfer::FileHeader> offer;
  {
    std::lock_guard<std::mutex> lock(offer_mutex_);
    offer = pending_offer_;
  }
  if (!offer) {
    print("No file offer is waiting");
    return;
  }

  std::string path;
  std::getline(args >> std::ws, path);
  std::filesystem::path destination = path.empty() ? default_destination(*offer) : std::filesystem::path(path);
  std::error_code ec;
  if (std::filesystem::is_directory(destination, ec)) {
    destination /= transfer::ProtocolFramer::sanitize_filename(offer->filename);
  }

  if (!bridge_.decide(transfer::ConfirmationDecision{true, destination})) {
    print("The file offer is no longer pending");
  } else {
    print("Receiving into " + destination.string());
  }

  std::lock_guard<std::mutex> lock(offer_mutex_);
  pending_offer_.reset();
  last_progress_percent_ = -1;
}

void CLI::handle_reject_command() {
  if (!bridge_.decide(transfer::ConfirmationDecision{false, std::nullopt})) {
    print("No file offer is waiting");
  } else {
    print("File offer rejected");
  }
  std::lock_guard<std::mutex> lock(offer_mutex_);
  pending_offer_.reset();
}

void CLI::handle_cancel_command() {
  bridge_.request_cancel();
  print("Canceling the current transfer");
}

void CLI::handle_help_command() {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_ << "Available commands:" << std::endl;
  output_ << "  code                            Show the code peers need to reach you" << std::endl;
  output_ << "  send-text <host> <code> <text>  Send a text message" << std::endl;
  output_ << "  send-file <host> <code> <path>  Send a file" << std::endl;
  output_ << "  accept [path]                   Accept the pending file offer" << std::endl;
  output_ << "  reject                          Reject the pending file offer" << std::endl;
  output_ << "  cancel                          Stop the file being received" << std::endl;
  output_ << "  help                            Display this help message" << std::endl;
  output_ << "  quit                            Exit" << std::endl << std::endl;
}

void CLI::collect_sends(bool wait) {
  for (auto it = pending_sends_.begin(); it != pending_sends_.end();) {
    if (!wait && it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    // Failures have already been printed through the error sink
    if (it->result.get()) {
      print("Sent " + it->description);
    }
    it = pending_sends_.erase(it);
  }
}


//==============================================
// EVENT PROCESSING
//==============================================

void CLI::pump_events() {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Event pump started";
  EngineEvent event;
  while (running_) {
    if (bridge_.events().consume_for(event, std::chrono::milliseconds(100))) {
      handle_event(event);
    } else if (bridge_.events().is_closed()) {
      break;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "CLI: Event pump stopped";
}

void CLI::drain_events() {
  EngineEvent event;
  while (bridge_.events().consume(event)) {
    handle_event(event);
  }
}

void CLI::handle_event(const EngineEvent& event) {
  switch (event.type) {
    case EventType::CONFIRMATION_REQUESTED: {
      {
        std::lock_guard<std::mutex> lock(offer_mutex_);
        pending_offer_ = event.header;
      }
      print("Incoming file '" + event.header.filename + "' (" +
            utils::format_byte_count(event.header.size) + "). Type 'accept [path]' or 'reject'."
            " Default location: " + default_destination(event.header).string());
      break;
    }
    case EventType::PROGRESS: {
      if (event.total_size == 0) {
        break;
      }
      int percent = static_cast<int>(event.bytes_written * 100 / event.total_size);
      std::lock_guard<std::mutex> lock(offer_mutex_);
      if (percent / 10 != last_progress_percent_ / 10 || event.bytes_written == event.total_size) {
        last_progress_percent_ = percent;
        print("Received " + utils::format_byte_count(event.bytes_written) + " of " +
              utils::format_byte_count(event.total_size) + " (" + std::to_string(percent) + "%)");
      }
      break;
    }
    case EventType::COMPLETED: {
      char elapsed[32];
      std::snprintf(elapsed, sizeof(elapsed), "%6.3f", event.elapsed_seconds);
      print("File has been saved to " + event.destination.string() + ".\nTime: " + elapsed + " seconds");
      break;
    }
    case EventType::CANCELED:
      print("Transfer canceled after " + utils::format_byte_count(event.bytes_written) +
            ", partial file kept at " + event.destination.string());
      break;
    case EventType::TEXT_RECEIVED:
      print("Message received:\n" + event.text);
      break;
    case EventType::ERROR:
      if (event.error_kind == transfer::ErrorKind::FILE_NOT_FOUND) {
        print(event.text + "\nChoose another file and run send-file again.");
      } else if (event.fatal) {
        print(event.text + "\nNo longer accepting incoming transfers.");
      } else {
        print(event.text);
      }
      break;
    case EventType::CODE_CHANGED:
      print("Your new code: " + event.text);
      break;
  }
}

std::filesystem::path CLI::default_destination(const transfer::FileHeader& header) const {
  return download_dir_ / transfer::ProtocolFramer::sanitize_filename(header.filename);
}

void CLI::print(const std::string& message) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_ << message << std::endl;
}

} // namespace cli
} // namespace codedrop
