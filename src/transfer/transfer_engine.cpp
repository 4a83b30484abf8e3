#include "transfer/transfer_engine.hpp"
#include <boost/log/trivial.hpp>

namespace codedrop {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(const EngineConfig& config, const Collaborators& collaborators)
  : config_(config)
  , collaborators_(collaborators) {
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Initializing on " << config_.bind_address << ":" << config_.port;
  code_authority_ = std::make_unique<CodeAuthority>();
  create_components();
}

TransferEngine::TransferEngine(const EngineConfig& config, const Collaborators& collaborators,
                               const std::string& initial_code)
  : config_(config)
  , collaborators_(collaborators) {
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Initializing on " << config_.bind_address << ":" << config_.port;
  code_authority_ = std::make_unique<CodeAuthority>(initial_code);
  create_components();
}

void TransferEngine::create_components() {
  try {
    file_receiver_ = std::make_unique<FileReceiver>(*code_authority_, collaborators_.confirmation_prompt,
                                                    collaborators_.progress_sink, collaborators_.error_sink,
                                                    stop_requested_);
    text_receiver_ = std::make_unique<TextReceiver>(*code_authority_, collaborators_.text_sink,
                                                    collaborators_.error_sink, config_.rotate_on_text);
    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Receivers created successfully";

    dispatcher_ = std::make_unique<TransferDispatcher>(*code_authority_, *file_receiver_,
                                                       *text_receiver_, collaborators_.error_sink);

    listener_ = std::make_unique<ConnectionListener>(
      config_.bind_address, config_.port, config_.retry_policy, collaborators_.error_sink,
      [this](boost::asio::ip::tcp::iostream& stream) {
        DispatchResult result = dispatcher_->dispatch(stream);
        BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Session finished: " << dispatch_result_to_string(result);
      });
    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Listener created successfully";

    sender_ = std::make_unique<Sender>(config_.remote_port);

    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Failed to initialize components: " << e.what();
    throw;
  }
}

TransferEngine::~TransferEngine() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TransferEngine::start() {
  stop_requested_ = false;
  if (!listener_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Failed to start listener";
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Started, code=" << current_code();
  return true;
}

void TransferEngine::stop() {
  stop_requested_ = true;
  if (listener_) {
    listener_->shutdown();
  }
}


//==============================================
// OUTGOING TRANSFERS
//==============================================

bool TransferEngine::send_text(const std::string& host, const std::string& code, const std::string& text) {
  try {
    sender_->send_text(host, code, text);
    return true;
  }
  catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Failed to send text to " << host << ": " << e.what();
    collaborators_.error_sink.report(e);
    return false;
  }
}

bool TransferEngine::send_file(const std::string& host, const std::string& code,
                               const std::filesystem::path& path, Sender::ProgressCallback on_progress) {
  try {
    sender_->send_file(host, code, path, std::move(on_progress));
    return true;
  }
  catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Failed to send " << path.string() << " to " << host << ": " << e.what();
    collaborators_.error_sink.report(e);
    return false;
  }
}

std::future<bool> TransferEngine::send_text_async(const std::string& host, const std::string& code,
                                                  const std::string& text) {
  return std::async(std::launch::async, [this, host, code, text]() {
    return send_text(host, code, text);
  });
}

std::future<bool> TransferEngine::send_file_async(const std::string& host, const std::string& code,
                                                  const std::filesystem::path& path,
                                                  Sender::ProgressCallback on_progress) {
  return std::async(std::launch::async, [this, host, code, path, on_progress]() {
    return send_file(host, code, path, on_progress);
  });
}

} // namespace transfer
} // namespace codedrop
