#include "transfer/connection_listener.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace codedrop {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionListener::ConnectionListener(const std::string& address, uint16_t port,
                                       const RetryPolicy& retry_policy, ErrorSink& error_sink,
                                       SessionHandler session_handler)
  : address_(address)
  , port_(port)
  , retry_policy_(retry_policy)
  , error_sink_(error_sink)
  , session_handler_(std::move(session_handler)) {
  BOOST_LOG_TRIVIAL(info) << "Connection listener: Initializing listener on " << address_ << ":" << port_;
}

ConnectionListener::~ConnectionListener() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool ConnectionListener::start_listener() {
  if (is_running_ || listener_thread_) {
    BOOST_LOG_TRIVIAL(warning) << "Connection listener: Listener already running";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.is_terminal()) {
      state_.reset();
    }
  }

  is_running_ = true;
  listener_thread_ = std::make_unique<std::thread>(&ConnectionListener::listen_loop, this);
  BOOST_LOG_TRIVIAL(info) << "Connection listener: Accept loop started";
  return true;
}

void ConnectionListener::shutdown() {
  if (!listener_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Connection listener: Initiating shutdown";

  {
    std::lock_guard<std::mutex> lock(backoff_mutex_);
    is_running_ = false;
  }
  backoff_cv_.notify_all();

  // Wake a pending accept
  io_context_.stop();

  // Wake a session blocked on a read
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (active_stream_) {
      boost::system::error_code ec;
      active_stream_->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(debug) << "Connection listener: Session socket shutdown: " << ec.message();
      }
    }
  }

  if (listener_thread_->joinable()) {
    listener_thread_->join();
  }
  listener_thread_.reset();

  close_acceptor();
  io_context_.restart();
  set_state(ListenerState::State::STOPPED);

  BOOST_LOG_TRIVIAL(info) << "Connection listener: Shutdown complete";
}


//==============================================
// ACCEPT LOOP
//==============================================

void ConnectionListener::listen_loop() {
  int consecutive_failures = 0;

  while (is_running_) {
    try {
      if (!acceptor_ || !acceptor_->is_open()) {
        open_acceptor();
      }
      set_state(ListenerState::State::LISTENING);

      auto socket = boost::asio::ip::tcp::socket(io_context_);
      if (!accept_one(socket)) {
        set_state(ListenerState::State::IDLE);
        continue;
      }
      consecutive_failures = 0;

      set_state(ListenerState::State::PROCESSING);
      serve(std::move(socket));
      set_state(ListenerState::State::IDLE);
    }
    catch (const TransferError& e) {
      close_acceptor();
      set_state(ListenerState::State::IDLE);
      ++consecutive_failures;

      if (consecutive_failures >= retry_policy_.max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Connection listener: Giving up after " << consecutive_failures
                                 << " consecutive failures: " << e.what();
        error_sink_.report(BindError("Listener on " + address_ + ":" + std::to_string(port_) +
                                     " gave up after " + std::to_string(consecutive_failures) +
                                     " attempts: " + e.what(), true));
        is_running_ = false;
        break;
      }

      BOOST_LOG_TRIVIAL(warning) << "Connection listener: Attempt " << consecutive_failures << " of "
                                 << retry_policy_.max_attempts << " failed: " << e.what();
      error_sink_.report(e);

      if (!wait_backoff(consecutive_failures)) {
        break;
      }
    }
  }

  set_state(ListenerState::State::STOPPED);
  BOOST_LOG_TRIVIAL(info) << "Connection listener: Accept loop stopped";
}

void ConnectionListener::open_acceptor() {
  BOOST_LOG_TRIVIAL(debug) << "Connection listener: Binding " << address_ << ":" << port_;

  boost::system::error_code ec;
  boost::asio::ip::address address = boost::asio::ip::make_address(address_, ec);
  if (ec) {
    throw BindError("Invalid bind address " + address_ + ": " + ec.message());
  }
  boost::asio::ip::tcp::endpoint endpoint(address, port_);

  acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);

  acceptor_->open(endpoint.protocol(), ec);
  if (ec) {
    throw BindError("Failed to open socket: " + ec.message());
  }

  acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Connection listener: Failed to set SO_REUSEADDR: " << ec.message();
  }

  acceptor_->bind(endpoint, ec);
  if (ec) {
    throw BindError("Failed to bind " + address_ + ":" + std::to_string(port_) + ": " + ec.message());
  }

  acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw BindError("Failed to listen on " + address_ + ":" + std::to_string(port_) + ": " + ec.message());
  }

  local_port_ = acceptor_->local_endpoint(ec).port();
  BOOST_LOG_TRIVIAL(info) << "Connection listener: Listening on " << address_ << ":" << local_port_;
}

void ConnectionListener::close_acceptor() {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Connection listener: Error closing acceptor: " << ec.message();
    }
  }
}

bool ConnectionListener::accept_one(boost::asio::ip::tcp::socket& socket) {
  io_context_.restart();
  if (!is_running_) {
    return false;
  }

  boost::system::error_code accept_error;
  bool completed = false;

  acceptor_->async_accept(socket,
    [&accept_error, &completed](const boost::system::error_code& error) {
      accept_error = error;
      completed = true;
    });

  // Returns once the accept handler ran or shutdown() stopped the context
  io_context_.run();

  if (!completed) {
    // Cancel the pending accept and drain its handler before the locals go away
    close_acceptor();
    io_context_.restart();
    io_context_.poll();
    return false;
  }

  if (accept_error) {
    if (accept_error == boost::asio::error::operation_aborted && !is_running_) {
      return false;
    }
    throw IOError("Accept failed: " + accept_error.message());
  }

  return true;
}

void ConnectionListener::serve(boost::asio::ip::tcp::socket socket) {
  boost::system::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  if (!ec) {
    BOOST_LOG_TRIVIAL(info) << "Connection listener: Received incoming connection from "
                            << remote.address().to_string() << ":" << remote.port();
  }

  boost::asio::ip::tcp::iostream stream(std::move(socket));
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    active_stream_ = &stream;
  }

  if (is_running_) {
    try {
      session_handler_(stream);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Connection listener: Session error: " << e.what();
      error_sink_.report(IOError(e.what()));
    }
  }

  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    active_stream_ = nullptr;
  }

  stream.close();
  ++sessions_served_;
  BOOST_LOG_TRIVIAL(debug) << "Connection listener: Session closed, " << sessions_served_ << " served";
}


//==============================================
// FAILURE HANDLING
//==============================================

bool ConnectionListener::wait_backoff(int attempt) {
  std::chrono::milliseconds delay = retry_policy_.backoff_for(attempt);
  BOOST_LOG_TRIVIAL(debug) << "Connection listener: Retrying in " << delay.count() << " ms";

  std::unique_lock<std::mutex> lock(backoff_mutex_);
  backoff_cv_.wait_for(lock, delay, [this]() { return !is_running_; });
  return is_running_;
}

void ConnectionListener::set_state(ListenerState::State state) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.get_state() == state) {
      return;
    }
    if (!state_.transition_to(state)) {
      BOOST_LOG_TRIVIAL(debug) << "Connection listener: Ignored transition " << state_.get_state_string()
                               << " -> " << state;
      return;
    }
    BOOST_LOG_TRIVIAL(trace) << "Connection listener: State " << state_.get_state_string();
  }
  state_cv_.notify_all();
}

ListenerState::State ConnectionListener::get_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.get_state();
}

bool ConnectionListener::wait_for_state(ListenerState::State state, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this, state]() { return state_.get_state() == state; });
}

} // namespace transfer
} // namespace codedrop
