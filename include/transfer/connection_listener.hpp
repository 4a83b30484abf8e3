#ifndef CODEDROP_TRANSFER_CONNECTION_LISTENER_HPP
#define CODEDROP_TRANSFER_CONNECTION_LISTENER_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "transfer/collaborators.hpp"
#include "transfer/engine_config.hpp"
#include "transfer/listener_state.hpp"

namespace codedrop {
namespace transfer {

class ConnectionListener {
public:
  // Serves one accepted connection, the listener waits for it to return
  using SessionHandler = std::function<void(boost::asio::ip::tcp::iostream&)>;

  // Delete copy operations to prevent socket duplication
  ConnectionListener(const ConnectionListener&) = delete;
  ConnectionListener& operator=(const ConnectionListener&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConnectionListener(const std::string& address, uint16_t port, const RetryPolicy& retry_policy,
                     ErrorSink& error_sink, SessionHandler session_handler);
  ~ConnectionListener();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Starts the accept loop on its own thread
  bool start_listener();
  // Interrupts a pending accept or session and joins the loop thread
  void shutdown();


  // ---- GETTERS ----
  ListenerState::State get_state() const;
  // Blocks until the listener reaches the state or the timeout expires
  bool wait_for_state(ListenerState::State state, std::chrono::milliseconds timeout) const;
  bool is_running() const { return is_running_; }
  std::size_t sessions_served() const { return sessions_served_; }
  // Port actually bound, differs from the configured one when that was 0
  uint16_t local_port() const { return local_port_; }

private:
  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  const uint16_t port_;
  const RetryPolicy retry_policy_;

  // Listener state
  std::unique_ptr<std::thread> listener_thread_;
  std::atomic<bool> is_running_{false};
  std::atomic<std::size_t> sessions_served_{0};
  std::atomic<uint16_t> local_port_{0};
  ListenerState state_;
  mutable std::mutex state_mutex_;
  mutable std::condition_variable state_cv_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::mutex session_mutex_;
  boost::asio::ip::tcp::iostream* active_stream_{nullptr};

  // Interruptible backoff sleep
  std::mutex backoff_mutex_;
  std::condition_variable backoff_cv_;

  // System components
  ErrorSink& error_sink_;
  SessionHandler session_handler_;


  // ---- ACCEPT LOOP ----
  // bind -> accept one -> serve -> accept next. The socket is only rebound after a failure.
  void listen_loop();
  // Opens, binds and listens. Throws BindError.
  void open_acceptor();
  void close_acceptor();
  // Waits for one connection, returns false if interrupted. Throws IOError.
  bool accept_one(boost::asio::ip::tcp::socket& socket);
  void serve(boost::asio::ip::tcp::socket socket);


  // ---- FAILURE HANDLING ----
  // Sleeps for the backoff of the given attempt, returns false if shutdown interrupted it
  bool wait_backoff(int attempt);
  void set_state(ListenerState::State state);
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_CONNECTION_LISTENER_HPP
