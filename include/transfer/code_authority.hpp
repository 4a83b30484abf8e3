#ifndef CODEDROP_TRANSFER_CODE_AUTHORITY_HPP
#define CODEDROP_TRANSFER_CODE_AUTHORITY_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace codedrop {
namespace transfer {

class CodeAuthority {
public:
  using CodeListener = std::function<void(const std::string&)>;
  using SubscriptionId = std::uint64_t;

  static constexpr std::size_t CODE_LENGTH = 6;
  static constexpr std::uint32_t CODE_SPACE = 1000000;

  // Delete copy operations, there is exactly one active code per instance
  CodeAuthority(const CodeAuthority&) = delete;
  CodeAuthority& operator=(const CodeAuthority&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Starts with a freshly generated code
  CodeAuthority();
  // Starts with a fixed code, throws std::invalid_argument if malformed
  explicit CodeAuthority(const std::string& initial_code);


  // ---- CODE ACCESS ----
  std::string current_code() const;
  bool matches(const std::string& candidate) const;
  // Replaces the active code with a new value different from the previous one
  std::string rotate();


  // ---- SUBSCRIPTIONS ----
  // Listener is invoked on the rotating thread after the new code is published
  SubscriptionId subscribe(CodeListener listener);
  void unsubscribe(SubscriptionId id);


  // ---- UTILITY METHODS ----
  // True for exactly six ASCII digits
  static bool is_valid_code(const std::string& code);
  static std::string format_code(std::uint32_t value);

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::string code_;

  std::mutex listeners_mutex_;
  std::map<SubscriptionId, CodeListener> listeners_;
  SubscriptionId next_subscription_id_{1};


  // ---- CODE GENERATION ----
  // Draws a uniform value in [0, CODE_SPACE) using OpenSSL RAND_bytes
  static std::uint32_t random_code_value();
  void notify_listeners(const std::string& code);
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_CODE_AUTHORITY_HPP
