#include "transfer/code_authority.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace codedrop {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CodeAuthority::CodeAuthority()
  : code_(format_code(random_code_value())) {
  BOOST_LOG_TRIVIAL(info) << "Code authority: Initial code=" << code_;
}

CodeAuthority::CodeAuthority(const std::string& initial_code)
  : code_(initial_code) {
  if (!is_valid_code(initial_code)) {
    BOOST_LOG_TRIVIAL(error) << "Code authority: Rejected malformed initial code";
    throw std::invalid_argument("Code authority: Code must be exactly 6 digits");
  }
  BOOST_LOG_TRIVIAL(info) << "Code authority: Initial code=" << code_;
}


//==============================================
// CODE ACCESS
//==============================================

std::string CodeAuthority::current_code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return code_;
}

bool CodeAuthority::matches(const std::string& candidate) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return candidate == code_;
}

std::string CodeAuthority::rotate() {
  std::string fresh_code;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    do {
      fresh_code = format_code(random_code_value());
    } while (fresh_code == code_);
    code_ = fresh_code;
  }

  BOOST_LOG_TRIVIAL(info) << "Code authority: New code=" << fresh_code;
  notify_listeners(fresh_code);
  return fresh_code;
}


//==============================================
// SUBSCRIPTIONS
//==============================================

CodeAuthority::SubscriptionId CodeAuthority::subscribe(CodeListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  SubscriptionId id = next_subscription_id_++;
  listeners_.emplace(id, std::move(listener));
  BOOST_LOG_TRIVIAL(debug) << "Code authority: Added subscription " << id;
  return id;
}

void CodeAuthority::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  if (listeners_.erase(id) == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Code authority: Attempted to remove unknown subscription " << id;
  }
}

void CodeAuthority::notify_listeners(const std::string& code) {
  // Copy so a listener may unsubscribe from inside its callback
  std::vector<CodeListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& entry : listeners_) {
      listeners.push_back(entry.second);
    }
  }

  for (const auto& listener : listeners) {
    try {
      listener(code);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Code authority: Listener error: " << e.what();
    }
  }
}


//==============================================
// UTILITY METHODS
//==============================================

bool CodeAuthority::is_valid_code(const std::string& code) {
  if (code.size() != CODE_LENGTH) {
    return false;
  }
  for (char c : code) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string CodeAuthority::format_code(std::uint32_t value) {
  std::ostringstream oss;
  oss << std::setw(CODE_LENGTH) << std::setfill('0') << (value % CODE_SPACE);
  return oss.str();
}

std::uint32_t CodeAuthority::random_code_value() {
  // Reject draws from the incomplete last block to keep the distribution uniform
  constexpr std::uint32_t limit =
    std::numeric_limits<std::uint32_t>::max() - (std::numeric_limits<std::uint32_t>::max() % CODE_SPACE);

  std::uint32_t value = 0;
  do {
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), static_cast<int>(sizeof(value))) != 1) {
      BOOST_LOG_TRIVIAL(error) << "Code authority: RAND_bytes failed, error " << ERR_get_error();
      throw std::runtime_error("Code authority: Failed to generate random code");
    }
  } while (value >= limit);

  return value % CODE_SPACE;
}

} // namespace transfer
} // namespace codedrop
