#ifndef CODEDROP_TRANSFER_ENGINE_CONFIG_HPP
#define CODEDROP_TRANSFER_ENGINE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace codedrop {
namespace transfer {

constexpr uint16_t DEFAULT_PORT = 10001;

// Backoff applied to consecutive bind/accept failures of the listener
struct RetryPolicy {
    int max_attempts{5};
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5000};

    // Delay before retry number `attempt` (1-based), doubling up to max_backoff
    std::chrono::milliseconds backoff_for(int attempt) const {
        std::chrono::milliseconds delay = initial_backoff;
        for (int i = 1; i < attempt && delay < max_backoff; ++i) {
            delay *= 2;
        }
        return delay < max_backoff ? delay : max_backoff;
    }
};

struct EngineConfig {
    std::string bind_address{"0.0.0.0"};
    uint16_t port{DEFAULT_PORT};
    // Port dialed by the sender on the remote host
    uint16_t remote_port{DEFAULT_PORT};
    RetryPolicy retry_policy;
    // Text receipt leaves the code untouched unless enabled
    bool rotate_on_text{false};
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_ENGINE_CONFIG_HPP
