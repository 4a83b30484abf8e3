#ifndef CODEDROP_TRANSFER_LISTENER_STATE_HPP
#define CODEDROP_TRANSFER_LISTENER_STATE_HPP

#include <ostream>
#include <string>

namespace codedrop {
namespace transfer {

/**
 * ListenerState tracks the accept loop of the connection listener.
 * It follows the cycle IDLE -> LISTENING -> PROCESSING -> IDLE. An interrupted accept
 * returns LISTENING to IDLE and any live state may move to STOPPED.
 */
class ListenerState {
public:
    /**
     * Listener states:
     * IDLE       - Between sessions, or unbound after a failure
     * LISTENING  - Bound and waiting for one inbound connection
     * PROCESSING - Serving the accepted connection, further connections wait in the backlog
     * STOPPED    - Shut down or gave up after repeated bind failures
     */
    enum class State {
        IDLE,
        LISTENING,
        PROCESSING,
        STOPPED
    };

    ListenerState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::STOPPED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Restarting a stopped listener begins from IDLE again
    void reset() { current_state_ = State::IDLE; }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::LISTENING ||
                       to == State::STOPPED;

            case State::LISTENING:
                return to == State::PROCESSING ||
                       to == State::IDLE ||
                       to == State::STOPPED;

            case State::PROCESSING:
                return to == State::IDLE ||
                       to == State::STOPPED;

            case State::STOPPED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:       return "IDLE";
            case State::LISTENING:  return "LISTENING";
            case State::PROCESSING: return "PROCESSING";
            case State::STOPPED:    return "STOPPED";
            default:                return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const ListenerState::State& state) {
    os << ListenerState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_LISTENER_STATE_HPP
