#ifndef TESSERA_TRANSFER_STATE_HPP
#define TESSERA_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace tessera {
namespace transfer {

enum class Direction {
    UPLOAD,
    DOWNLOAD
};

inline std::string to_string(Direction direction) {
    return direction == Direction::UPLOAD ? "upload" : "download";
}

/**
 * TransferState tracks the lifecycle of one content transfer.
 * Implements a state machine that enforces valid transitions; terminal
 * states accept nothing further.
 */
class TransferState {
public:
    /**
     * Transfer states:
     * PENDING   - Record created, nothing on the wire yet
     * ACTIVE    - Chunks in flight
     * COMPLETE  - Every chunk acknowledged (upload) or delivered (download)
     * FAILED    - Retries exhausted, rejected or failed integrity checks
     * CANCELLED - Stopped by the user or by a removal
     */
    enum class State {
        PENDING,
        ACTIVE,
        COMPLETE,
        FAILED,
        CANCELLED
    };

    TransferState() : current_state_(State::PENDING) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::COMPLETE ||
               current_state_ == State::FAILED ||
               current_state_ == State::CANCELLED;
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

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::PENDING:
                return to == State::ACTIVE ||
                       to == State::CANCELLED ||
                       to == State::FAILED;

            case State::ACTIVE:
                return to == State::COMPLETE ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::COMPLETE:
            case State::FAILED:
            case State::CANCELLED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::PENDING:   return "PENDING";
            case State::ACTIVE:    return "ACTIVE";
            case State::COMPLETE:  return "COMPLETE";
            case State::FAILED:    return "FAILED";
            case State::CANCELLED: return "CANCELLED";
            default:               return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for TransferState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const TransferState::State& state) {
    os << TransferState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace tessera

#endif // TESSERA_TRANSFER_STATE_HPP
