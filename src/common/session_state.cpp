#include "common/session_state.hpp"

namespace funnel {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::Streaming:  return "streaming";
        case SessionState::Finalizing: return "finalizing";
        case SessionState::Completed:  return "completed";
        case SessionState::Failed:     return "failed";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Failed;
}

bool can_transition(SessionState from, SessionState to) {
    if (is_terminal(from)) return false;
    if (to == SessionState::Failed) return true;

    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Connecting;
        case SessionState::Connecting:
            return to == SessionState::Streaming || to == SessionState::Finalizing;
        case SessionState::Streaming:
            return to == SessionState::Finalizing;
        case SessionState::Finalizing:
            return to == SessionState::Completed;
        default:
            return false;
    }
}

} // namespace funnel
