#pragma once

#include <string>

namespace funnel {

/// Lifecycle of one recording attempt, shared by client and relay.
enum class SessionState {
    Idle,
    Connecting,
    Streaming,
    Finalizing,
    Completed,
    Failed
};

const char* to_string(SessionState state);

bool is_terminal(SessionState state);

/// True when `from -> to` is an edge of the lifecycle graph:
/// Idle->Connecting->Streaming->Finalizing->Completed, Connecting->Finalizing
/// (nothing was ever streamed), and any non-terminal state -> Failed.
bool can_transition(SessionState from, SessionState to);

} // namespace funnel
