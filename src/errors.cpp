#include <f1ts/errors.hpp>

namespace f1ts {

const char* to_string(StreamError e) {
  switch (e) {
    case StreamError::EmptyInput:            return "empty input";
    case StreamError::TransportBackpressure: return "transport backpressure";
    case StreamError::LatencyBudgetExceeded: return "latency budget exceeded";
    case StreamError::StreamLag:             return "stream lag";
    case StreamError::LoadFailure:           return "load failure";
    case StreamError::TransportUnavailable:  return "transport unavailable";
    case StreamError::MalformedDatagram:     return "malformed datagram";
    case StreamError::OversizeDatagram:      return "oversize datagram";
    case StreamError::SendFailed:            return "send failed";
  }
  return "unknown";
}

const char* to_string(SessionStatus s) {
  switch (s) {
    case SessionStatus::Completed:            return "completed";
    case SessionStatus::Interrupted:          return "interrupted";
    case SessionStatus::LoadFailure:          return "load failure";
    case SessionStatus::EmptyInput:           return "empty input";
    case SessionStatus::TransportUnavailable: return "transport unavailable";
  }
  return "unknown";
}

SessionStatus session_status(StreamError e) {
  switch (e) {
    case StreamError::EmptyInput:           return SessionStatus::EmptyInput;
    case StreamError::LoadFailure:          return SessionStatus::LoadFailure;
    case StreamError::TransportUnavailable: return SessionStatus::TransportUnavailable;
    default:                                return SessionStatus::Completed;
  }
}

int exit_code(SessionStatus s) {
  switch (s) {
    case SessionStatus::Completed:            return 0;
    case SessionStatus::Interrupted:          return 130;  // 128 + SIGINT
    case SessionStatus::LoadFailure:          return 2;
    case SessionStatus::EmptyInput:           return 3;
    case SessionStatus::TransportUnavailable: return 4;
  }
  return 1;
}

} // namespace f1ts
