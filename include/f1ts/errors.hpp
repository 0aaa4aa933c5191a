#pragma once

namespace f1ts {

// Conditions the streamer and receiver report. Per-packet ones are counted, never thrown.
enum class StreamError {
  EmptyInput,             // no samples, or a zero-length resampled series
  TransportBackpressure,  // send would block
  LatencyBudgetExceeded,  // serialize + send took longer than the budget
  StreamLag,              // wall clock behind the schedule by more than the budget
  LoadFailure,            // recording could not be opened or parsed
  TransportUnavailable,   // socket could not be opened
  MalformedDatagram,      // receiver got bytes that do not decode
  OversizeDatagram,       // encoded packet larger than the datagram limit
  SendFailed,             // send error other than backpressure
};

// Outcome of one replay session; the streamer maps it to an exit code.
enum class SessionStatus {
  Completed,
  Interrupted,
  LoadFailure,
  EmptyInput,
  TransportUnavailable,
};

const char* to_string(StreamError e);
const char* to_string(SessionStatus s);

// Session outcome for a condition that ends a run before streaming. Per-packet
// conditions never end a run and map to Completed.
SessionStatus session_status(StreamError e);

int exit_code(SessionStatus s);

} // namespace f1ts
