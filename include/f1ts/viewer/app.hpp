#pragma once
#include <cstdint>
#include <f1ts/receiver.hpp>

namespace f1ts {

// RAII raylib dashboard rendering the latest frame published by a TelemetryReceiver.
class ViewerApp {
public:
  explicit ViewerApp(TelemetryReceiver& rx);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void pump_frames_();
  void render_frame_();
  void draw_header_(const DashboardFrame& f);
  void draw_driving_(const DashboardFrame& f);
  void draw_engine_(const DashboardFrame& f);
  void draw_tyres_(const DashboardFrame& f);
  void draw_stats_(const DashboardFrame& f);

  TelemetryReceiver& rx_;
  DashboardFrame frame_{};
  std::uint64_t cursor_{0};

  bool show_stats_{true};
};

} // namespace f1ts
