#include <raylib.h>
#include <algorithm>
#include <cmath>

#include <f1ts/viewer/app.hpp>

namespace f1ts {

namespace {

constexpr int kMaxRpm = 15000;

const Color kPanel   = Color{24, 24, 28, 220};
const Color kShadow  = Color{0, 0, 0, 80};
const Color kLabel   = Color{190, 190, 200, 255};
const Color kValue   = Color{235, 235, 240, 255};
const Color kGreen   = Color{80, 220, 120, 255};
const Color kRed     = Color{231, 76, 60, 255};
const Color kAmber   = Color{241, 196, 15, 255};
const Color kBlue    = Color{52, 152, 219, 255};
const Color kPurple  = Color{180, 90, 255, 255};

void panel(int x, int y, int w, int h) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, kShadow);
  DrawRectangle(x, y, w, h, kPanel);
}

// Horizontal bar filled to `frac` in [0,1].
void bar(int x, int y, int w, int h, double frac, Color fill) {
  const double f = std::clamp(std::isfinite(frac) ? frac : 0.0, 0.0, 1.0);
  DrawRectangle(x, y, w, h, Color{50, 50, 58, 255});
  DrawRectangle(x, y, int(w * f), h, fill);
  DrawRectangleLines(x, y, w, h, Color{80, 80, 90, 255});
}

// Blue when cold, green in the window, red when hot.
Color tyre_color(int temp_c) {
  if (temp_c < 80)  return kBlue;
  if (temp_c <= 105) return kGreen;
  if (temp_c <= 115) return kAmber;
  return kRed;
}

Color priority_color(Priority p) {
  switch (p) {
    case Priority::Critical: return kRed;
    case Priority::High:     return kAmber;
    case Priority::Medium:   return kBlue;
    case Priority::Low:      return kLabel;
  }
  return kLabel;
}

const char* gear_label(int g) {
  return g <= 0 ? "N" : TextFormat("%d", g);
}

} // namespace

ViewerApp::ViewerApp(TelemetryReceiver& rx) : rx_(rx) {}

int ViewerApp::run() {
  const int W = 1024, H = 640;
  InitWindow(W, H, "F1TS - Telemetry");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_frames_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_S)) show_stats_ = !show_stats_;
}

void ViewerApp::pump_frames_() {
  (void)rx_.buffer().try_consume_latest(cursor_, frame_);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{16, 16, 20, 255});

  draw_header_(frame_);
  if (frame_.has_packet) {
    draw_driving_(frame_);
    draw_engine_(frame_);
    draw_tyres_(frame_);
  } else {
    DrawText(TextFormat("waiting for telemetry on UDP port %u", unsigned(rx_.port())),
             20, 120, 20, kLabel);
  }
  if (show_stats_) draw_stats_(frame_);

  DrawText("S: toggle receiver stats | Esc: quit", 20, GetScreenHeight() - 24, 14, kLabel);
  EndDrawing();
}

void ViewerApp::draw_header_(const DashboardFrame& f) {
  const auto& p = f.packet;
  DrawText(TextFormat("car #%d   lap %d   packet %llu", p.car_number, p.lap_number,
                      (unsigned long long)p.packet_id),
           20, 20, 20, kValue);

  // Priority badge
  const char* label = to_string(p.priority);
  const int tw = MeasureText(label, 18);
  const int x = GetScreenWidth() - tw - 40;
  DrawRectangle(x - 10, 16, tw + 20, 28, priority_color(p.priority));
  DrawText(label, x, 21, 18, Color{16, 16, 20, 255});

  if (f.idle) DrawText("NO SIGNAL", x - 140, 21, 18, kRed);
}

void ViewerApp::draw_driving_(const DashboardFrame& f) {
  const auto& p = f.packet;
  const int x0 = 20, y0 = 64, w = 480, h = 250;
  panel(x0, y0, w, h);

  DrawText(TextFormat("%d", p.speed_kmh), x0 + 16, y0 + 12, 64, kValue);
  DrawText("km/h", x0 + 16, y0 + 80, 16, kLabel);

  DrawText(gear_label(p.gear), x0 + 220, y0 + 8, 80, kValue);
  DrawText("gear", x0 + 222, y0 + 90, 16, kLabel);

  // DRS lamp
  DrawCircle(x0 + w - 50, y0 + 44, 22.0f, p.drs_active ? kGreen : Color{50, 50, 58, 255});
  DrawText("DRS", x0 + w - 66, y0 + 72, 16, kLabel);

  const int bx = x0 + 80, bw = w - 100;
  DrawText("RPM", x0 + 16, y0 + 120, 16, kLabel);
  bar(bx, y0 + 120, bw, 18, double(p.engine_rpm) / kMaxRpm,
      p.engine_rpm > 12500 ? kRed : kPurple);
  DrawText(TextFormat("%d", p.engine_rpm), bx + bw - 60, y0 + 141, 14, kLabel);

  DrawText("THR", x0 + 16, y0 + 170, 16, kLabel);
  bar(bx, y0 + 170, bw, 18, p.throttle, kGreen);

  DrawText("BRK", x0 + 16, y0 + 205, 16, kLabel);
  bar(bx, y0 + 205, bw, 18, p.brake, kRed);
}

void ViewerApp::draw_engine_(const DashboardFrame& f) {
  const auto& p = f.packet;
  const int x0 = 530, y0 = 64, w = 470, h = 250;
  panel(x0, y0, w, h);

  const int lx = x0 + 16, vx = x0 + 220;
  int y = y0 + 14;
  auto row = [&](const char* label, const char* value, Color c) {
    DrawText(label, lx, y, 18, kLabel);
    DrawText(value, vx, y, 18, c);
    y += 28;
  };

  row("water", TextFormat("%d C", p.water_temp_c),
      p.water_temp_c > kCriticalWaterTempC ? kRed : kValue);
  row("oil", TextFormat("%d C  %.1f bar", p.oil_temp_c, p.oil_pressure_bar), kValue);
  row("exhaust", TextFormat("%d C", p.exhaust_temp_c), kValue);
  row("fuel flow", TextFormat("%.2f kg/h", p.fuel_flow_kg_h), kValue);
  row("fuel left", TextFormat("%.2f kg", p.fuel_remaining_kg), kValue);
  row("MGU-K", TextFormat("%.0f kW", p.mguk_power_w / 1000.0), kValue);

  DrawText("ERS", lx, y + 4, 18, kLabel);
  bar(vx, y + 4, w - 240, 18, p.ers_store_j / 4.0e6, kBlue);
}

void ViewerApp::draw_tyres_(const DashboardFrame& f) {
  const auto& p = f.packet;
  const int x0 = 20, y0 = 340, w = 480, h = 220;
  panel(x0, y0, w, h);
  DrawText("tyres (surface C / psi)", x0 + 16, y0 + 10, 16, kLabel);

  static const char* kNames[4] = {"FL", "FR", "RL", "RR"};
  for (int i = 0; i < 4; ++i) {
    const int cx = x0 + 60 + (i % 2) * 220;
    const int cy = y0 + 44 + (i / 2) * 86;
    const int t = p.tyre_temp_surface_c[i];
    DrawRectangle(cx, cy, 60, 70, tyre_color(t));
    DrawText(kNames[i], cx + 70, cy + 4, 18, kLabel);
    DrawText(TextFormat("%d C", t), cx + 70, cy + 26, 18, kValue);
    DrawText(TextFormat("%.1f", p.tyre_pressure_psi[i]), cx + 70, cy + 48, 16, kLabel);
  }
}

void ViewerApp::draw_stats_(const DashboardFrame& f) {
  const auto& s = f.stats;
  const int x0 = 530, y0 = 340, w = 470, h = 220;
  panel(x0, y0, w, h);

  const int lx = x0 + 16, vx = x0 + 220;
  int y = y0 + 14;
  auto row = [&](const char* label, const char* value, Color c) {
    DrawText(label, lx, y, 18, kLabel);
    DrawText(value, vx, y, 18, c);
    y += 28;
  };

  row("rate", TextFormat("%.0f pps", f.packets_per_sec), kValue);
  row("received", TextFormat("%llu", (unsigned long long)s.received), kValue);
  row("lost", TextFormat("%llu (%.2f%%)", (unsigned long long)s.lost, s.loss_pct()),
      s.loss_pct() > 0.1 ? kAmber : kValue);
  row("out of order", TextFormat("%llu", (unsigned long long)s.out_of_order), kValue);
  row("duplicates", TextFormat("%llu", (unsigned long long)s.duplicates), kValue);
  row("malformed", TextFormat("%llu", (unsigned long long)s.malformed),
      s.malformed ? kRed : kValue);
}

} // namespace f1ts
