// ============================================================================
// color.cpp: implementation for color.hpp
// ============================================================================
#include "lanlight/color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lanlight {

namespace {

constexpr double HUE_SCALE  = 65536.0;   // hue wraps at 360
constexpr double UNIT_SCALE = 65535.0;

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

uint16_t unit_to_u16(double v) {
  return static_cast<uint16_t>(std::lround(std::clamp(v, 0.0, 1.0) * UNIT_SCALE));
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

double wrap_hue(double h) {
  double w = std::fmod(h, 360.0);
  if (w < 0.0) w += 360.0;
  if (w >= 360.0) w = 0.0;
  return w;
}

} // namespace

const char* to_string(PowerState p) { return p == PowerState::On ? "on" : "off"; }

Status validate(const ColorState& c) {
  if (const auto* w = std::get_if<White>(&c)) {
    if (!in_unit(w->brightness)) return Status::ValidationError;
    if (w->kelvin < KELVIN_MIN || w->kelvin > KELVIN_MAX) return Status::ValidationError;
    return Status::Ok;
  }
  const auto& col = std::get<Color>(c);
  if (!std::isfinite(col.hue) || col.hue < 0.0 || col.hue >= 360.0) return Status::ValidationError;
  if (!in_unit(col.saturation) || !in_unit(col.brightness)) return Status::ValidationError;
  return Status::Ok;
}

double brightness_of(const ColorState& c) {
  if (const auto* w = std::get_if<White>(&c)) return w->brightness;
  return std::get<Color>(c).brightness;
}

static ColorState with_brightness(ColorState c, double b) {
  if (auto* w = std::get_if<White>(&c)) w->brightness = b;
  else std::get<Color>(c).brightness = b;
  return c;
}

Outcome<ColorState> dimmed(const ColorState& c, double factor) {
  if (!std::isfinite(factor) || factor < 0.0) return Outcome<ColorState>::failure(Status::ValidationError);
  if (validate(c) != Status::Ok)             return Outcome<ColorState>::failure(Status::ValidationError);
  double b = std::min(1.0, brightness_of(c) * factor);
  return Outcome<ColorState>::success(with_brightness(c, b));
}

Hsbk to_hsbk(const ColorState& c) {
  Hsbk raw;
  if (const auto* w = std::get_if<White>(&c)) {
    raw.brightness = unit_to_u16(w->brightness);
    raw.kelvin     = w->kelvin;
    return raw;
  }
  const auto& col = std::get<Color>(c);
  raw.hue        = static_cast<uint16_t>(std::lround(wrap_hue(col.hue) * HUE_SCALE / 360.0) % 65536);
  raw.saturation = unit_to_u16(col.saturation);
  raw.brightness = unit_to_u16(col.brightness);
  raw.kelvin     = COLOR_KELVIN;
  return raw;
}

ColorState from_hsbk(const Hsbk& raw) {
  if (raw.saturation == 0) {
    return White{raw.brightness / UNIT_SCALE, raw.kelvin};
  }
  return Color{raw.hue * 360.0 / HUE_SCALE, raw.saturation / UNIT_SCALE, raw.brightness / UNIT_SCALE};
}

double hue_delta(double from, double to) {
  double d = std::fmod(to - from, 360.0);
  if (d > 180.0)   d -= 360.0;
  if (d <= -180.0) d += 360.0;
  return d;
}

// ---------------------------------------------------------------------------
// interpolate()
// Same shape: componentwise lerp, hue the short way round.
// Different shapes: brightness lerps, everything else snaps from a's shape to
// b's shape at t = 0.5.
// ---------------------------------------------------------------------------
ColorState interpolate(const ColorState& a, const ColorState& b, double t) {
  if (!(t > 0.0)) return a;
  if (t >= 1.0)   return b;

  if (a.index() != b.index()) {
    double bri = lerp(brightness_of(a), brightness_of(b), t);
    return with_brightness(t < 0.5 ? a : b, bri);
  }

  if (const auto* wa = std::get_if<White>(&a)) {
    const auto& wb = std::get<White>(b);
    double k = lerp(wa->kelvin, wb.kelvin, t);
    return White{lerp(wa->brightness, wb.brightness, t), static_cast<uint16_t>(std::lround(k))};
  }

  const auto& ca = std::get<Color>(a);
  const auto& cb = std::get<Color>(b);
  return Color{wrap_hue(ca.hue + hue_delta(ca.hue, cb.hue) * t),
               lerp(ca.saturation, cb.saturation, t),
               lerp(ca.brightness, cb.brightness, t)};
}

// Standard HSV <-> RGB; value maps to brightness.
Color from_rgb(const Rgb& rgb) {
  double r = std::clamp(rgb.r, 0.0, 1.0);
  double g = std::clamp(rgb.g, 0.0, 1.0);
  double b = std::clamp(rgb.b, 0.0, 1.0);
  double mx = std::max({r, g, b});
  double mn = std::min({r, g, b});
  double d  = mx - mn;

  Color c;
  c.brightness = mx;
  c.saturation = mx > 0.0 ? d / mx : 0.0;
  if (d == 0.0) {
    c.hue = 0.0;
  } else if (mx == r) {
    c.hue = 60.0 * std::fmod((g - b) / d, 6.0);
  } else if (mx == g) {
    c.hue = 60.0 * ((b - r) / d + 2.0);
  } else {
    c.hue = 60.0 * ((r - g) / d + 4.0);
  }
  c.hue = wrap_hue(c.hue);
  return c;
}

Rgb to_rgb(const Color& c) {
  double h = wrap_hue(c.hue) / 60.0;
  double chroma = c.brightness * c.saturation;
  double x = chroma * (1.0 - std::fabs(std::fmod(h, 2.0) - 1.0));
  double m = c.brightness - chroma;
  double r = 0, g = 0, b = 0;
  switch (static_cast<int>(h)) {
    case 0:  r = chroma; g = x;      break;
    case 1:  r = x;      g = chroma; break;
    case 2:  g = chroma; b = x;      break;
    case 3:  g = x;      b = chroma; break;
    case 4:  r = x;      b = chroma; break;
    default: r = chroma; b = x;      break;
  }
  return Rgb{r + m, g + m, b + m};
}

std::string describe(const ColorState& c) {
  char buf[64];
  if (const auto* w = std::get_if<White>(&c)) {
    std::snprintf(buf, sizeof(buf), "white b=%.2f k=%u", w->brightness, static_cast<unsigned>(w->kelvin));
  } else {
    const auto& col = std::get<Color>(c);
    std::snprintf(buf, sizeof(buf), "color h=%.1f s=%.2f b=%.2f", col.hue, col.saturation, col.brightness);
  }
  return buf;
}

} // namespace lanlight
