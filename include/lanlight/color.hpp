/**
 * @file color.hpp
 * @brief Light state model: power and the two-shape color value.
 *
 * PURPOSE
 * -------
 * A bulb is either in white mode (brightness + color temperature) or in color
 * mode (hue + saturation + brightness). `ColorState` is a variant holding
 * exactly one of those shapes. Consumers switch on it explicitly.
 *
 * RANGES
 * ------
 *  - hue         [0, 360)
 *  - saturation  [0, 1]
 *  - brightness  [0, 1]
 *  - kelvin      [KELVIN_MIN, KELVIN_MAX]
 * Anything else (NaN included) fails `validate()` with ValidationError.
 *
 * WIRE MAPPING
 * ------------
 *  - White -> {hue 0, saturation 0, brightness, kelvin}
 *  - Color -> {hue, saturation, brightness, COLOR_KELVIN}
 *  - Reading back: saturation 0 means White, anything else means Color.
 *  - hue uses a 65536 scale (wraps, decoded hue < 360). saturation and
 *    brightness use 65535. Values are rounded to nearest.
 *
 * OPERATIONAL NOTES
 * -----------------
 *  - There is no implicit White <-> Color conversion. `dimmed()` keeps the
 *    variant and every other field untouched.
 *  - `interpolate()` is what the fade scheduler uses. When the two ends have
 *    different shapes it switches shape once at t = 0.5.
 */
#ifndef LANLIGHT_COLOR_HPP
#define LANLIGHT_COLOR_HPP

#include "lanlight/payloads.hpp"
#include "lanlight/status.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace lanlight {

constexpr uint16_t KELVIN_MIN   = 1500;
constexpr uint16_t KELVIN_MAX   = 9000;
constexpr uint16_t COLOR_KELVIN = 3500;   // sent alongside HSB values

enum class PowerState : uint8_t { Off = 0, On = 1 };

inline uint16_t power_to_level(PowerState p) { return p == PowerState::On ? 0xFFFF : 0; }
inline PowerState power_from_level(uint16_t level) {
  return level == 0 ? PowerState::Off : PowerState::On;
}
const char* to_string(PowerState p);

struct White {
  double   brightness{1.0};
  uint16_t kelvin{COLOR_KELVIN};

  bool operator==(const White& o) const { return brightness == o.brightness && kelvin == o.kelvin; }
  bool operator!=(const White& o) const { return !(*this == o); }
};

struct Color {
  double hue{0.0};
  double saturation{1.0};
  double brightness{1.0};

  bool operator==(const Color& o) const {
    return hue == o.hue && saturation == o.saturation && brightness == o.brightness;
  }
  bool operator!=(const Color& o) const { return !(*this == o); }
};

using ColorState = std::variant<White, Color>;

struct Rgb {
  double r{0.0};
  double g{0.0};
  double b{0.0};
};

Status validate(const ColorState& c);

inline bool is_white(const ColorState& c) { return std::holds_alternative<White>(c); }
inline bool is_color(const ColorState& c) { return std::holds_alternative<Color>(c); }

double brightness_of(const ColorState& c);

/// Scale brightness by factor (>= 0), clamped to 1. ValidationError on a bad factor.
Outcome<ColorState> dimmed(const ColorState& c, double factor);

Hsbk to_hsbk(const ColorState& c);
ColorState from_hsbk(const Hsbk& raw);

/// Linear blend at t in [0,1]; t <= 0 returns a, t >= 1 returns b exactly.
ColorState interpolate(const ColorState& a, const ColorState& b, double t);

/// Hue distance walked the short way round, in (-180, 180].
double hue_delta(double from, double to);

/// RGB components in [0,1].
Color from_rgb(const Rgb& rgb);
Rgb to_rgb(const Color& c);

/// "white b=0.50 k=2700" / "color h=120.0 s=1.00 b=0.80"
std::string describe(const ColorState& c);

} // namespace lanlight

#endif // LANLIGHT_COLOR_HPP
