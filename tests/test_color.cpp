#include <doctest/doctest.h>
#include "lanlight/color.hpp"

using namespace lanlight;

TEST_CASE("Validation guards every component range") {
  CHECK(validate(White{0.5, 2700}) == Status::Ok);
  CHECK(validate(White{1.5, 2700}) == Status::ValidationError);
  CHECK(validate(White{0.5, 1000}) == Status::ValidationError);
  CHECK(validate(White{0.5, 9001}) == Status::ValidationError);

  CHECK(validate(Color{0.0, 1.0, 1.0}) == Status::Ok);
  CHECK(validate(Color{359.9, 0.0, 0.0}) == Status::Ok);
  CHECK(validate(Color{360.0, 1.0, 1.0}) == Status::ValidationError);
  CHECK(validate(Color{-1.0, 1.0, 1.0}) == Status::ValidationError);
  CHECK(validate(Color{10.0, 1.01, 1.0}) == Status::ValidationError);
  CHECK(validate(Color{10.0, 1.0, -0.1}) == Status::ValidationError);
}

TEST_CASE("Dimming scales brightness and keeps the other fields") {
  auto w = dimmed(White{0.8, 2700}, 0.5);
  REQUIRE(w.ok());
  REQUIRE(is_white(w.value));
  CHECK(std::get<White>(w.value).brightness == doctest::Approx(0.4));
  CHECK(std::get<White>(w.value).kelvin == 2700);

  auto c = dimmed(Color{120.0, 0.7, 0.6}, 3.0);
  REQUIRE(c.ok());
  CHECK(std::get<Color>(c.value).brightness == doctest::Approx(1.0));
  CHECK(std::get<Color>(c.value).hue == doctest::Approx(120.0));

  CHECK(dimmed(White{0.5, 2700}, -0.1).status == Status::ValidationError);
}

TEST_CASE("Wire mapping of the two color shapes") {
  Hsbk red = to_hsbk(Color{0.0, 1.0, 1.0});
  CHECK(red.hue == 0);
  CHECK(red.saturation == 65535);
  CHECK(red.brightness == 65535);
  CHECK(red.kelvin == COLOR_KELVIN);

  Hsbk green = to_hsbk(Color{120.0, 1.0, 0.5});
  CHECK(green.hue == 21845);
  CHECK(green.brightness == 32768);

  Hsbk warm = to_hsbk(White{0.25, 2700});
  CHECK(warm.saturation == 0);
  CHECK(warm.kelvin == 2700);
  CHECK(warm.brightness == 16384);

  CHECK(is_white(from_hsbk(warm)));
  ColorState back = from_hsbk(green);
  REQUIRE(is_color(back));
  CHECK(std::get<Color>(back).hue == doctest::Approx(120.0).epsilon(0.001));
  CHECK(from_hsbk(red) == ColorState(Color{0.0, 1.0, 1.0}));
}

TEST_CASE("Hue interpolation takes the short way round") {
  CHECK(hue_delta(350.0, 10.0) == doctest::Approx(20.0));
  CHECK(hue_delta(10.0, 350.0) == doctest::Approx(-20.0));
  CHECK(hue_delta(0.0, 180.0) == doctest::Approx(180.0));

  ColorState mid = interpolate(Color{350.0, 1.0, 1.0}, Color{10.0, 1.0, 1.0}, 0.5);
  REQUIRE(is_color(mid));
  const double h = std::get<Color>(mid).hue;
  CHECK((h < 0.001 || h > 359.999));

  ColorState quarter = interpolate(Color{350.0, 1.0, 1.0}, Color{10.0, 1.0, 1.0}, 0.25);
  CHECK(std::get<Color>(quarter).hue == doctest::Approx(355.0));
}

TEST_CASE("Interpolation endpoints are exact") {
  ColorState a = White{0.2, 2000};
  ColorState b = White{0.9, 6000};
  CHECK(interpolate(a, b, 0.0) == a);
  CHECK(interpolate(a, b, 1.0) == b);

  ColorState m = interpolate(a, b, 0.5);
  REQUIRE(is_white(m));
  CHECK(std::get<White>(m).kelvin == 4000);
  CHECK(std::get<White>(m).brightness == doctest::Approx(0.55));
}

TEST_CASE("Crossing from white to color switches shape once, at the midpoint") {
  ColorState a = White{0.0, 2700};
  ColorState b = Color{200.0, 1.0, 1.0};

  ColorState early = interpolate(a, b, 0.4);
  REQUIRE(is_white(early));
  CHECK(std::get<White>(early).kelvin == 2700);
  CHECK(std::get<White>(early).brightness == doctest::Approx(0.4));

  ColorState late = interpolate(a, b, 0.6);
  REQUIRE(is_color(late));
  CHECK(std::get<Color>(late).hue == doctest::Approx(200.0));
  CHECK(std::get<Color>(late).brightness == doctest::Approx(0.6));
}

TEST_CASE("RGB conversion hits the primaries") {
  Color blue = from_rgb(Rgb{0.0, 0.0, 1.0});
  CHECK(blue.hue == doctest::Approx(240.0));
  CHECK(blue.saturation == doctest::Approx(1.0));

  Rgb yellow = to_rgb(Color{60.0, 1.0, 1.0});
  CHECK(yellow.r == doctest::Approx(1.0));
  CHECK(yellow.g == doctest::Approx(1.0));
  CHECK(yellow.b == doctest::Approx(0.0));

  CHECK(describe(White{0.5, 2700}) == "white b=0.50 k=2700");
}
