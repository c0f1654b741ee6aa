#include <doctest/doctest.h>
#include "fake_network.hpp"
#include "lanlight/light.hpp"

#include <string>

using namespace lanlight;
using namespace lanlight::testing;

namespace {

struct Rig {
  FakeTransport net;
  MockBulb      bulb{hw(1), ep(10)};
  Backend       backend{net, fixed_config()};
  Light         light;

  Rig() {
    net.attach(&bulb);
    backend.tick(1000);
    light = Light(backend, backend.registry().upsert(bulb.id, bulb.endpoint, 1000));
  }

  void pump(uint64_t ms = 1) { backend.tick(backend.now_ms() + ms); }
};

template <typename T>
struct Slot {
  bool       fired{false};
  Outcome<T> got;
  Light::Callback<T> cb() {
    return [this](const Outcome<T>& o) { fired = true; got = o; };
  }
};

struct StatusSlot {
  bool   fired{false};
  Status got{Status::Ok};
  Light::StatusCallback cb() {
    return [this](Status s) { fired = true; got = s; };
  }
};

} // namespace

TEST_CASE("Red set on a bulb reads back as the same color") {
  Rig r;
  StatusSlot set;
  REQUIRE(r.light.set_color(Color{0.0, 1.0, 1.0}, 500, set.cb()) == Status::Ok);
  r.pump();
  REQUIRE(set.fired);
  CHECK(set.got == Status::Ok);
  CHECK(r.bulb.color == Hsbk{0, 65535, 65535, 3500});

  Slot<ColorState> get;
  REQUIRE(r.light.get_color(500, get.cb()) == Status::Ok);
  r.pump();
  REQUIRE(get.got.ok());
  CHECK(get.got.value == ColorState(Color{0.0, 1.0, 1.0}));
  REQUIRE(r.light.device().color.has_value());
  CHECK(*r.light.device().color == ColorState(Color{0.0, 1.0, 1.0}));
}

TEST_CASE("Set color carries the transition time to the device") {
  Rig r;
  StatusSlot set;
  r.light.set_color(White{0.5, 2700}, 500, set.cb(), 750);
  r.pump();
  REQUIRE(r.bulb.received.size() == 1);
  SetColorPayload p;
  REQUIRE(SetColorPayload::unpack(r.bulb.received[0].payload.data(),
                                  r.bulb.received[0].payload.size(), p));
  CHECK(p.duration_ms == 750);
  CHECK(r.bulb.received[0].header.ack_required);
  CHECK_FALSE(r.bulb.received[0].header.res_required);
}

TEST_CASE("Out-of-range colors are rejected without touching the network") {
  Rig r;
  StatusSlot set;
  CHECK(r.light.set_color(Color{400.0, 1.0, 1.0}, 500, set.cb()) == Status::ValidationError);
  CHECK(r.light.set_color(White{0.5, 12000}, 500, set.cb()) == Status::ValidationError);
  CHECK(r.light.fade_color(White{2.0, 3000}, 1000, 500, set.cb()) == Status::ValidationError);
  r.pump(1000);
  CHECK(r.net.sent.empty());
  CHECK_FALSE(set.fired);
}

TEST_CASE("Power on and off round trip through the device") {
  Rig r;
  StatusSlot on;
  REQUIRE(r.light.poweron(500, on.cb()) == Status::Ok);
  r.pump();
  CHECK(on.got == Status::Ok);
  CHECK(r.bulb.power == 65535);

  Slot<PowerState> p;
  r.light.get_power(500, p.cb());
  r.pump();
  REQUIRE(p.got.ok());
  CHECK(p.got.value == PowerState::On);

  StatusSlot off;
  r.light.poweroff(500, off.cb());
  r.pump();
  CHECK(r.bulb.power == 0);
  REQUIRE(r.light.device().power.has_value());
  CHECK(*r.light.device().power == PowerState::Off);
}

TEST_CASE("Ping checks the echoed bytes") {
  Rig r;
  StatusSlot ok;
  REQUIRE(r.light.ping(500, ok.cb()) == Status::Ok);
  r.pump();
  CHECK(ok.got == Status::Ok);

  r.bulb.corrupt_echo = true;
  StatusSlot bad;
  r.light.ping(500, bad.cb());
  r.pump();
  CHECK(bad.got == Status::MalformedFrame);
}

TEST_CASE("A device at a stale address times out") {
  Rig r;
  Device& ghost = r.backend.registry().upsert(hw(2), ep(99), 1000);
  Light stale(r.backend, ghost);

  Slot<PowerState> p;
  REQUIRE(stale.get_power(300, p.cb()) == Status::Ok);
  r.pump(299);
  CHECK_FALSE(p.fired);
  r.pump(1);
  REQUIRE(p.fired);
  CHECK(p.got.status == Status::Timeout);
}

TEST_CASE("Silent device fails only its own request") {
  Rig r;
  MockBulb quiet(hw(3), ep(30));
  quiet.silent = true;
  r.net.attach(&quiet);
  Light q(r.backend, r.backend.registry().upsert(quiet.id, quiet.endpoint, 1000));

  Slot<PowerState> lost, fine;
  q.get_power(100, lost.cb());
  r.light.get_power(100, fine.cb());
  r.pump(100);
  CHECK(lost.got.status == Status::Timeout);
  CHECK(fine.got.ok());
}

TEST_CASE("Malformed state reply is surfaced to the caller") {
  Rig r;
  r.bulb.silent = true;
  Slot<ColorState> get;
  r.light.get_color(500, get.cb());
  REQUIRE(r.net.sent.size() == 1);

  Frame req;
  REQUIRE(decode(r.net.sent[0].bytes, req) == Status::Ok);
  Frame bad = make_frame(req.header.source, r.bulb.id, req.header.sequence,
                         MessageType::LightState, std::vector<uint8_t>(10, 0));
  r.net.inject(encode(bad), r.bulb.endpoint);
  r.pump();
  REQUIRE(get.fired);
  CHECK(get.got.status == Status::MalformedFrame);
}

TEST_CASE("Labels are written, read back and length-checked") {
  Rig r;
  StatusSlot set;
  REQUIRE(r.light.set_label("Kitchen", 500, set.cb()) == Status::Ok);
  r.pump();
  CHECK(set.got == Status::Ok);
  CHECK(std::string(r.bulb.label.c_str()) == "Kitchen");

  Slot<Label> get;
  r.light.get_label(500, get.cb());
  r.pump();
  REQUIRE(get.got.ok());
  CHECK(std::string(get.got.value.c_str()) == "Kitchen");

  StatusSlot too_long;
  CHECK(r.light.set_label(std::string(33, 'x'), 500, too_long.cb()) == Status::ValidationError);
}

TEST_CASE("Device information queries decode their payloads") {
  Rig r;
  Slot<VersionPayload>    version;
  Slot<FirmwarePayload>   firmware;
  Slot<DeviceInfoPayload> wifi;
  Slot<InfoPayload>       info;
  Slot<MembershipPayload> group;

  r.light.get_version(500, version.cb());
  r.light.get_host_firmware(500, firmware.cb());
  r.light.get_wifi_info(500, wifi.cb());
  r.light.get_info(500, info.cb());
  r.light.get_group(500, group.cb());
  r.pump();

  REQUIRE(version.got.ok());
  CHECK(version.got.value.product == 27);
  REQUIRE(firmware.got.ok());
  CHECK(firmware.got.value.major() == 2);
  CHECK(firmware.got.value.minor() == 80);
  REQUIRE(wifi.got.ok());
  CHECK(wifi.got.value.rx == 20);
  REQUIRE(info.got.ok());
  CHECK(info.got.value.uptime == 3600000000000ull);
  REQUIRE(group.got.ok());
  CHECK(std::string(group.got.value.label.c_str()) == "Kitchen");
}

TEST_CASE("An unbound proxy rejects every call") {
  Light none;
  bool fired = false;
  CHECK(none.ping(100, [&](Status) { fired = true; }) == Status::ValidationError);
  CHECK(none.get_power(100, [&](const Outcome<PowerState>&) { fired = true; }) == Status::ValidationError);
  CHECK_FALSE(none.cancel_fade());
  CHECK_FALSE(fired);
}
