#include <doctest/doctest.h>
#include "fake_network.hpp"

#include <set>

using namespace lanlight;
using namespace lanlight::testing;

namespace {

struct Captured {
  bool   fired{false};
  int    calls{0};
  Status status{Status::Ok};
  Frame  frame;
};

RequestTracker::Completion capture(Captured& c) {
  return [&c](Status st, const Frame& f) {
    c.fired = true;
    ++c.calls;
    c.status = st;
    c.frame = f;
  };
}

Frame reply_to(const Datagram& sent, MessageType type, std::vector<uint8_t> payload = {}) {
  Frame req;
  decode(sent.bytes, req);
  return make_frame(req.header.source, hw(1), req.header.sequence, type, std::move(payload));
}

} // namespace

TEST_CASE("In-flight requests never share a sequence number") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  std::set<uint8_t> seqs;
  for (int i = 0; i < 40; ++i) {
    RequestTicket t;
    REQUIRE(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                                 500, [](Status, const Frame&) {}, &t) == Status::Ok);
    CHECK(seqs.insert(t.sequence).second);
  }
  CHECK(backend.tracker().in_flight() == 40);
}

TEST_CASE("Sequence allocation wraps and skips numbers still in flight") {
  FakeTransport net;
  Backend backend(net, fixed_config(0x1, 254));
  backend.tick(1000);

  RequestTicket a, b, c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                       0, [](Status, const Frame&) {}, &a);
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                       0, [](Status, const Frame&) {}, &b);
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                       0, [](Status, const Frame&) {}, &c);
  CHECK(a.sequence == 254);
  CHECK(b.sequence == 255);
  CHECK(c.sequence == 0);

  // Walk the counter all the way round; 254 and 255 are still owned.
  RequestTracker& tr = backend.tracker();
  uint8_t s = 0;
  for (int i = 0; i < 253; ++i) REQUIRE(tr.allocate_sequence(s));
  CHECK(s == 253);
  REQUIRE(tr.allocate_sequence(s));
  CHECK(s == 1);
}

TEST_CASE("Timeout fires at the deadline, not a millisecond before") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  REQUIRE(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                               100, capture(c)) == Status::Ok);
  backend.tick(1099);
  CHECK_FALSE(c.fired);
  backend.tick(1100);
  CHECK(c.fired);
  CHECK(c.status == Status::Timeout);
  CHECK(backend.tracker().in_flight() == 0);
  CHECK(backend.stats().timeouts == 1);

  backend.tick(5000);
  CHECK(c.calls == 1);
}

TEST_CASE("Backwards time does not rewind deadlines") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);
  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                       100, capture(c));
  backend.tick(10);
  CHECK(backend.now_ms() == 1000);
  CHECK_FALSE(c.fired);
}

TEST_CASE("Responses arriving out of send order resolve their own requests") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured first, second;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(first));
  backend.send_request(ep(1), hw(1), MessageType::GetLabel, {}, MessageType::StateLabel, 500, capture(second));
  REQUIRE(net.sent.size() == 2);

  LabelPayload l;
  l.label = "Porch";
  PowerPayload p;
  p.level = 65535;
  net.inject(encode(reply_to(net.sent[1], MessageType::StateLabel, to_bytes(l))), ep(1));
  net.inject(encode(reply_to(net.sent[0], MessageType::StatePower, to_bytes(p))), ep(1));
  backend.tick(1010);

  CHECK(first.status == Status::Ok);
  CHECK(first.frame.type() == MessageType::StatePower);
  CHECK(second.status == Status::Ok);
  CHECK(second.frame.type() == MessageType::StateLabel);
}

TEST_CASE("A response after the timeout is dropped as unsolicited") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 50, capture(c));
  backend.tick(1050);
  REQUIRE(c.status == Status::Timeout);

  net.inject(encode(reply_to(net.sent[0], MessageType::StatePower, to_bytes(PowerPayload{}))), ep(1));
  backend.tick(1060);
  CHECK(c.calls == 1);
  CHECK(backend.stats().dropped_unsolicited == 1);
}

TEST_CASE("Acknowledgement while a state reply is expected keeps waiting") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c));
  net.inject(encode(reply_to(net.sent[0], MessageType::Acknowledgement)), ep(1));
  backend.tick(1001);
  CHECK_FALSE(c.fired);

  net.inject(encode(reply_to(net.sent[0], MessageType::StatePower, to_bytes(PowerPayload{}))), ep(1));
  backend.tick(1002);
  CHECK(c.status == Status::Ok);
}

TEST_CASE("Malformed reply to our own request is surfaced to the caller") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c));
  Frame bad = reply_to(net.sent[0], MessageType::StatePower, {0x01});   // one byte short
  net.inject(encode(bad), ep(1));
  backend.tick(1001);
  CHECK(c.status == Status::MalformedFrame);
}

TEST_CASE("A reply of another type does not settle the request") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c));
  net.inject(encode(reply_to(net.sent[0], MessageType::StateLabel, to_bytes(LabelPayload{}))), ep(1));
  backend.tick(1001);
  CHECK_FALSE(c.fired);
  CHECK(backend.stats().dropped_unsolicited == 1);
  CHECK(backend.tracker().in_flight() == 1);

  net.inject(encode(reply_to(net.sent[0], MessageType::StatePower, to_bytes(PowerPayload{}))), ep(1));
  backend.tick(1002);
  CHECK(c.status == Status::Ok);
}

TEST_CASE("Late discovery answer on a reused sequence goes to discovery, not the request") {
  FakeTransport net;
  Backend backend(net, fixed_config(0x11223344, 0));
  backend.tick(1000);

  std::size_t found = 0;
  REQUIRE(backend.discover_lights(1000, [&](Device&) { ++found; }, [](Status, std::size_t) {}) == Status::Ok);

  // the broadcast took sequence 0; walk the counter round so it comes up again
  uint8_t s = 0;
  for (int i = 0; i < 255; ++i) REQUIRE(backend.tracker().allocate_sequence(s));
  Captured c;
  RequestTicket t;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c), &t);
  REQUIRE(t.sequence == 0);

  StateServicePayload svc;
  svc.port = DEFAULT_PORT;
  net.inject(encode(make_frame(backend.source_id(), hw(5), 0, MessageType::StateService, to_bytes(svc))), ep(5));
  backend.tick(1001);

  CHECK(found == 1);
  CHECK_FALSE(c.fired);
  CHECK(backend.tracker().in_flight(0));
}

TEST_CASE("Deadline counts from when the request is issued, not from the last tick") {
  ManualClock clock;
  FakeTransport net(&clock);
  Backend backend(net, fixed_config(), [&clock] { return clock.now; });
  backend.tick(clock.now);

  clock.now = 1060;
  Captured c;
  REQUIRE(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                               100, capture(c)) == Status::Ok);
  backend.tick(1100);
  CHECK_FALSE(c.fired);
  backend.tick(1159);
  CHECK_FALSE(c.fired);
  backend.tick(1160);
  CHECK(c.status == Status::Timeout);
}

TEST_CASE("A clock reading behind the last tick does not shorten deadlines") {
  ManualClock clock;
  clock.now = 500;
  FakeTransport net(&clock);
  Backend backend(net, fixed_config(), [&clock] { return clock.now; });
  backend.tick(1000);
  CHECK(backend.current_ms() == 1000);
}

TEST_CASE("Cancelling releases the slot and reports Cancelled once") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  RequestTicket t;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c), &t);
  REQUIRE(backend.cancel_request(t));
  CHECK(c.status == Status::Cancelled);
  CHECK_FALSE(backend.tracker().in_flight(t.sequence));
  CHECK_FALSE(backend.cancel_request(t));

  net.inject(encode(reply_to(net.sent[0], MessageType::StatePower, to_bytes(PowerPayload{}))), ep(1));
  backend.tick(1001);
  CHECK(c.calls == 1);
  CHECK(backend.stats().dropped_unsolicited == 1);
}

TEST_CASE("A full table rejects with Busy before any I/O") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  for (std::size_t i = 0; i < RequestTracker::MAX_IN_FLIGHT; ++i)
    REQUIRE(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower,
                                 0, [](Status, const Frame&) {}) == Status::Ok);
  const std::size_t sent = net.sent.size();
  bool fired = false;
  CHECK(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 0,
                             [&](Status, const Frame&) { fired = true; }) == Status::Busy);
  CHECK(net.sent.size() == sent);
  CHECK_FALSE(fired);
}

TEST_CASE("Send failure leaves nothing pending") {
  FakeTransport net;
  net.fail_send = true;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  bool fired = false;
  CHECK(backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 100,
                             [&](Status, const Frame&) { fired = true; }) == Status::NetworkError);
  CHECK(backend.tracker().in_flight() == 0);
  backend.tick(2000);
  CHECK_FALSE(fired);
}

TEST_CASE("Two backends keep their sequence spaces apart") {
  FakeTransport net_a, net_b;
  Backend a(net_a, fixed_config(0xA, 5));
  Backend b(net_b, fixed_config(0xB, 5));
  a.tick(1000);
  b.tick(1000);

  Captured ca, cb;
  a.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 100, capture(ca));
  b.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 100, capture(cb));

  // B's reply delivered to A: same sequence, different source, so not A's.
  net_a.inject(encode(reply_to(net_b.sent[0], MessageType::StatePower, to_bytes(PowerPayload{}))), ep(1));
  a.tick(1001);
  CHECK_FALSE(ca.fired);
  CHECK(a.stats().dropped_unsolicited == 1);
  CHECK(b.tracker().in_flight() == 1);
}

TEST_CASE("Garbage on the socket never disturbs pending requests") {
  FakeTransport net;
  Backend backend(net, fixed_config());
  backend.tick(1000);

  Captured c;
  backend.send_request(ep(1), hw(1), MessageType::GetPower, {}, MessageType::StatePower, 500, capture(c));
  net.inject({0x01, 0x02, 0x03}, ep(9));
  std::vector<uint8_t> junk(36, 0xFF);
  net.inject(junk, ep(9));
  backend.tick(1001);
  CHECK_FALSE(c.fired);
  CHECK(backend.stats().dropped_malformed == 2);
}
