#include "crypto/authenticator.h"
#include "protocol/probe_validator.h"
#include "test_support.h"

#include <algorithm>

using namespace beacon;
using namespace beacon::protocol;
using beacon::tests::assert_true;

namespace
{
  const char* kSecret = "test-secret-key-32chars-minimum!";
  const uint64_t kNow = 1700000000;

  config::discovery_config make_config(variant v)
  {
    config::discovery_config c;
    c.secret = kSecret;
    c.variant = v;
    c.ws_port = 8080;
    return c;
  }

  discovery_request make_request(uint64_t timestamp = kNow)
  {
    discovery_request r;
    r.nonce = 0x01020304;
    r.timestamp = timestamp;
    return r;
  }

  void test_variant_a_accepts_fresh_probe_and_signs_reply()
  {
    probe_validator validator(make_config(variant::a));
    discovery_request request = make_request();
    const bytes frame = sign_request(request, variant::a, kSecret);

    discovery_request accepted;
    assert_true(validator.validate(frame.data(), frame.size(), kNow, accepted) == probe_verdict::accepted,
                "a fresh A probe is accepted");
    assert_true(accepted.nonce == 0x01020304, "the accepted request is returned");

    const bytes reply = validator.build_response(accepted, {{192, 168, 1, 10}});
    assert_true(reply.size() == kResponseSizeA, "reply has the A response size");
    discovery_response response;
    assert_true(decode_response(reply, variant::a, response), "reply decodes");
    assert_true(response.ws_port == 8080, "reply carries the service port");
    assert_true(verify_response(response, variant::a, kSecret), "reply MAC verifies with the shared secret");
    assert_true(!verify_response(response, variant::a, "wrong-secret"), "reply MAC fails with another secret");
    assert_true(validator.config().ws_port == 8080, "the validator keeps its configuration");
  }

  void test_variant_b_checks_request_mac()
  {
    probe_validator validator(make_config(variant::b));
    discovery_request request = make_request();
    bytes frame = sign_request(request, variant::b, kSecret);
    assert_true(frame.size() == kRequestSizeB, "B probes carry a MAC");

    discovery_request accepted;
    assert_true(validator.validate(frame.data(), frame.size(), kNow, accepted) == probe_verdict::accepted,
                "a correctly signed B probe is accepted");

    discovery_request forged = make_request();
    const bytes bad = sign_request(forged, variant::b, "attacker-secret");
    assert_true(validator.validate(bad.data(), bad.size(), kNow, accepted) == probe_verdict::authentication_failure,
                "a probe signed with another secret is rejected");

    frame[20] ^= 0x01;
    assert_true(validator.validate(frame.data(), frame.size(), kNow, accepted) != probe_verdict::accepted,
                "a modified timestamp breaks the MAC");
  }

  void test_variant_b_reply_echoes_mac_prefix()
  {
    probe_validator validator(make_config(variant::b));
    discovery_request request = make_request();
    const bytes frame = sign_request(request, variant::b, kSecret);
    const bytes reply = validator.build_response(request, {{10, 1, 2, 3}});
    assert_true(reply.size() == kResponseSizeB, "reply has the B response size");
    assert_true(std::equal(frame.begin(), frame.begin() + 32, reply.begin()), "reply echoes 32 request bytes");

    discovery_response response;
    assert_true(decode_response(reply, variant::b, response), "reply decodes");
    assert_true(response.server_ip == ipv4_octets{{10, 1, 2, 3}}, "reply carries the address");
    assert_true(verify_response(response, variant::b, kSecret), "B replies pass on the echo alone");
  }

  void test_any_tampered_response_byte_fails()
  {
    probe_validator validator(make_config(variant::a));
    const bytes reply = validator.build_response(make_request(), {{192, 168, 1, 10}});
    for (std::size_t i = 0; i < reply.size(); ++i)
    {
      bytes tampered = reply;
      tampered[i] ^= 0x01;
      discovery_response response;
      assert_true(decode_response(tampered, variant::a, response), "tampered reply still has the right size");
      assert_true(!verify_response(response, variant::a, kSecret),
                  "flipping reply byte " + std::to_string(i) + " must break the MAC");
    }
  }

  void test_any_tampered_request_byte_fails()
  {
    discovery_request request = make_request();
    const bytes frame = sign_request(request, variant::b, kSecret);
    for (std::size_t i = 0; i < frame.size(); ++i)
    {
      bytes tampered = frame;
      tampered[i] ^= 0x80;
      discovery_request decoded;
      assert_true(decode_request(tampered, variant::b, decoded), "tampered request still has the right size");
      assert_true(!crypto::verify(request_signing_material(decoded), kSecret, decoded.hmac),
                  "flipping request byte " + std::to_string(i) + " must break the MAC");
    }
  }

  void test_rejection_order()
  {
    probe_validator validator(make_config(variant::b));
    discovery_request out;

    const bytes short_frame(59, 0);
    assert_true(validator.validate(short_frame.data(), short_frame.size(), kNow, out) == probe_verdict::format_error,
                "size is checked first");

    discovery_request stale = make_request(kNow - 31);
    const bytes unsigned_stale = encode_request(stale, variant::b);
    assert_true(validator.validate(unsigned_stale.data(), unsigned_stale.size(), kNow, out) ==
                    probe_verdict::replay_window_exceeded,
                "freshness is checked before the MAC");

    discovery_request edge = make_request(kNow - 30);
    const bytes edge_frame = sign_request(edge, variant::b, kSecret);
    assert_true(validator.validate(edge_frame.data(), edge_frame.size(), kNow, out) == probe_verdict::accepted,
                "a probe exactly at the window edge is accepted");
  }

  void test_verdict_names()
  {
    assert_true(std::string(to_string(probe_verdict::format_error)) == "format", "format");
    assert_true(std::string(to_string(probe_verdict::replay_window_exceeded)) == "replay_window", "replay_window");
    assert_true(std::string(to_string(probe_verdict::authentication_failure)) == "authentication", "authentication");
  }
} // namespace

void run_probe_validator_tests()
{
  test_variant_a_accepts_fresh_probe_and_signs_reply();
  test_variant_b_checks_request_mac();
  test_variant_b_reply_echoes_mac_prefix();
  test_any_tampered_response_byte_fails();
  test_any_tampered_request_byte_fails();
  test_rejection_order();
  test_verdict_names();
}
