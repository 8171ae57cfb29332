#include "protocol/packet_codec.h"
#include "test_support.h"

#include <algorithm>

using namespace beacon;
using namespace beacon::protocol;
using beacon::tests::assert_true;

namespace
{
  discovery_request sample_request()
  {
    discovery_request r;
    for (std::size_t i = 0; i < r.device.size(); ++i)
    {
      r.device[i] = static_cast<uint8_t>(0xA0 + i);
    }
    r.nonce = 0x01020304;
    r.timestamp = 0x0000000065A1B2C3ULL;
    for (std::size_t i = 0; i < r.hmac.size(); ++i)
    {
      r.hmac[i] = static_cast<uint8_t>(i);
    }
    return r;
  }

  void test_frame_sizes_are_fixed_per_variant()
  {
    assert_true(request_size(variant::a) == 28, "variant A request is 28 bytes");
    assert_true(response_size(variant::a) == 66, "variant A response is 66 bytes");
    assert_true(request_size(variant::b) == 60, "variant B request is 60 bytes");
    assert_true(response_size(variant::b) == 38, "variant B response is 38 bytes");
    assert_true(encode_request(sample_request(), variant::a).size() == 28, "encoded A request size");
    assert_true(encode_request(sample_request(), variant::b).size() == 60, "encoded B request size");
  }

  void test_request_fields_are_big_endian()
  {
    const bytes frame = encode_request(sample_request(), variant::a);
    assert_true(frame[0] == 0xA0 && frame[15] == 0xAF, "device id occupies bytes 0..15");
    assert_true(frame[16] == 0x01 && frame[17] == 0x02 && frame[18] == 0x03 && frame[19] == 0x04,
                "nonce is big-endian at offset 16");
    assert_true(frame[20] == 0 && frame[23] == 0 && frame[24] == 0x65 && frame[27] == 0xC3,
                "timestamp is big-endian at offset 20");

    const bytes signed_frame = encode_request(sample_request(), variant::b);
    assert_true(signed_frame[28] == 0 && signed_frame[59] == 31, "variant B MAC follows the header");
  }

  void test_decode_rejects_wrong_sizes()
  {
    discovery_request untouched;
    untouched.nonce = 77;
    bytes frame = encode_request(sample_request(), variant::a);

    bytes short_frame(frame.begin(), frame.end() - 1);
    assert_true(!decode_request(short_frame, variant::a, untouched), "27-byte request must be rejected");
    bytes long_frame = frame;
    long_frame.push_back(0);
    assert_true(!decode_request(long_frame, variant::a, untouched), "29-byte request must be rejected");
    assert_true(!decode_request(frame, variant::b, untouched), "A-sized frame is not a B request");
    assert_true(untouched.nonce == 77, "a rejected frame leaves the output untouched");

    discovery_response response;
    assert_true(!decode_response(bytes(65, 0), variant::a, response), "65-byte response must be rejected");
    assert_true(!decode_response(bytes(39, 0), variant::b, response), "39-byte response must be rejected");
    assert_true(!decode_request(nullptr, 28, variant::a, untouched), "null data must be rejected");
  }

  void test_request_decode_recovers_fields()
  {
    const discovery_request original = sample_request();
    discovery_request decoded;
    assert_true(decode_request(encode_request(original, variant::b), variant::b, decoded), "B request decodes");
    assert_true(decoded == original, "B request keeps every field");
    assert_true(decoded != discovery_request(), "a decoded request differs from an empty one");

    assert_true(decode_request(encode_request(original, variant::a), variant::a, decoded), "A request decodes");
    assert_true(decoded.nonce == original.nonce && decoded.device == original.device, "A request keeps the header");
    assert_true(decoded.hmac == mac{}, "A request carries no MAC");
  }

  void test_variant_a_response_layout()
  {
    discovery_response r = make_echo(sample_request());
    r.server_ip = {{192, 168, 1, 42}};
    r.ws_port = 8080;
    r.hmac.fill(0xEE);
    const bytes frame = encode_response(r, variant::a);

    assert_true(frame.size() == 66, "A response size");
    const bytes request = encode_request(sample_request(), variant::a);
    assert_true(std::equal(request.begin(), request.end(), frame.begin()), "A response echoes the whole request");
    assert_true(frame[28] == 192 && frame[31] == 42, "server ip follows the echo");
    assert_true(frame[32] == 0x1F && frame[33] == 0x90, "ws port is big-endian after the ip");
    assert_true(frame[34] == 0xEE && frame[65] == 0xEE, "MAC closes the frame");

    discovery_response decoded;
    assert_true(decode_response(frame, variant::a, decoded), "A response decodes");
    assert_true(decoded.server_ip == r.server_ip && decoded.ws_port == 8080 && decoded.hmac == r.hmac,
                "A response fields survive decoding");
  }

  void test_variant_b_response_layout()
  {
    const discovery_request request = sample_request();
    discovery_response r = make_echo(request);
    r.server_ip = {{10, 0, 0, 7}};
    r.ws_port = 9000;
    const bytes frame = encode_response(r, variant::b);

    assert_true(frame.size() == 38, "B response size");
    const bytes wire_request = encode_request(request, variant::b);
    assert_true(std::equal(wire_request.begin(), wire_request.begin() + 32, frame.begin()),
                "B response echoes the first 32 request bytes");
    assert_true(frame[32] == 0x23 && frame[33] == 0x28, "ws port follows the echo");
    assert_true(frame[34] == 10 && frame[37] == 7, "server ip closes the frame");

    discovery_response decoded;
    assert_true(decode_response(frame, variant::b, decoded), "B response decodes");
    assert_true(decoded == r, "B response keeps every field");
    decoded.ws_port = 9001;
    assert_true(decoded != r, "a changed port makes responses differ");
  }

  void test_echo_prefix_pairs_request_and_response()
  {
    const discovery_request request = sample_request();
    discovery_response response = make_echo(request);
    response.server_ip = {{1, 2, 3, 4}};
    assert_true(echo_prefix(request, variant::a) == echo_prefix(response, variant::a), "A prefixes match");
    assert_true(echo_prefix(request, variant::b) == echo_prefix(response, variant::b), "B prefixes match");

    discovery_request other = request;
    other.nonce += 1;
    assert_true(echo_prefix(other, variant::a) != echo_prefix(response, variant::a),
                "a different nonce yields a different prefix");
  }

  void test_response_signing_material_covers_echo_ip_and_port()
  {
    discovery_response r = make_echo(sample_request());
    r.server_ip = {{192, 168, 0, 5}};
    r.ws_port = 8080;
    const bytes material = response_signing_material(r);
    assert_true(material.size() == 34, "material is echo, ip and port");
    assert_true(request_signing_material(sample_request()).size() == 28, "request material is the header");
  }

  void test_device_id_from_string()
  {
    device_id id;
    assert_true(device_id_from_string("kitchen", id), "short ids are accepted");
    assert_true(id[0] == 'k' && id[6] == 'n' && id[7] == 0 && id[15] == 0, "short ids are zero padded");
    assert_true(!device_id_from_string("seventeen-bytes-x", id), "ids over 16 bytes are refused");
  }

  void test_variant_names()
  {
    variant v = variant::a;
    assert_true(variant_from_string("b", v) && v == variant::b, "'b' parses");
    assert_true(variant_from_string("A", v) && v == variant::a, "'A' parses");
    assert_true(!variant_from_string("c", v), "unknown variant refused");
    assert_true(std::string(to_string(variant::b)) == "b", "variant name");
  }
} // namespace

void run_packet_codec_tests()
{
  test_frame_sizes_are_fixed_per_variant();
  test_request_fields_are_big_endian();
  test_decode_rejects_wrong_sizes();
  test_request_decode_recovers_fields();
  test_variant_a_response_layout();
  test_variant_b_response_layout();
  test_echo_prefix_pairs_request_and_response();
  test_response_signing_material_covers_echo_ip_and_port();
  test_device_id_from_string();
  test_variant_names();
}
