// packet_codec: fixed-size discovery frames <-> structured records. No I/O.
//
// Variant A (default)
//   request  [device_id:16][nonce:4][timestamp:8]                          28 bytes
//   response [request:28][server_ip:4][ws_port:2][hmac:32]                 66 bytes
// Variant B
//   request  [device_id:16][nonce:4][timestamp:8][hmac:32]                 60 bytes
//   response [request[0..32):32][ws_port:2][server_ip:4]                   38 bytes
//
// All integers are big-endian. A frame whose size differs from the variant's
// fixed size is rejected before any field is read.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace beacon
{
  namespace protocol
  {

    enum class variant
    {
      a,
      b
    };

    const char* to_string(variant v);
    bool variant_from_string(const std::string& s, variant& out);

    static const std::size_t kDeviceIdSize = 16;
    static const std::size_t kNonceSize = 4;
    static const std::size_t kTimestampSize = 8;
    static const std::size_t kMacSize = 32;
    static const std::size_t kIpv4Size = 4;
    static const std::size_t kPortSize = 2;

    // device_id + nonce + timestamp
    static const std::size_t kProbeHeaderSize = kDeviceIdSize + kNonceSize + kTimestampSize;
    // Variant B echoes the header plus the leading bytes of the request MAC
    static const std::size_t kMacEchoSize = 4;

    static const std::size_t kRequestSizeA = kProbeHeaderSize;
    static const std::size_t kResponseSizeA = kProbeHeaderSize + kIpv4Size + kPortSize + kMacSize;
    static const std::size_t kRequestSizeB = kProbeHeaderSize + kMacSize;
    static const std::size_t kResponseSizeB = kProbeHeaderSize + kMacEchoSize + kPortSize + kIpv4Size;

    std::size_t request_size(variant v);
    std::size_t response_size(variant v);
    // Number of leading request bytes a response carries back verbatim.
    std::size_t echo_size(variant v);

    using bytes = std::vector<uint8_t>;
    using device_id = std::array<uint8_t, kDeviceIdSize>;
    using mac = std::array<uint8_t, kMacSize>;
    using ipv4_octets = std::array<uint8_t, kIpv4Size>;

    struct discovery_request
    {
      device_id device{};
      uint32_t nonce = 0;
      uint64_t timestamp = 0; // seconds since epoch
      mac hmac{};             // variant B only; zero for variant A
    };

    struct discovery_response
    {
      // Echoed probe fields
      device_id device{};
      uint32_t nonce = 0;
      uint64_t timestamp = 0;
      std::array<uint8_t, kMacEchoSize> mac_echo{}; // variant B only

      ipv4_octets server_ip{};
      uint16_t ws_port = 0;
      mac hmac{}; // variant A only
    };

    bool operator==(const discovery_request& lhs, const discovery_request& rhs);
    bool operator!=(const discovery_request& lhs, const discovery_request& rhs);
    bool operator==(const discovery_response& lhs, const discovery_response& rhs);
    bool operator!=(const discovery_response& lhs, const discovery_response& rhs);

    bytes encode_request(const discovery_request& request, variant v);
    // Returns false (and leaves out untouched) when size != request_size(v).
    bool decode_request(const uint8_t* data, std::size_t size, variant v, discovery_request& out);
    bool decode_request(const bytes& data, variant v, discovery_request& out);

    bytes encode_response(const discovery_response& response, variant v);
    // Returns false (and leaves out untouched) when size != response_size(v).
    bool decode_response(const uint8_t* data, std::size_t size, variant v, discovery_response& out);
    bool decode_response(const bytes& data, variant v, discovery_response& out);

    // Bytes covered by the variant B request MAC: device_id || nonce || timestamp.
    bytes request_signing_material(const discovery_request& request);
    // Bytes covered by the variant A response MAC: echoed request || server_ip || ws_port.
    bytes response_signing_material(const discovery_response& response);

    // The request prefix that a matching response must echo, as produced by
    // each side. Equal prefixes pair a response with its probe.
    bytes echo_prefix(const discovery_request& request, variant v);
    bytes echo_prefix(const discovery_response& response, variant v);

    // Fills the echoed fields of a response from the request it answers.
    discovery_response make_echo(const discovery_request& request);

    // Device ids are opaque; text ids shorter than 16 bytes are zero padded.
    bool device_id_from_string(const std::string& s, device_id& out);

  } // namespace protocol
} // namespace beacon
