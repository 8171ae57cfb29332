// probe_validator: the per-datagram decision of a responder, and the matching
// probe construction / response verification used by clients.
//
// Everything here is a pure function of its inputs (bytes, configuration,
// clock value, local address), so a single validator may be shared across
// threads.

#pragma once

#include "config/discovery_config.h"
#include "protocol/packet_codec.h"

#include <cstddef>
#include <cstdint>

namespace beacon
{
  namespace protocol
  {

    enum class probe_verdict
    {
      accepted,
      format_error,           // datagram size differs from the variant's request size
      replay_window_exceeded, // timestamp outside the tolerated skew
      authentication_failure, // request MAC mismatch (variant B)
      replayed                // exact repeat caught by the optional seen-nonce cache
    };

    const char* to_string(probe_verdict v);

    class probe_validator
    {
    public:
      explicit probe_validator(config::discovery_config config);

      // Steps 1-3: size, freshness, MAC. out is filled only when accepted.
      probe_verdict validate(const uint8_t* data, std::size_t size, uint64_t now, discovery_request& out) const;

      // Step 5: the reply frame for an accepted request, signed if the variant requires it.
      bytes build_response(const discovery_request& request, const ipv4_octets& server_ip) const;

      const config::discovery_config& config() const { return config_; }

    private:
      config::discovery_config config_;
    };

    // Encodes a probe, computing the request MAC first for variant B (request.hmac is updated).
    bytes sign_request(discovery_request& request, variant v, const std::string& secret);

    // Checks the response MAC for variant A. Variant B responses carry no MAC
    // and always pass; the echo match is the only binding.
    bool verify_response(const discovery_response& response, variant v, const std::string& secret);

  } // namespace protocol
} // namespace beacon
