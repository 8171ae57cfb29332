#include "protocol/probe_validator.h"

#include "crypto/authenticator.h"
#include "protocol/replay_guard.h"

namespace beacon
{
  namespace protocol
  {

    const char* to_string(probe_verdict v)
    {
      switch (v)
      {
      case probe_verdict::accepted:
        return "accepted";
      case probe_verdict::format_error:
        return "format";
      case probe_verdict::replay_window_exceeded:
        return "replay_window";
      case probe_verdict::authentication_failure:
        return "authentication";
      case probe_verdict::replayed:
        return "replayed";
      }
      return "unknown";
    }

    probe_validator::probe_validator(config::discovery_config config) : config_(std::move(config))
    {
    }

    probe_verdict probe_validator::validate(const uint8_t* data, std::size_t size, uint64_t now,
                                            discovery_request& out) const
    {
      discovery_request request;
      if (!decode_request(data, size, config_.variant, request))
      {
        return probe_verdict::format_error;
      }
      if (!is_fresh(request.timestamp, now, config_.window_seconds))
      {
        return probe_verdict::replay_window_exceeded;
      }
      if (config_.variant == variant::b &&
          !crypto::verify(request_signing_material(request), config_.secret, request.hmac))
      {
        return probe_verdict::authentication_failure;
      }
      out = request;
      return probe_verdict::accepted;
    }

    bytes probe_validator::build_response(const discovery_request& request, const ipv4_octets& server_ip) const
    {
      discovery_response response = make_echo(request);
      response.server_ip = server_ip;
      response.ws_port = config_.ws_port;
      if (config_.variant == variant::a)
      {
        response.hmac = crypto::sign(response_signing_material(response), config_.secret);
      }
      return encode_response(response, config_.variant);
    }

    bytes sign_request(discovery_request& request, variant v, const std::string& secret)
    {
      if (v == variant::b)
      {
        request.hmac = crypto::sign(request_signing_material(request), secret);
      }
      else
      {
        request.hmac = mac{};
      }
      return encode_request(request, v);
    }

    bool verify_response(const discovery_response& response, variant v, const std::string& secret)
    {
      if (v == variant::b)
      {
        return true;
      }
      return crypto::verify(response_signing_material(response), secret, response.hmac);
    }

  } // namespace protocol
} // namespace beacon
