// authenticator: HMAC-SHA256 over packet fields with a shared secret.

#pragma once

#include "protocol/packet_codec.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace beacon
{
  namespace crypto
  {

    // Throws std::runtime_error if the underlying digest fails.
    protocol::mac sign(const protocol::bytes& material, const std::string& secret);

    // Constant-time comparison against a freshly computed MAC. A candidate
    // whose size is not 32 bytes never verifies.
    bool verify(const protocol::bytes& material, const std::string& secret, const uint8_t* candidate,
                std::size_t candidate_size);
    bool verify(const protocol::bytes& material, const std::string& secret, const protocol::mac& candidate);

  } // namespace crypto
} // namespace beacon
