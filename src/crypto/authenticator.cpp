#include "crypto/authenticator.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace beacon
{
  namespace crypto
  {

    protocol::mac sign(const protocol::bytes& material, const std::string& secret)
    {
      protocol::mac out{};
      unsigned int out_len = 0;
      // std::string::data() is never null, which keeps HMAC() happy with an empty key.
      const unsigned char* digest =
          HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()), material.data(), material.size(),
               out.data(), &out_len);
      if (!digest || out_len != out.size())
      {
        throw std::runtime_error("HMAC-SHA256 computation failed");
      }
      return out;
    }

    bool verify(const protocol::bytes& material, const std::string& secret, const uint8_t* candidate,
                std::size_t candidate_size)
    {
      if (!candidate || candidate_size != protocol::kMacSize)
      {
        return false;
      }
      const protocol::mac expected = sign(material, secret);
      return CRYPTO_memcmp(expected.data(), candidate, expected.size()) == 0;
    }

    bool verify(const protocol::bytes& material, const std::string& secret, const protocol::mac& candidate)
    {
      return verify(material, secret, candidate.data(), candidate.size());
    }

  } // namespace crypto
} // namespace beacon
