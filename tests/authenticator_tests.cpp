#include "crypto/authenticator.h"
#include "test_support.h"

#include <cstdio>

using namespace beacon;
using beacon::tests::assert_true;

namespace
{
  std::string hex(const protocol::mac& m)
  {
    std::string out;
    char buf[3];
    for (auto b : m)
    {
      std::snprintf(buf, sizeof(buf), "%02x", b);
      out += buf;
    }
    return out;
  }

  protocol::bytes as_bytes(const std::string& s)
  {
    return protocol::bytes(s.begin(), s.end());
  }

  // RFC 4231 test case 2.
  void test_sign_matches_reference_vector()
  {
    const auto m = crypto::sign(as_bytes("what do ya want for nothing?"), "Jefe");
    assert_true(hex(m) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                "HMAC-SHA256 must match the RFC 4231 vector");
  }

  void test_verify_accepts_own_signature()
  {
    const std::string secret = "test-secret-key-32chars-minimum!";
    const auto material = as_bytes("probe header");
    const auto m = crypto::sign(material, secret);
    assert_true(crypto::verify(material, secret, m), "a fresh signature verifies");
  }

  void test_verify_rejects_tampering()
  {
    const std::string secret = "test-secret-key-32chars-minimum!";
    const auto material = as_bytes("probe header");
    auto m = crypto::sign(material, secret);

    assert_true(!crypto::verify(material, "other-secret", m), "a different secret fails");
    assert_true(!crypto::verify(as_bytes("probe headeR"), secret, m), "changed material fails");
    m[31] ^= 0x01;
    assert_true(!crypto::verify(material, secret, m), "a flipped MAC bit fails");
  }

  void test_verify_rejects_wrong_length_candidates()
  {
    const std::string secret = "s";
    const auto material = as_bytes("x");
    const auto m = crypto::sign(material, secret);
    assert_true(!crypto::verify(material, secret, m.data(), 31), "a truncated MAC never verifies");
    assert_true(!crypto::verify(material, secret, nullptr, 0), "an empty MAC never verifies");
    assert_true(crypto::verify(material, secret, m.data(), m.size()), "the full MAC verifies");
  }
} // namespace

void run_authenticator_tests()
{
  test_sign_matches_reference_vector();
  test_verify_accepts_own_signature();
  test_verify_rejects_tampering();
  test_verify_rejects_wrong_length_candidates();
}
