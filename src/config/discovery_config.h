// discovery_config: the immutable settings shared by responder and client.
// Built once at startup (JSON file, then command-line overrides) and passed by
// value into every component.

#pragma once

#include "protocol/packet_codec.h"
#include "protocol/replay_guard.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace beacon
{
  namespace config
  {

    static const uint16_t kDefaultDiscoveryPort = 5354;
    static const uint16_t kDefaultServicePort = 8080;
    static const std::size_t kRecommendedSecretLength = 32;

    enum class interface_strategy
    {
      first_non_loopback,
      preferred_interface
    };

    const char* to_string(interface_strategy s);
    bool interface_strategy_from_string(const std::string& s, interface_strategy& out);

    struct discovery_config
    {
      uint16_t port = kDefaultDiscoveryPort;  // UDP discovery port; 0 binds an ephemeral port
      uint16_t ws_port = kDefaultServicePort; // service port embedded in responses
      std::string secret;
      protocol::variant variant = protocol::variant::a;
      uint64_t window_seconds = protocol::kDefaultWindowSeconds;

      // client side
      std::chrono::milliseconds timeout{3000};
      std::string target = "255.255.255.255";
      std::string device_id; // empty: random per client instance
      int attempts = 1;

      // responder side
      interface_strategy strategy = interface_strategy::first_non_loopback;
      std::string preferred_interface;
      bool replay_cache = false;
    };

    class config_error : public std::runtime_error
    {
    public:
      using std::runtime_error::runtime_error;
    };

    // Overlays the keys present in j onto base. Throws config_error on a
    // wrongly typed or out-of-range value.
    discovery_config from_json(const nlohmann::json& j, discovery_config base = discovery_config());
    discovery_config load_file(const std::string& path, discovery_config base = discovery_config());

    // First line of the file with surrounding whitespace removed.
    std::string read_secret_file(const std::string& path);

    // Throws config_error when the configuration cannot be used.
    void validate(const discovery_config& config);

    bool secret_is_weak(const discovery_config& config);

  } // namespace config
} // namespace beacon
