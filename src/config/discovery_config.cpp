#include "config/discovery_config.h"

#include <asio.hpp>

#include <fstream>
#include <limits>

namespace beacon
{
  namespace config
  {
    using json = nlohmann::json;

    namespace
    {
      std::string trim(const std::string& s)
      {
        const auto start = s.find_first_not_of(" \t\n\r");
        if (start == std::string::npos)
        {
          return "";
        }
        const auto end = s.find_last_not_of(" \t\n\r");
        return s.substr(start, end - start + 1);
      }

      uint16_t port_value(const json& j, const char* key, uint16_t fallback)
      {
        auto it = j.find(key);
        if (it == j.end())
        {
          return fallback;
        }
        if (!it->is_number_integer())
        {
          throw config_error(std::string("'") + key + "' must be an integer");
        }
        const auto v = it->get<int64_t>();
        if (v < 0 || v > std::numeric_limits<uint16_t>::max())
        {
          throw config_error(std::string("'") + key + "' is not a valid port: " + std::to_string(v));
        }
        return static_cast<uint16_t>(v);
      }

      int64_t positive_value(const json& j, const char* key, int64_t fallback)
      {
        auto it = j.find(key);
        if (it == j.end())
        {
          return fallback;
        }
        if (!it->is_number_integer() || it->get<int64_t>() <= 0)
        {
          throw config_error(std::string("'") + key + "' must be a positive integer");
        }
        return it->get<int64_t>();
      }

      std::string string_value(const json& j, const char* key, const std::string& fallback)
      {
        auto it = j.find(key);
        if (it == j.end())
        {
          return fallback;
        }
        if (!it->is_string())
        {
          throw config_error(std::string("'") + key + "' must be a string");
        }
        return it->get<std::string>();
      }
    } // namespace

    const char* to_string(interface_strategy s)
    {
      switch (s)
      {
      case interface_strategy::first_non_loopback:
        return "first";
      case interface_strategy::preferred_interface:
        return "preferred";
      }
      return "first";
    }

    bool interface_strategy_from_string(const std::string& s, interface_strategy& out)
    {
      if (s == "first")
      {
        out = interface_strategy::first_non_loopback;
        return true;
      }
      if (s == "preferred")
      {
        out = interface_strategy::preferred_interface;
        return true;
      }
      return false;
    }

    discovery_config from_json(const json& j, discovery_config base)
    {
      if (!j.is_object())
      {
        throw config_error("configuration root must be a JSON object");
      }
      discovery_config c = base;
      c.port = port_value(j, "port", c.port);
      c.ws_port = port_value(j, "ws_port", c.ws_port);
      c.secret = string_value(j, "secret", c.secret);

      const std::string secret_file = string_value(j, "secret_file", "");
      if (!secret_file.empty())
      {
        c.secret = read_secret_file(secret_file);
      }

      const std::string variant = string_value(j, "variant", protocol::to_string(c.variant));
      if (!protocol::variant_from_string(variant, c.variant))
      {
        throw config_error("'variant' must be \"a\" or \"b\", got \"" + variant + "\"");
      }

      c.window_seconds = static_cast<uint64_t>(positive_value(j, "window_seconds", static_cast<int64_t>(c.window_seconds)));
      c.timeout = std::chrono::milliseconds(positive_value(j, "timeout_ms", c.timeout.count()));
      c.attempts = static_cast<int>(positive_value(j, "attempts", c.attempts));
      c.target = string_value(j, "target", c.target);
      c.device_id = string_value(j, "device_id", c.device_id);

      const std::string strategy = string_value(j, "interface_strategy", to_string(c.strategy));
      if (!interface_strategy_from_string(strategy, c.strategy))
      {
        throw config_error("'interface_strategy' must be \"first\" or \"preferred\", got \"" + strategy + "\"");
      }
      c.preferred_interface = string_value(j, "preferred_interface", c.preferred_interface);

      auto it = j.find("replay_cache");
      if (it != j.end())
      {
        if (!it->is_boolean())
        {
          throw config_error("'replay_cache' must be a boolean");
        }
        c.replay_cache = it->get<bool>();
      }
      return c;
    }

    discovery_config load_file(const std::string& path, discovery_config base)
    {
      std::ifstream f(path);
      if (!f.is_open())
      {
        throw config_error("cannot open configuration file: " + path);
      }
      auto j = json::parse(f, nullptr, false);
      if (j.is_discarded())
      {
        throw config_error("configuration file is not valid JSON: " + path);
      }
      return from_json(j, base);
    }

    std::string read_secret_file(const std::string& path)
    {
      std::ifstream f(path);
      if (!f.is_open())
      {
        throw config_error("cannot open secret file: " + path);
      }
      std::string line;
      std::getline(f, line);
      return trim(line);
    }

    void validate(const discovery_config& config)
    {
      if (config.secret.empty())
      {
        throw config_error("a shared secret is required (--secret or --secret-file)");
      }
      if (config.window_seconds == 0)
      {
        throw config_error("replay window must be at least one second");
      }
      if (config.timeout.count() <= 0)
      {
        throw config_error("timeout must be positive");
      }
      if (config.attempts < 1)
      {
        throw config_error("attempts must be at least 1");
      }
      protocol::device_id id;
      if (!protocol::device_id_from_string(config.device_id, id))
      {
        throw config_error("device id is longer than 16 bytes");
      }
      asio::error_code ec;
      asio::ip::make_address_v4(config.target, ec);
      if (ec)
      {
        throw config_error("target is not an IPv4 address: " + config.target);
      }
      if (config.strategy == interface_strategy::preferred_interface && config.preferred_interface.empty())
      {
        throw config_error("the 'preferred' interface strategy needs an interface name");
      }
    }

    bool secret_is_weak(const discovery_config& config)
    {
      return config.secret.size() < kRecommendedSecretLength;
    }

  } // namespace config
} // namespace beacon
