#include "utils/cli/args.h"

#include <iostream>
#include <stdexcept>

namespace beacon
{
  namespace cli
  {

    static void set_error(Options& o, std::string msg)
    {
      o.valid = false;
      o.error = std::move(msg);
    }

    static bool parse_number(const char* text, long& out)
    {
      try
      {
        std::size_t used = 0;
        const std::string s(text);
        out = std::stol(s, &used);
        return used == s.size();
      }
      catch (const std::logic_error&)
      {
        // std::invalid_argument or std::out_of_range
        return false;
      }
    }

    Options parse(int argc, char* argv[])
    {
      Options opt{};
      for (int i = 1; i < argc; ++i)
      {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        long number = 0;
        if ((arg == "--mode" || arg == "-m") && has_value)
        {
          opt.mode = argv[++i];
        }
        else if ((arg == "--config" || arg == "-c") && has_value)
        {
          opt.config_path = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && has_value)
        {
          if (!parse_number(argv[++i], number) || number < 0 || number > 65535)
          {
            set_error(opt, "Invalid --port value");
            return opt;
          }
          opt.port = static_cast<int>(number);
        }
        else if (arg == "--ws-port" && has_value)
        {
          if (!parse_number(argv[++i], number) || number < 0 || number > 65535)
          {
            set_error(opt, "Invalid --ws-port value");
            return opt;
          }
          opt.ws_port = static_cast<int>(number);
        }
        else if (arg == "--secret" && has_value)
        {
          opt.secret = argv[++i];
        }
        else if (arg == "--secret-file" && has_value)
        {
          opt.secret_file = argv[++i];
        }
        else if (arg == "--variant" && has_value)
        {
          opt.variant = argv[++i];
        }
        else if (arg == "--timeout-ms" && has_value)
        {
          if (!parse_number(argv[++i], number) || number <= 0)
          {
            set_error(opt, "Invalid --timeout-ms value");
            return opt;
          }
          opt.timeout_ms = number;
        }
        else if (arg == "--target" && has_value)
        {
          opt.target = argv[++i];
        }
        else if (arg == "--interface" && has_value)
        {
          opt.interface_name = argv[++i];
        }
        else if (arg == "--retries" && has_value)
        {
          if (!parse_number(argv[++i], number) || number < 0 || number > 100)
          {
            set_error(opt, "Invalid --retries value");
            return opt;
          }
          opt.retries = static_cast<int>(number);
        }
        else if (arg == "--replay-cache")
        {
          opt.replay_cache = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
          opt.help = true;
        }
        else
        {
          set_error(opt, std::string("Unknown argument: ") + arg);
          return opt;
        }
      }
      if (!opt.help && opt.mode != "responder" && opt.mode != "client")
      {
        set_error(opt, "--mode must be 'responder' or 'client'");
      }
      return opt;
    }

    void print_usage(const char* program_name)
    {
      std::cout << "Usage: " << program_name << " --mode <responder|client> [options]\n"
                << "  --config <file>       JSON configuration, applied before the flags below\n"
                << "  --port <port>         UDP discovery port (default " << config::kDefaultDiscoveryPort << ")\n"
                << "  --ws-port <port>      service port advertised by the responder (default "
                << config::kDefaultServicePort << ")\n"
                << "  --secret <text>       shared secret\n"
                << "  --secret-file <file>  read the shared secret from the first line of a file\n"
                << "  --variant <a|b>       wire variant (default a)\n"
                << "  --timeout-ms <ms>     client wait per probe (default 3000)\n"
                << "  --target <ipv4>       client probe destination (default 255.255.255.255)\n"
                << "  --retries <n>         client re-probes after a timeout (default 0)\n"
                << "  --interface <name>    responder advertises this interface's address\n"
                << "  --replay-cache        responder drops exact repeats of an accepted probe"
                << std::endl;
    }

    config::discovery_config build_config(const Options& opt)
    {
      config::discovery_config c;
      if (!opt.config_path.empty())
      {
        c = config::load_file(opt.config_path, c);
      }
      if (opt.port >= 0)
      {
        c.port = static_cast<uint16_t>(opt.port);
      }
      if (opt.ws_port >= 0)
      {
        c.ws_port = static_cast<uint16_t>(opt.ws_port);
      }
      if (!opt.secret_file.empty())
      {
        c.secret = config::read_secret_file(opt.secret_file);
      }
      if (!opt.secret.empty())
      {
        c.secret = opt.secret;
      }
      if (!opt.variant.empty() && !protocol::variant_from_string(opt.variant, c.variant))
      {
        throw config::config_error("--variant must be 'a' or 'b'");
      }
      if (opt.timeout_ms > 0)
      {
        c.timeout = std::chrono::milliseconds(opt.timeout_ms);
      }
      if (!opt.target.empty())
      {
        c.target = opt.target;
      }
      if (!opt.interface_name.empty())
      {
        c.strategy = config::interface_strategy::preferred_interface;
        c.preferred_interface = opt.interface_name;
      }
      if (opt.retries >= 0)
      {
        c.attempts = opt.retries + 1;
      }
      if (opt.replay_cache)
      {
        c.replay_cache = true;
      }
      config::validate(c);
      return c;
    }

  } // namespace cli
} // namespace beacon
