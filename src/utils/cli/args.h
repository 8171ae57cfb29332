#pragma once

#include "config/discovery_config.h"

#include <string>

namespace beacon
{
  namespace cli
  {

    struct Options
    {
      std::string mode;        // "responder" or "client"
      std::string config_path; // JSON file applied before the flags below
      int port = -1;           // < 0: keep the configured value
      int ws_port = -1;
      std::string secret;
      std::string secret_file;
      std::string variant;
      long timeout_ms = -1;
      std::string target;
      std::string interface_name; // implies the "preferred" interface strategy
      int retries = -1;
      bool replay_cache = false;
      bool help = false;  // --help or -h
      bool valid = true;  // false if parsing error
      std::string error;  // optional error message
    };

    Options parse(int argc, char* argv[]);
    void print_usage(const char* program_name);

    // Defaults, then the config file, then the flags. Throws config::config_error.
    config::discovery_config build_config(const Options& opt);

  } // namespace cli
} // namespace beacon
