#pragma once

#include "config/discovery_config.h"

namespace beacon
{
  namespace flows
  {

    // Serves discovery until SIGINT/SIGTERM. Returns the process exit code.
    int run_responder(const config::discovery_config& config);

  } // namespace flows
} // namespace beacon
