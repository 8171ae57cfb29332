#pragma once

#include "config/discovery_config.h"

namespace beacon
{
  namespace flows
  {

    // Prints "<ip>:<port>" of the discovered responder on stdout.
    // Returns 0 on success, 1 on timeout or socket failure.
    int run_client(const config::discovery_config& config);

  } // namespace flows
} // namespace beacon
