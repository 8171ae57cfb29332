#include "flows/client/client_flow.h"

#include "networking/discovery/client.h"

#include <iostream>
#include <system_error>

namespace beacon
{
  namespace flows
  {

    int run_client(const config::discovery_config& config)
    {
      try
      {
        net::discovery::client c(config);
        const auto result = c.discover_with_retries(config.attempts);
        if (!result.ok())
        {
          std::cerr << "[beacon] no responder answered within " << config.timeout.count() << "ms";
          if (config.attempts > 1)
          {
            std::cerr << " (" << config.attempts << " attempts)";
          }
          std::cerr << std::endl;
          return 1;
        }
        std::cout << result.endpoint.to_string() << std::endl;
        return 0;
      }
      catch (const std::system_error& e)
      {
        std::cerr << "[beacon] " << e.what() << std::endl;
        return 1;
      }
    }

  } // namespace flows
} // namespace beacon
