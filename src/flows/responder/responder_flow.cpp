#include "flows/responder/responder_flow.h"

#include "networking/discovery/responder.h"
#include "networking/network_info/network_info.h"

#include <asio.hpp>

#include <csignal>
#include <iostream>
#include <system_error>
#include <thread>

namespace beacon
{
  namespace flows
  {

    int run_responder(const config::discovery_config& config)
    {
      if (config::secret_is_weak(config))
      {
        std::cerr << "[beacon] warning: secret is shorter than " << config::kRecommendedSecretLength
                  << " bytes" << std::endl;
      }

      try
      {
        net::discovery::responder r(config);
        r.start();

        asio::io_context signal_io;
        asio::signal_set signals(signal_io, SIGINT, SIGTERM);
        signals.async_wait(
            [&r](const asio::error_code& ec, int signo)
            {
              if (ec)
              {
                return;
              }
              std::cerr << "[beacon] signal " << signo << ", stopping" << std::endl;
              r.stop();
            });
        std::thread signal_thread([&signal_io] { signal_io.run(); });

        r.wait();

        // The loop may also end on a socket error; release the signal waiter.
        signals.cancel();
        signal_io.stop();
        signal_thread.join();

        if (r.failed())
        {
          std::cerr << "[beacon] responder stopped after a socket error" << std::endl;
          return 1;
        }
        std::cerr << "[beacon] responder " << net::discovery::to_string(r.state()) << std::endl;
        return 0;
      }
      catch (const net::no_interface_error& e)
      {
        std::cerr << "[beacon] " << e.what() << std::endl;
        return 1;
      }
      catch (const std::system_error& e)
      {
        std::cerr << "[beacon] " << e.what() << std::endl;
        return 1;
      }
    }

  } // namespace flows
} // namespace beacon
