// network_info: picks the IPv4 address a responder advertises to clients.

#pragma once

#include "config/discovery_config.h"

#include <asio.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace beacon
{
  namespace net
  {

    struct interface_address
    {
      std::string name;
      unsigned int index{0};
      asio::ip::address_v4 address;
      bool loopback{false};
      bool up{false};
    };

    // No usable (up, non-loopback) IPv4 interface. Fatal for a responder at startup.
    class no_interface_error : public std::runtime_error
    {
    public:
      using std::runtime_error::runtime_error;
    };

    // Orders by interface index, then name, then address, so selection does not
    // depend on the order the OS happens to report.
    void sort_interfaces(std::vector<interface_address>& interfaces);

    // All IPv4 interface addresses on this host, sorted. Throws std::system_error
    // if the OS enumeration itself fails.
    std::vector<interface_address> enumerate_ipv4_interfaces();

    // Applies the strategy to an already ordered list. Throws no_interface_error.
    asio::ip::address_v4 select_ipv4(const std::vector<interface_address>& interfaces,
                                     config::interface_strategy strategy, const std::string& preferred_name);

    asio::ip::address_v4 local_ipv4(config::interface_strategy strategy, const std::string& preferred_name);

  } // namespace net
} // namespace beacon
