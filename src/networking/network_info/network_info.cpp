#include "networking/network_info/network_info.h"

#include <algorithm>
#include <tuple>

namespace beacon
{
  namespace net
  {
    namespace
    {
      bool usable(const interface_address& ifa)
      {
        return ifa.up && !ifa.loopback && !ifa.address.is_loopback() && !ifa.address.is_unspecified();
      }
    } // namespace

    void sort_interfaces(std::vector<interface_address>& interfaces)
    {
      std::stable_sort(interfaces.begin(), interfaces.end(),
                       [](const interface_address& a, const interface_address& b)
                       {
                         return std::make_tuple(a.index, a.name, a.address.to_uint()) <
                                std::make_tuple(b.index, b.name, b.address.to_uint());
                       });
    }

    asio::ip::address_v4 select_ipv4(const std::vector<interface_address>& interfaces,
                                     config::interface_strategy strategy, const std::string& preferred_name)
    {
      if (strategy == config::interface_strategy::preferred_interface && !preferred_name.empty())
      {
        for (const auto& ifa : interfaces)
        {
          if (ifa.name == preferred_name && usable(ifa))
          {
            return ifa.address;
          }
        }
      }
      for (const auto& ifa : interfaces)
      {
        if (usable(ifa))
        {
          return ifa.address;
        }
      }
      throw no_interface_error("no non-loopback IPv4 interface is up");
    }

    asio::ip::address_v4 local_ipv4(config::interface_strategy strategy, const std::string& preferred_name)
    {
      return select_ipv4(enumerate_ipv4_interfaces(), strategy, preferred_name);
    }

  } // namespace net
} // namespace beacon
