// POSIX interface enumeration (Linux, macOS) via getifaddrs.
#if !defined(_WIN32)
#include "../network_info.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <system_error>

namespace beacon
{
  namespace net
  {

    std::vector<interface_address> enumerate_ipv4_interfaces()
    {
      ifaddrs* ifaddr = nullptr;
      if (getifaddrs(&ifaddr) != 0)
      {
        throw std::system_error(errno, std::generic_category(), "getifaddrs");
      }

      std::vector<interface_address> out;
      for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
      {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
        {
          continue;
        }
        const auto* a = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        interface_address entry;
        entry.name = ifa->ifa_name ? ifa->ifa_name : "";
        entry.index = entry.name.empty() ? 0 : if_nametoindex(entry.name.c_str());
        entry.address = asio::ip::address_v4(ntohl(a->sin_addr.s_addr));
        entry.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        entry.up = (ifa->ifa_flags & IFF_UP) != 0;
        out.push_back(entry);
      }
      freeifaddrs(ifaddr);

      sort_interfaces(out);
      return out;
    }

  } // namespace net
} // namespace beacon

#endif // POSIX
