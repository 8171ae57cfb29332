#pragma once

#include <chrono>
#include <cstdint>

namespace beacon
{
  namespace utils
  {
    namespace date
    {
      // Wall-clock seconds since the Unix epoch, the unit carried in probe timestamps.
      inline uint64_t now_seconds()
      {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
      }
    } // namespace date
  } // namespace utils
} // namespace beacon
