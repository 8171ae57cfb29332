#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace beacon
{
  namespace utils
  {
    // Per-thread engine seeded from the OS; probes fired within the same second must not collide.
    inline std::mt19937_64& random_engine()
    {
      thread_local std::mt19937_64 rng{(static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}()};
      return rng;
    }

    inline std::string get_random_id(std::size_t length = 16)
    {
      const char charset[] = "0123456789"
                             "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                             "abcdefghijklmnopqrstuvwxyz";
      const std::size_t max_index = (sizeof(charset) - 1);
      std::string random_id;
      random_id.reserve(length);

      std::uniform_int_distribution<std::size_t> dist(0, max_index - 1);
      for (std::size_t i = 0; i < length; ++i)
      {
        random_id += charset[dist(random_engine())];
      }

      return random_id;
    }

    inline uint32_t random_u32()
    {
      std::uniform_int_distribution<uint32_t> dist;
      return dist(random_engine());
    }

  } // namespace utils
} // namespace beacon
