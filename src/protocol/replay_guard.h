// replay_guard: time-window freshness check for probe timestamps, plus an
// optional seen-probe cache.
//
// The documented protocol only bounds packet age, so an identical probe is
// accepted again for as long as its timestamp stays inside the window. The
// seen_nonce_cache closes that gap on the responder side; it is an extension
// of the protocol and is only used when enabled in the configuration.

#pragma once

#include "protocol/packet_codec.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace beacon
{
  namespace protocol
  {

    static const uint64_t kDefaultWindowSeconds = 30;

    // True when |now - timestamp| <= window_seconds (inclusive, either direction).
    bool is_fresh(uint64_t timestamp, uint64_t now, uint64_t window_seconds = kDefaultWindowSeconds);

    class seen_nonce_cache
    {
    public:
      explicit seen_nonce_cache(uint64_t window_seconds = kDefaultWindowSeconds, std::size_t capacity = 4096);

      // Records the probe and returns true if it has not been seen while still
      // fresh. Returns false for an exact repeat.
      bool insert(const discovery_request& request, uint64_t now);

      std::size_t size() const;

    private:
      struct entry
      {
        std::string key;
        uint64_t expires_at;
      };

      void evict_expired_(uint64_t now);
      bool evict_oldest_();

      uint64_t window_seconds_;
      std::size_t capacity_;
      mutable std::mutex mutex_;
      std::unordered_map<std::string, uint64_t> expires_by_key_;
      std::deque<entry> insertion_order_;
    };

  } // namespace protocol
} // namespace beacon
