#include "protocol/replay_guard.h"

namespace beacon
{
  namespace protocol
  {

    bool is_fresh(uint64_t timestamp, uint64_t now, uint64_t window_seconds)
    {
      // Unsigned difference taken in the non-negative direction only.
      const uint64_t skew = now >= timestamp ? now - timestamp : timestamp - now;
      return skew <= window_seconds;
    }

    seen_nonce_cache::seen_nonce_cache(uint64_t window_seconds, std::size_t capacity)
        : window_seconds_(window_seconds), capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    bool seen_nonce_cache::insert(const discovery_request& request, uint64_t now)
    {
      const bytes header = request_signing_material(request);
      std::string key(header.begin(), header.end());

      std::lock_guard<std::mutex> lock(mutex_);
      evict_expired_(now);
      if (expires_by_key_.find(key) != expires_by_key_.end())
      {
        return false;
      }
      while (expires_by_key_.size() >= capacity_ && evict_oldest_())
      {
      }
      // A probe stops being replayable once its timestamp leaves the window.
      const uint64_t expires_at = request.timestamp + window_seconds_;
      expires_by_key_.emplace(key, expires_at);
      insertion_order_.push_back(entry{std::move(key), expires_at});
      return true;
    }

    std::size_t seen_nonce_cache::size() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return expires_by_key_.size();
    }

    void seen_nonce_cache::evict_expired_(uint64_t now)
    {
      for (auto it = expires_by_key_.begin(); it != expires_by_key_.end();)
      {
        if (it->second < now)
        {
          it = expires_by_key_.erase(it);
        }
        else
        {
          ++it;
        }
      }
      while (!insertion_order_.empty() && expires_by_key_.find(insertion_order_.front().key) == expires_by_key_.end())
      {
        insertion_order_.pop_front();
      }
    }

    bool seen_nonce_cache::evict_oldest_()
    {
      while (!insertion_order_.empty())
      {
        entry oldest = std::move(insertion_order_.front());
        insertion_order_.pop_front();
        auto it = expires_by_key_.find(oldest.key);
        if (it != expires_by_key_.end() && it->second == oldest.expires_at)
        {
          expires_by_key_.erase(it);
          return true;
        }
      }
      return false;
    }

  } // namespace protocol
} // namespace beacon
