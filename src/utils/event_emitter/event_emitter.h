// event_emitter: thread-safe pub/sub for outcome notifications. Callbacks run on
// the emitting thread (the responder's I/O thread), outside the internal lock.
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace beacon
{
  namespace utils
  {

    template <typename EventT> class event_emitter
    {
    public:
      using callback_t = std::function<void(const EventT&)>;
      using subscription_id = std::uint64_t;

      // Unsubscribes when it goes out of scope. Must not outlive the emitter.
      class scoped_subscription
      {
      public:
        scoped_subscription() = default;
        scoped_subscription(event_emitter* owner, subscription_id id) : owner_(owner), id_(id) {}
        scoped_subscription(scoped_subscription&& other) noexcept : owner_(other.owner_), id_(other.id_)
        {
          other.owner_ = nullptr;
        }
        scoped_subscription& operator=(scoped_subscription&& other) noexcept
        {
          if (this != &other)
          {
            reset();
            owner_ = other.owner_;
            id_ = other.id_;
            other.owner_ = nullptr;
          }
          return *this;
        }
        scoped_subscription(const scoped_subscription&) = delete;
        scoped_subscription& operator=(const scoped_subscription&) = delete;
        ~scoped_subscription() { reset(); }

        void reset()
        {
          if (owner_)
          {
            owner_->unsubscribe(id_);
            owner_ = nullptr;
          }
        }

      private:
        event_emitter* owner_{nullptr};
        subscription_id id_{0};
      };

      subscription_id subscribe(callback_t cb)
      {
        auto entry = std::make_shared<const callback_t>(std::move(cb));
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = ++next_id_;
        subscribers_.push_back({id, std::move(entry)});
        return id;
      }

      scoped_subscription subscribe_scoped(callback_t cb) { return scoped_subscription(this, subscribe(std::move(cb))); }

      void unsubscribe(subscription_id id)
      {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it)
        {
          if (it->first == id)
          {
            subscribers_.erase(it);
            return;
          }
        }
      }

      void emit(const EventT& ev)
      {
        std::vector<std::shared_ptr<const callback_t>> snapshot;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          snapshot.reserve(subscribers_.size());
          for (const auto& s : subscribers_)
          {
            snapshot.push_back(s.second);
          }
        }
        for (const auto& cb : snapshot)
        {
          if (*cb)
          {
            (*cb)(ev);
          }
        }
      }

      std::size_t subscriber_count() const
      {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
      }

    private:
      mutable std::mutex mutex_;
      std::vector<std::pair<subscription_id, std::shared_ptr<const callback_t>>> subscribers_;
      subscription_id next_id_{0};
    };

  } // namespace utils
} // namespace beacon
