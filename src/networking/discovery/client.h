// client: finds a responder by broadcasting a signed probe and waiting for a
// verified answer.
//
// One UDP socket is shared by every probe of a client. A background I/O thread
// receives responses and hands each one to the probe whose bytes it echoes, so
// overlapping discover() calls from several threads never receive each other's
// answers.

#pragma once

#include "config/discovery_config.h"
#include "protocol/packet_codec.h"

#include <asio.hpp>

#include <array>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace beacon
{
  namespace net
  {
    namespace discovery
    {

      enum class probe_state
      {
        idle,
        broadcasting,
        waiting_response,
        timed_out,
        verified
      };

      const char* to_string(probe_state s);

      struct discovered_endpoint
      {
        asio::ip::address_v4 address;
        uint16_t port{0};

        std::string to_string() const { return address.to_string() + ":" + std::to_string(port); }
      };

      struct discovery_result
      {
        probe_state state{probe_state::idle};
        discovered_endpoint endpoint;

        bool ok() const { return state == probe_state::verified; }
      };

      class client
      {
      public:
        // Opens a broadcast-capable socket on an ephemeral port. Throws
        // std::system_error on socket failure and config_error on a bad target.
        explicit client(config::discovery_config config);
        ~client();

        client(const client&) = delete;
        client& operator=(const client&) = delete;

        // One probe with a fresh nonce; no retry. A timeout is reported in the
        // result, not thrown. Throws std::system_error if the probe cannot be sent.
        discovery_result discover();
        discovery_result discover(const protocol::device_id& device, uint32_t nonce);

        // Re-invokes discover() up to `attempts` times, stopping at the first success.
        discovery_result discover_with_retries(int attempts);

        const protocol::device_id& device() const { return device_; }
        uint16_t local_port() const;

      private:
        struct pending_probe
        {
          std::promise<discovered_endpoint> promise;
        };

        void start_receive_();
        void handle_response_(std::size_t size, const asio::ip::udp::endpoint& from);

        config::discovery_config config_;
        protocol::device_id device_{};

        asio::io_context io_;
        asio::ip::udp::socket socket_;
        asio::ip::udp::endpoint target_;
        std::array<uint8_t, 2048> recv_buffer_{};
        asio::ip::udp::endpoint sender_endpoint_;
        std::thread io_thread_;

        std::mutex send_mutex_;
        std::mutex pending_mutex_;
        // key: the echoed request prefix
        std::unordered_map<std::string, std::shared_ptr<pending_probe>> pending_;
      };

    } // namespace discovery
  } // namespace net
} // namespace beacon
