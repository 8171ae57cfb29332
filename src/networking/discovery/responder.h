// responder: answers authenticated discovery probes with the address and
// service port of this host.
//
// Lifecycle: construction binds the UDP socket (idle -> bound), start()
// resolves the advertised address and begins receiving on a background I/O
// thread (listening). Each datagram moves through validating and, when
// accepted, responding before returning to listening. stop() closes the
// socket; the pending receive completes with operation_aborted and the loop
// ends in stopped. A socket error also ends in stopped.
//
// Rejected probes never produce a reply on the network. They are reported via
// the log and on_outcome only.

#pragma once

#include "config/discovery_config.h"
#include "protocol/probe_validator.h"
#include "protocol/replay_guard.h"
#include "utils/event_emitter/event_emitter.h"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace beacon
{
  namespace net
  {
    namespace discovery
    {

      enum class responder_state
      {
        idle,
        bound,
        listening,
        validating,
        responding,
        stopped
      };

      const char* to_string(responder_state s);

      struct probe_outcome
      {
        protocol::probe_verdict verdict{protocol::probe_verdict::format_error};
        std::string from_address;
        uint16_t from_port{0};
        bool responded{false};
      };

      class responder
      {
      public:
        // Returns the address to advertise; throws no_interface_error when none is usable.
        using address_provider = std::function<asio::ip::address_v4()>;

        // Binds the discovery port. Throws std::system_error on failure.
        explicit responder(config::discovery_config config);
        responder(config::discovery_config config, address_provider provider);
        ~responder();

        responder(const responder&) = delete;
        responder& operator=(const responder&) = delete;

        // Throws no_interface_error if no address can be advertised.
        void start();
        // Thread-safe and non-blocking; safe to call from a signal handler thread.
        void stop();
        // Blocks until the receive loop has ended.
        void wait();

        uint16_t local_port() const;
        responder_state state() const { return state_.load(); }
        // True when the loop ended because of a socket error rather than stop().
        bool failed() const { return failed_.load(); }

        utils::event_emitter<probe_outcome> on_outcome;

      private:
        void start_receive_();
        void handle_datagram_(std::size_t size);
        void finish_(const probe_outcome& outcome);

        config::discovery_config config_;
        protocol::probe_validator validator_;
        address_provider address_provider_;
        std::unique_ptr<protocol::seen_nonce_cache> nonce_cache_;

        asio::io_context io_;
        asio::ip::udp::socket socket_;
        std::array<uint8_t, 2048> recv_buffer_{};
        asio::ip::udp::endpoint sender_endpoint_;

        std::atomic<responder_state> state_{responder_state::idle};
        std::atomic<bool> failed_{false};
        std::atomic<bool> started_{false};
        std::thread io_thread_;
      };

    } // namespace discovery
  } // namespace net
} // namespace beacon
