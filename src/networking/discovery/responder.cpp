#include "networking/discovery/responder.h"

#include "networking/network_info/network_info.h"
#include "utils/date/date.h"

#include <iostream>
#include <system_error>

namespace beacon
{
  namespace net
  {
    namespace discovery
    {

      const char* to_string(responder_state s)
      {
        switch (s)
        {
        case responder_state::idle:
          return "idle";
        case responder_state::bound:
          return "bound";
        case responder_state::listening:
          return "listening";
        case responder_state::validating:
          return "validating";
        case responder_state::responding:
          return "responding";
        case responder_state::stopped:
          return "stopped";
        }
        return "idle";
      }

      responder::responder(config::discovery_config config)
          : responder(config,
                      [strategy = config.strategy, preferred = config.preferred_interface]()
                      { return local_ipv4(strategy, preferred); })
      {
      }

      responder::responder(config::discovery_config config, address_provider provider)
          : config_(std::move(config)), validator_(config_), address_provider_(std::move(provider)), io_(),
            socket_(io_)
      {
        if (config_.replay_cache)
        {
          nonce_cache_.reset(new protocol::seen_nonce_cache(config_.window_seconds));
        }

        asio::ip::udp::endpoint listen_ep(asio::ip::udp::v4(), config_.port);
        asio::error_code ec;
        socket_.open(listen_ep.protocol(), ec);
        if (ec)
        {
          throw std::system_error(ec, "open discovery socket");
        }
        socket_.set_option(asio::socket_base::reuse_address(true), ec);
        socket_.set_option(asio::socket_base::broadcast(true), ec);
        socket_.bind(listen_ep, ec);
        if (ec)
        {
          throw std::system_error(ec, "bind UDP/" + std::to_string(config_.port));
        }
        state_ = responder_state::bound;
      }

      responder::~responder()
      {
        stop();
        wait();
      }

      void responder::start()
      {
        if (started_.load())
        {
          return;
        }
        // Fails fast when there is nothing to advertise.
        const auto advertised = address_provider_();
        started_ = true;

        std::cerr << "[beacon][responder] listening on UDP/" << local_port() << " ws_port=" << config_.ws_port
                  << " variant=" << protocol::to_string(config_.variant) << " address=" << advertised.to_string()
                  << (nonce_cache_ ? " replay_cache=on" : "") << std::endl;

        state_ = responder_state::listening;
        start_receive_();
        io_thread_ = std::thread([this] { io_.run(); });
      }

      void responder::stop()
      {
        if (!started_.load())
        {
          asio::error_code ec;
          socket_.close(ec);
          state_ = responder_state::stopped;
          return;
        }
        asio::post(io_,
                   [this]
                   {
                     asio::error_code ec;
                     socket_.close(ec);
                   });
      }

      void responder::wait()
      {
        if (io_thread_.joinable())
        {
          io_thread_.join();
        }
        asio::error_code ec;
        socket_.close(ec);
        if (started_.load())
        {
          state_ = responder_state::stopped;
        }
      }

      uint16_t responder::local_port() const
      {
        asio::error_code ec;
        auto ep = socket_.local_endpoint(ec);
        return ec ? 0 : ep.port();
      }

      void responder::start_receive_()
      {
        socket_.async_receive_from(asio::buffer(recv_buffer_), sender_endpoint_,
                                   [this](const asio::error_code& ec, std::size_t bytes_recvd)
                                   {
                                     if (ec)
                                     {
                                       if (ec != asio::error::operation_aborted)
                                       {
                                         std::cerr << "[beacon][responder] socket error: " << ec.message()
                                                   << std::endl;
                                         failed_ = true;
                                       }
                                       state_ = responder_state::stopped;
                                       return;
                                     }
                                     handle_datagram_(bytes_recvd);
                                     start_receive_();
                                   });
      }

      void responder::handle_datagram_(std::size_t size)
      {
        state_ = responder_state::validating;
        const asio::ip::udp::endpoint from = sender_endpoint_;

        protocol::discovery_request request;
        protocol::probe_verdict verdict;
        try
        {
          verdict = validator_.validate(recv_buffer_.data(), size, utils::date::now_seconds(), request);
        }
        catch (const std::runtime_error& e)
        {
          // A digest failure cannot vouch for the probe.
          std::cerr << "[beacon][responder] digest error: " << e.what() << std::endl;
          verdict = protocol::probe_verdict::authentication_failure;
        }
        if (verdict == protocol::probe_verdict::accepted && nonce_cache_ &&
            !nonce_cache_->insert(request, utils::date::now_seconds()))
        {
          verdict = protocol::probe_verdict::replayed;
        }

        probe_outcome outcome;
        outcome.verdict = verdict;
        outcome.from_address = from.address().to_string();
        outcome.from_port = from.port();

        if (verdict != protocol::probe_verdict::accepted)
        {
          std::cerr << "[beacon][responder] reject reason=" << protocol::to_string(verdict)
                    << " from=" << outcome.from_address << ":" << outcome.from_port << " size=" << size << std::endl;
          finish_(outcome);
          return;
        }

        state_ = responder_state::responding;
        asio::ip::address_v4 advertised;
        protocol::bytes reply;
        try
        {
          advertised = address_provider_();
          reply = validator_.build_response(request, advertised.to_bytes());
        }
        catch (const std::runtime_error& e)
        {
          // no_interface_error, std::system_error from the interface scan, or a digest failure
          std::cerr << "[beacon][responder] drop from=" << outcome.from_address << ":" << outcome.from_port
                    << " error=" << e.what() << std::endl;
          finish_(outcome);
          return;
        }

        asio::error_code ec;
        // Unicast back to the observed sender, never a second broadcast.
        socket_.send_to(asio::buffer(reply), from, 0, ec);
        if (ec)
        {
          std::cerr << "[beacon][responder] send to " << outcome.from_address << ":" << outcome.from_port
                    << " failed: " << ec.message() << std::endl;
        }
        else
        {
          outcome.responded = true;
          std::cerr << "[beacon][responder] respond to=" << outcome.from_address << ":" << outcome.from_port
                    << " address=" << advertised.to_string() << " ws_port=" << config_.ws_port << std::endl;
        }
        finish_(outcome);
      }

      void responder::finish_(const probe_outcome& outcome)
      {
        state_ = responder_state::listening;
        on_outcome.emit(outcome);
      }

    } // namespace discovery
  } // namespace net
} // namespace beacon
