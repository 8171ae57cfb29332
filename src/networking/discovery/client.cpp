#include "networking/discovery/client.h"

#include "protocol/probe_validator.h"
#include "utils/date/date.h"
#include "utils/random_id/random_id.h"

#include <iostream>
#include <stdexcept>
#include <system_error>

namespace beacon
{
  namespace net
  {
    namespace discovery
    {
      namespace
      {
        std::string key_of(const protocol::bytes& prefix)
        {
          return std::string(prefix.begin(), prefix.end());
        }
      } // namespace

      const char* to_string(probe_state s)
      {
        switch (s)
        {
        case probe_state::idle:
          return "idle";
        case probe_state::broadcasting:
          return "broadcasting";
        case probe_state::waiting_response:
          return "waiting_response";
        case probe_state::timed_out:
          return "timed_out";
        case probe_state::verified:
          return "verified";
        }
        return "idle";
      }

      client::client(config::discovery_config config) : config_(std::move(config)), io_(), socket_(io_)
      {
        const std::string id = config_.device_id.empty() ? utils::get_random_id(protocol::kDeviceIdSize)
                                                         : config_.device_id;
        if (!protocol::device_id_from_string(id, device_))
        {
          throw config::config_error("device id is longer than 16 bytes");
        }

        asio::error_code ec;
        const auto target_address = asio::ip::make_address_v4(config_.target, ec);
        if (ec)
        {
          throw config::config_error("target is not an IPv4 address: " + config_.target);
        }
        target_ = asio::ip::udp::endpoint(target_address, config_.port);

        socket_.open(asio::ip::udp::v4(), ec);
        if (ec)
        {
          throw std::system_error(ec, "open discovery client socket");
        }
        socket_.set_option(asio::socket_base::broadcast(true), ec);
        if (ec)
        {
          throw std::system_error(ec, "enable broadcast");
        }
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0), ec);
        if (ec)
        {
          throw std::system_error(ec, "bind discovery client socket");
        }

        start_receive_();
        io_thread_ = std::thread([this] { io_.run(); });
      }

      client::~client()
      {
        asio::post(io_,
                   [this]
                   {
                     asio::error_code ec;
                     socket_.close(ec);
                   });
        if (io_thread_.joinable())
        {
          io_thread_.join();
        }
      }

      uint16_t client::local_port() const
      {
        asio::error_code ec;
        auto ep = socket_.local_endpoint(ec);
        return ec ? 0 : ep.port();
      }

      discovery_result client::discover()
      {
        return discover(device_, utils::random_u32());
      }

      discovery_result client::discover(const protocol::device_id& device, uint32_t nonce)
      {
        protocol::discovery_request request;
        request.device = device;
        request.nonce = nonce;
        request.timestamp = utils::date::now_seconds();
        const protocol::bytes packet = protocol::sign_request(request, config_.variant, config_.secret);
        const std::string key = key_of(protocol::echo_prefix(request, config_.variant));

        auto probe = std::make_shared<pending_probe>();
        auto answer = probe->promise.get_future();
        {
          std::lock_guard<std::mutex> lock(pending_mutex_);
          pending_[key] = probe;
        }

        std::cerr << "[beacon][client] " << to_string(probe_state::broadcasting) << " to=" << target_
                  << " nonce=" << nonce << std::endl;
        asio::error_code ec;
        {
          std::lock_guard<std::mutex> lock(send_mutex_);
          socket_.send_to(asio::buffer(packet), target_, 0, ec);
        }
        if (ec)
        {
          std::lock_guard<std::mutex> lock(pending_mutex_);
          pending_.erase(key);
          throw std::system_error(ec, "send discovery probe");
        }

        discovery_result result;
        result.state = probe_state::waiting_response;
        if (answer.wait_for(config_.timeout) != std::future_status::ready)
        {
          {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(key);
            if (it != pending_.end() && it->second == probe)
            {
              pending_.erase(it);
            }
          }
          // The answer may have landed between the wait and the erase.
          if (answer.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
          {
            std::cerr << "[beacon][client] " << to_string(probe_state::timed_out) << " nonce=" << nonce
                      << " after " << config_.timeout.count() << "ms" << std::endl;
            result.state = probe_state::timed_out;
            return result;
          }
        }

        result.endpoint = answer.get();
        result.state = probe_state::verified;
        std::cerr << "[beacon][client] " << to_string(result.state) << " nonce=" << nonce
                  << " endpoint=" << result.endpoint.to_string() << std::endl;
        return result;
      }

      discovery_result client::discover_with_retries(int attempts)
      {
        discovery_result result;
        for (int i = 0; i < attempts; ++i)
        {
          result = discover();
          if (result.ok())
          {
            break;
          }
        }
        return result;
      }

      void client::start_receive_()
      {
        socket_.async_receive_from(asio::buffer(recv_buffer_), sender_endpoint_,
                                   [this](const asio::error_code& ec, std::size_t bytes_recvd)
                                   {
                                     if (ec)
                                     {
                                       if (ec != asio::error::operation_aborted)
                                       {
                                         std::cerr << "[beacon][client] socket error: " << ec.message()
                                                   << std::endl;
                                       }
                                       return;
                                     }
                                     handle_response_(bytes_recvd, sender_endpoint_);
                                     start_receive_();
                                   });
      }

      void client::handle_response_(std::size_t size, const asio::ip::udp::endpoint& from)
      {
        protocol::discovery_response response;
        if (!protocol::decode_response(recv_buffer_.data(), size, config_.variant, response))
        {
          std::cerr << "[beacon][client] ignore reason=format from=" << from << " size=" << size << std::endl;
          return;
        }
        const std::string key = key_of(protocol::echo_prefix(response, config_.variant));
        {
          std::lock_guard<std::mutex> lock(pending_mutex_);
          if (pending_.find(key) == pending_.end())
          {
            std::cerr << "[beacon][client] ignore reason=unknown_probe from=" << from << std::endl;
            return;
          }
        }
        bool authentic = false;
        try
        {
          authentic = protocol::verify_response(response, config_.variant, config_.secret);
        }
        catch (const std::runtime_error& e)
        {
          std::cerr << "[beacon][client] ignore reason=digest from=" << from << " error=" << e.what() << std::endl;
          return;
        }
        if (!authentic)
        {
          // Keep waiting; a genuine responder may still answer.
          std::cerr << "[beacon][client] ignore reason=authentication from=" << from << std::endl;
          return;
        }

        std::shared_ptr<pending_probe> probe;
        {
          std::lock_guard<std::mutex> lock(pending_mutex_);
          auto it = pending_.find(key);
          if (it == pending_.end())
          {
            return;
          }
          probe = it->second;
          pending_.erase(it);
        }
        discovered_endpoint endpoint;
        endpoint.address = asio::ip::address_v4(response.server_ip);
        endpoint.port = response.ws_port;
        probe->promise.set_value(endpoint);
      }

    } // namespace discovery
  } // namespace net
} // namespace beacon
