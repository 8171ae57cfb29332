#include "protocol/packet_codec.h"

#include <algorithm>
#include <cstring>

namespace beacon
{
  namespace protocol
  {
    namespace
    {
      void put_u16(bytes& out, uint16_t v)
      {
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v));
      }

      void put_u32(bytes& out, uint32_t v)
      {
        for (int shift = 24; shift >= 0; shift -= 8)
        {
          out.push_back(static_cast<uint8_t>(v >> shift));
        }
      }

      void put_u64(bytes& out, uint64_t v)
      {
        for (int shift = 56; shift >= 0; shift -= 8)
        {
          out.push_back(static_cast<uint8_t>(v >> shift));
        }
      }

      template <std::size_t N> void put_array(bytes& out, const std::array<uint8_t, N>& a)
      {
        out.insert(out.end(), a.begin(), a.end());
      }

      // Sequential big-endian reader over a frame whose size was checked up front.
      class frame_reader
      {
      public:
        explicit frame_reader(const uint8_t* data) : p_(data) {}

        uint16_t u16()
        {
          uint16_t v = static_cast<uint16_t>((p_[0] << 8) | p_[1]);
          p_ += 2;
          return v;
        }

        uint32_t u32()
        {
          uint32_t v = 0;
          for (int i = 0; i < 4; ++i)
          {
            v = (v << 8) | p_[i];
          }
          p_ += 4;
          return v;
        }

        uint64_t u64()
        {
          uint64_t v = 0;
          for (int i = 0; i < 8; ++i)
          {
            v = (v << 8) | p_[i];
          }
          p_ += 8;
          return v;
        }

        template <std::size_t N> void copy(std::array<uint8_t, N>& out)
        {
          std::memcpy(out.data(), p_, N);
          p_ += N;
        }

      private:
        const uint8_t* p_;
      };

      void put_header(bytes& out, const device_id& device, uint32_t nonce, uint64_t timestamp)
      {
        put_array(out, device);
        put_u32(out, nonce);
        put_u64(out, timestamp);
      }
    } // namespace

    const char* to_string(variant v)
    {
      switch (v)
      {
      case variant::a:
        return "a";
      case variant::b:
        return "b";
      }
      return "a";
    }

    bool variant_from_string(const std::string& s, variant& out)
    {
      if (s == "a" || s == "A")
      {
        out = variant::a;
        return true;
      }
      if (s == "b" || s == "B")
      {
        out = variant::b;
        return true;
      }
      return false;
    }

    std::size_t request_size(variant v)
    {
      return v == variant::a ? kRequestSizeA : kRequestSizeB;
    }

    std::size_t response_size(variant v)
    {
      return v == variant::a ? kResponseSizeA : kResponseSizeB;
    }

    std::size_t echo_size(variant v)
    {
      return v == variant::a ? kRequestSizeA : kProbeHeaderSize + kMacEchoSize;
    }

    bool operator==(const discovery_request& lhs, const discovery_request& rhs)
    {
      return lhs.device == rhs.device && lhs.nonce == rhs.nonce && lhs.timestamp == rhs.timestamp &&
             lhs.hmac == rhs.hmac;
    }

    bool operator!=(const discovery_request& lhs, const discovery_request& rhs)
    {
      return !(lhs == rhs);
    }

    bool operator==(const discovery_response& lhs, const discovery_response& rhs)
    {
      return lhs.device == rhs.device && lhs.nonce == rhs.nonce && lhs.timestamp == rhs.timestamp &&
             lhs.mac_echo == rhs.mac_echo && lhs.server_ip == rhs.server_ip && lhs.ws_port == rhs.ws_port &&
             lhs.hmac == rhs.hmac;
    }

    bool operator!=(const discovery_response& lhs, const discovery_response& rhs)
    {
      return !(lhs == rhs);
    }

    bytes encode_request(const discovery_request& request, variant v)
    {
      bytes out;
      out.reserve(request_size(v));
      put_header(out, request.device, request.nonce, request.timestamp);
      if (v == variant::b)
      {
        put_array(out, request.hmac);
      }
      return out;
    }

    bool decode_request(const uint8_t* data, std::size_t size, variant v, discovery_request& out)
    {
      if (!data || size != request_size(v))
      {
        return false;
      }
      discovery_request r;
      frame_reader in(data);
      in.copy(r.device);
      r.nonce = in.u32();
      r.timestamp = in.u64();
      if (v == variant::b)
      {
        in.copy(r.hmac);
      }
      out = r;
      return true;
    }

    bool decode_request(const bytes& data, variant v, discovery_request& out)
    {
      return decode_request(data.data(), data.size(), v, out);
    }

    bytes encode_response(const discovery_response& response, variant v)
    {
      bytes out;
      out.reserve(response_size(v));
      put_header(out, response.device, response.nonce, response.timestamp);
      if (v == variant::a)
      {
        put_array(out, response.server_ip);
        put_u16(out, response.ws_port);
        put_array(out, response.hmac);
      }
      else
      {
        put_array(out, response.mac_echo);
        put_u16(out, response.ws_port);
        put_array(out, response.server_ip);
      }
      return out;
    }

    bool decode_response(const uint8_t* data, std::size_t size, variant v, discovery_response& out)
    {
      if (!data || size != response_size(v))
      {
        return false;
      }
      discovery_response r;
      frame_reader in(data);
      in.copy(r.device);
      r.nonce = in.u32();
      r.timestamp = in.u64();
      if (v == variant::a)
      {
        in.copy(r.server_ip);
        r.ws_port = in.u16();
        in.copy(r.hmac);
      }
      else
      {
        in.copy(r.mac_echo);
        r.ws_port = in.u16();
        in.copy(r.server_ip);
      }
      out = r;
      return true;
    }

    bool decode_response(const bytes& data, variant v, discovery_response& out)
    {
      return decode_response(data.data(), data.size(), v, out);
    }

    bytes request_signing_material(const discovery_request& request)
    {
      bytes out;
      out.reserve(kProbeHeaderSize);
      put_header(out, request.device, request.nonce, request.timestamp);
      return out;
    }

    bytes response_signing_material(const discovery_response& response)
    {
      bytes out;
      out.reserve(kProbeHeaderSize + kIpv4Size + kPortSize);
      put_header(out, response.device, response.nonce, response.timestamp);
      put_array(out, response.server_ip);
      put_u16(out, response.ws_port);
      return out;
    }

    bytes echo_prefix(const discovery_request& request, variant v)
    {
      bytes out = encode_request(request, v);
      out.resize(echo_size(v));
      return out;
    }

    bytes echo_prefix(const discovery_response& response, variant v)
    {
      bytes out = encode_response(response, v);
      out.resize(echo_size(v));
      return out;
    }

    discovery_response make_echo(const discovery_request& request)
    {
      discovery_response r;
      r.device = request.device;
      r.nonce = request.nonce;
      r.timestamp = request.timestamp;
      std::copy(request.hmac.begin(), request.hmac.begin() + kMacEchoSize, r.mac_echo.begin());
      return r;
    }

    bool device_id_from_string(const std::string& s, device_id& out)
    {
      if (s.size() > kDeviceIdSize)
      {
        return false;
      }
      device_id id{};
      std::copy(s.begin(), s.end(), id.begin());
      out = id;
      return true;
    }

  } // namespace protocol
} // namespace beacon
