#pragma once
/**
 * @file transport_bip.hpp
 * @brief BACnet/IP datalink: one UDP socket plus the Annex J BVLC header.
 *
 * BVLC layout: [0x81][function][length hi][length lo] where length covers the
 * whole datagram including these 4 octets. Functions handled:
 *
 *   0x0A Original-Unicast-NPDU    [hdr][NPDU]
 *   0x0B Original-Broadcast-NPDU  [hdr][NPDU]
 *   0x04 Forwarded-NPDU           [hdr][orig ip(4) port(2)][NPDU]
 *
 * For Forwarded-NPDU the originating address in the header replaces the UDP
 * source (the BBMD is only the messenger). Everything else is Foreign.
 *
 * Linux/POSIX only (sockets, poll, pipe).
 */

#include <mutex>
#include "bacgate/transport/transport_base.hpp"

namespace bacgate::transport {

enum : uint8_t {
  BVLC_TYPE_BIP              = 0x81,
  BVLC_FORWARDED_NPDU        = 0x04,
  BVLC_ORIGINAL_UNICAST      = 0x0A,
  BVLC_ORIGINAL_BROADCAST    = 0x0B
};

static constexpr size_t BVLC_HEADER_LEN = 4;
static constexpr size_t BIP_MAX_NPDU    = 1497;   // 1476 APDU + worst-case NPDU header

/// [0x81][function][len16][npdu]
std::vector<uint8_t> bvlc_wrap(uint8_t function, const std::vector<uint8_t>& npdu);

/**
 * @brief Strip the BVLC header from one datagram.
 * @param udp_source  sender as seen by recvfrom().
 * @return None with @p out filled, Foreign for anything else (wrong type octet,
 *         unhandled function, length field not matching the datagram).
 */
TransportError bvlc_unwrap(const uint8_t* data, size_t len, const BipAddress& udp_source, Frame& out);

struct BipConfig {
  BipAddress bind{0, BACNET_IP_PORT};                  // 0.0.0.0:47808
  BipAddress broadcast{0xFFFFFFFFu, BACNET_IP_PORT};   // 255.255.255.255:47808
};

class BipDatalink : public IDatalink {
public:
  BipDatalink() = default;
  ~BipDatalink() override { end(); }

  BipDatalink(const BipDatalink&) = delete;
  BipDatalink& operator=(const BipDatalink&) = delete;

  /// Create, configure and bind the socket. Bind failure is fatal to the caller.
  TransportError begin(const BipConfig& cfg);
  void end();
  bool is_open() const { return fd_ >= 0; }

  /// Address actually bound (port filled in when 0 was requested).
  BipAddress local_address() const { return local_; }

  TransportError send_broadcast(const std::vector<uint8_t>& npdu) override;
  TransportError send_unicast(const std::vector<uint8_t>& npdu, const BipAddress& dest) override;
  TransportError receive_frame(Frame& out, std::chrono::milliseconds timeout) override;
  void           interrupt() override;
  const char*    name() const override { return "bip"; }

private:
  TransportError send_datagram(const std::vector<uint8_t>& datagram, const BipAddress& dest);

  int fd_{-1};
  int wake_[2]{-1, -1};       // self-pipe: interrupt() writes, receive_frame() polls
  BipConfig  cfg_;
  BipAddress local_;
  std::mutex send_mu_;
};

} // namespace bacgate::transport
