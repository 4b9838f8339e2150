#ifndef BACGATE_ADDRESS_HPP
#define BACGATE_ADDRESS_HPP
/**
 * @file address.hpp
 * @brief B/IP network address: IPv4 host + UDP port.
 *
 * @details
 * This is the "where" of every BACnet/IP peer. It is what the datalink hands up
 * with each received frame, what the registry stores per device instance, and
 * what read_property() unicasts to.
 *
 * Both fields are kept in host byte order. The 6-byte wire form used inside
 * Forwarded-NPDU headers (4 bytes IP, 2 bytes port, both big-endian) is
 * available via to_bip_bytes()/from_bip_bytes().
 */

#include <stdint.h>
#include <stddef.h>
#include <string>

namespace bacgate {

/// Default BACnet/IP UDP port (0xBAC0).
static constexpr uint16_t BACNET_IP_PORT = 47808;

struct BipAddress {
  uint32_t ip{0};     ///< IPv4 address, host byte order (10.0.0.5 -> 0x0A000005)
  uint16_t port{0};   ///< UDP port, host byte order

  bool operator==(const BipAddress& o) const { return ip == o.ip && port == o.port; }
  bool operator!=(const BipAddress& o) const { return !(*this == o); }
  bool operator<(const BipAddress& o) const {
    return ip != o.ip ? ip < o.ip : port < o.port;
  }

  /// "a.b.c.d:port"
  std::string to_string() const;

  /// Write the 6-byte B/IP form into @p out (caller provides 6 bytes).
  void to_bip_bytes(uint8_t* out) const;

  /// Read the 6-byte B/IP form. @p in must hold at least 6 bytes.
  static BipAddress from_bip_bytes(const uint8_t* in);
};

/**
 * @brief Parse "a.b.c.d:port" or "a.b.c.d" (port falls back to @p default_port).
 * @return false on any malformed component; @p out is untouched then.
 */
bool parse_address(const std::string& text, BipAddress& out,
                   uint16_t default_port = BACNET_IP_PORT);

} // namespace bacgate

#endif // BACGATE_ADDRESS_HPP
